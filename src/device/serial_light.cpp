/*
 * serial_light.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "serial_light.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace lumen::device {

namespace {

auto toSpeed(int baudRate) -> speed_t {
    switch (baudRate) {
        case 1200:
            return B1200;
        case 2400:
            return B2400;
        case 4800:
            return B4800;
        case 19200:
            return B19200;
        case 38400:
            return B38400;
        case 57600:
            return B57600;
        case 115200:
            return B115200;
        case 9600:
        default:
            return B9600;
    }
}

}  // namespace

class SerialLight::Impl {
public:
    Impl(std::string port, int baudRate)
        : port_(std::move(port)), baudRate_(baudRate) {}

    ~Impl() { closeLocked(); }

    auto open() -> bool {
        std::lock_guard lock(mutex_);
        if (fd_ >= 0) {
            return true;
        }

        int fd = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0) {
            spdlog::debug("Cannot open serial port {}: {}", port_,
                          std::strerror(errno));
            return false;
        }

        struct termios t{};
        if (tcgetattr(fd, &t) != 0) {
            spdlog::warn("tcgetattr failed on {}: {}", port_,
                         std::strerror(errno));
            ::close(fd);
            return false;
        }

        cfmakeraw(&t);
        cfsetispeed(&t, toSpeed(baudRate_));
        cfsetospeed(&t, toSpeed(baudRate_));
        t.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
        t.c_cflag |= CS8 | CLOCAL | CREAD;
        t.c_cc[VMIN] = 0;
        t.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &t) != 0) {
            spdlog::warn("tcsetattr failed on {}: {}", port_,
                         std::strerror(errno));
            ::close(fd);
            return false;
        }

        fd_ = fd;
        spdlog::info("Serial light {} opened at {} baud", port_, baudRate_);
        return true;
    }

    void close() {
        std::lock_guard lock(mutex_);
        closeLocked();
    }

    auto isOpen() const -> bool {
        std::lock_guard lock(mutex_);
        return fd_ >= 0;
    }

    auto send(const std::vector<uint8_t>& bytes,
              std::chrono::milliseconds timeout) -> bool {
        std::lock_guard lock(mutex_);
        if (fd_ < 0) {
            return false;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        size_t written = 0;
        while (written < bytes.size()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                spdlog::warn("Write to {} timed out after {} of {} bytes",
                             port_, written, bytes.size());
                return false;
            }

            struct pollfd pfd{fd_, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (pr < 0) {
                if (errno == EINTR) {
                    continue;
                }
                spdlog::warn("poll failed on {}: {}", port_,
                             std::strerror(errno));
                return false;
            }
            if (pr == 0) {
                continue;
            }
            if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
                spdlog::warn("Serial port {} reported an error", port_);
                return false;
            }

            ssize_t n = ::write(fd_, bytes.data() + written,
                                bytes.size() - written);
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) {
                    continue;
                }
                spdlog::warn("write failed on {}: {}", port_,
                             std::strerror(errno));
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    std::string port_;
    int baudRate_;

private:
    void closeLocked() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            spdlog::info("Serial light {} closed", port_);
        }
    }

    int fd_{-1};
    mutable std::mutex mutex_;
};

SerialLight::SerialLight(std::string port, int baudRate)
    : impl_(std::make_unique<Impl>(std::move(port), baudRate)) {}

SerialLight::~SerialLight() = default;

auto SerialLight::port() const -> std::string { return impl_->port_; }

auto SerialLight::open() -> bool { return impl_->open(); }

void SerialLight::close() { impl_->close(); }

auto SerialLight::isOpen() const -> bool { return impl_->isOpen(); }

auto SerialLight::send(const std::vector<uint8_t>& bytes,
                       std::chrono::milliseconds timeout) -> bool {
    return impl_->send(bytes, timeout);
}

auto SerialLight::baudRate() const -> int { return impl_->baudRate_; }

}  // namespace lumen::device
