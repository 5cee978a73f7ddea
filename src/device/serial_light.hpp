/*
 * serial_light.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Illumination controller attached to a POSIX serial port

**************************************************/

#ifndef LUMEN_DEVICE_SERIAL_LIGHT_HPP
#define LUMEN_DEVICE_SERIAL_LIGHT_HPP

#include <memory>
#include <string>

#include "light_adapter.hpp"

namespace lumen::device {

/**
 * @brief LightAdapter over termios, raw 8N1
 */
class SerialLight : public LightAdapter {
public:
    explicit SerialLight(std::string port, int baudRate = 9600);
    ~SerialLight() override;

    SerialLight(const SerialLight&) = delete;
    SerialLight& operator=(const SerialLight&) = delete;

    [[nodiscard]] auto port() const -> std::string override;

    auto open() -> bool override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    /**
     * @brief Non-blocking write bounded by poll()
     */
    auto send(const std::vector<uint8_t>& bytes,
              std::chrono::milliseconds timeout) -> bool override;

    [[nodiscard]] auto baudRate() const -> int;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_SERIAL_LIGHT_HPP
