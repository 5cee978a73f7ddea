/*
 * frame_writer.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "frame_writer.hpp"

#include <format>
#include <fstream>
#include <system_error>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace lumen::capture {

namespace fs = std::filesystem;

namespace {

auto lightLabel(int brightness) -> std::string {
    return std::format("Light_{:03d}", brightness);
}

}  // namespace

FrameWriter::FrameWriter(int designatedCamera)
    : designatedCamera_(designatedCamera) {}

auto FrameWriter::designatedCamera() const -> int { return designatedCamera_; }

auto FrameWriter::directoryFor(const settings::Settings& settings,
                               int cameraId, int brightness) const
    -> fs::path {
    fs::path base(settings.savePath);
    if (cameraId == designatedCamera_) {
        base /= std::format("cam{}", designatedCamera_);
    }
    return base / settings.product / settings.condition /
           lightLabel(brightness);
}

auto FrameWriter::fileNameFor(const settings::Settings& settings,
                              int cameraId, int brightness) -> std::string {
    return std::format("{}_{}_{}_{:03d}_Cam{}.png", settings.product,
                       settings.condition, lightLabel(brightness),
                       settings.shotNumber, cameraId);
}

auto FrameWriter::write(const device::Frame& frame,
                        const settings::Settings& settings,
                        int brightness) const -> fs::path {
    auto dir = directoryFor(settings, frame.cameraId, brightness);
    auto path = dir / fileNameFor(settings, frame.cameraId, brightness);

    if (!frame.isValid()) {
        throw StorageException("Frame buffer does not match its dimensions",
                               path.string());
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageException(
            "Cannot create directory: " + ec.message(), dir.string());
    }

    // Wraps the buffer without copying
    cv::Mat image(frame.height, frame.width, CV_8UC(frame.channels),
                  const_cast<uint8_t*>(frame.data.data()));

    std::vector<uchar> encoded;
    try {
        if (!cv::imencode(".png", image, encoded)) {
            throw StorageException("Image encoder rejected the frame",
                                   path.string());
        }
    } catch (const cv::Exception& e) {
        throw StorageException(std::string("Image encoder failed: ") + e.what(),
                               path.string());
    }

    // An existing file belongs to another capture and is never replaced
    std::ofstream out(path, std::ios::binary | std::ios::noreplace);
    if (!out) {
        throw StorageException(fs::exists(path) ? "File already exists"
                                                : "Cannot open file for writing",
                               path.string());
    }
    out.write(reinterpret_cast<const char*>(encoded.data()),
              static_cast<std::streamsize>(encoded.size()));
    out.close();
    if (!out) {
        throw StorageException("Short write", path.string());
    }

    spdlog::debug("Saved {}", path.string());
    return path;
}

}  // namespace lumen::capture
