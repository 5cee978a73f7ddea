/*
 * frame_writer.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Writes captured frames as PNG into the capture directory tree

**************************************************/

#ifndef LUMEN_CAPTURE_FRAME_WRITER_HPP
#define LUMEN_CAPTURE_FRAME_WRITER_HPP

#include <filesystem>
#include <string>

#include "device/frame.hpp"
#include "settings/settings.hpp"

namespace lumen::capture {

/**
 * @brief File naming and directory policy for captured frames
 *
 * Layout:
 *   <save_path>/<product>/<condition>/Light_<bbb>/
 *   <save_path>/cam<N>/<product>/<condition>/Light_<bbb>/   (designated N)
 * File:
 *   <product>_<condition>_Light_<bbb>_<shot:03>_Cam<id>.png
 */
class FrameWriter {
public:
    explicit FrameWriter(int designatedCamera = 3);

    [[nodiscard]] auto designatedCamera() const -> int;

    [[nodiscard]] auto directoryFor(const settings::Settings& settings,
                                    int cameraId, int brightness) const
        -> std::filesystem::path;

    [[nodiscard]] static auto fileNameFor(const settings::Settings& settings,
                                          int cameraId, int brightness)
        -> std::string;

    /**
     * @brief Create the directory if needed and encode the frame
     * @return Path of the written file
     * @throws StorageException on any filesystem or encoder failure, or when
     *         the target file already exists
     */
    auto write(const device::Frame& frame, const settings::Settings& settings,
               int brightness) const -> std::filesystem::path;

private:
    int designatedCamera_;
};

}  // namespace lumen::capture

#endif  // LUMEN_CAPTURE_FRAME_WRITER_HPP
