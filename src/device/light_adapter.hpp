/*
 * light_adapter.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Narrow interface over one illumination controller port

**************************************************/

#ifndef LUMEN_DEVICE_LIGHT_ADAPTER_HPP
#define LUMEN_DEVICE_LIGHT_ADAPTER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lumen::device {

class LightAdapter {
public:
    virtual ~LightAdapter() = default;

    [[nodiscard]] virtual auto port() const -> std::string = 0;

    virtual auto open() -> bool = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /**
     * @brief Write a complete command packet
     * @return false if the port rejected it or the write did not finish
     *         within the timeout
     */
    virtual auto send(const std::vector<uint8_t>& bytes,
                      std::chrono::milliseconds timeout) -> bool = 0;
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_LIGHT_ADAPTER_HPP
