/*
 * light_protocol.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Illumination controller command encoding

**************************************************/

#ifndef LUMEN_DEVICE_LIGHT_PROTOCOL_HPP
#define LUMEN_DEVICE_LIGHT_PROTOCOL_HPP

#include <cstdint>
#include <vector>

namespace lumen::device {

inline constexpr int kMinBrightness = 0;
inline constexpr int kMaxBrightness = 255;
inline constexpr int kLightChannels = 4;

inline constexpr uint8_t kSTX = 0x02;
inline constexpr uint8_t kETX = 0x03;
inline constexpr uint8_t kSetAllCommand = 'A';

[[nodiscard]] constexpr auto clampBrightness(int value) noexcept -> int {
    return value < kMinBrightness   ? kMinBrightness
           : value > kMaxBrightness ? kMaxBrightness
                                    : value;
}

/**
 * @brief Build the "set all channels" packet
 *
 * Layout: STX 'A' vvv ',' vvv ',' vvv ',' vvv ETX, where vvv is the clamped
 * value as three ASCII digits, repeated for every channel.
 */
[[nodiscard]] auto encodeBrightnessPacket(int value) -> std::vector<uint8_t>;

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_LIGHT_PROTOCOL_HPP
