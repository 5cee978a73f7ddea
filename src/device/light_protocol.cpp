/*
 * light_protocol.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "light_protocol.hpp"

#include <format>
#include <string>

namespace lumen::device {

auto encodeBrightnessPacket(int value) -> std::vector<uint8_t> {
    const std::string digits = std::format("{:03d}", clampBrightness(value));

    std::vector<uint8_t> packet;
    packet.reserve(2 + kLightChannels * 4);
    packet.push_back(kSTX);
    packet.push_back(kSetAllCommand);
    for (int channel = 0; channel < kLightChannels; ++channel) {
        if (channel > 0) {
            packet.push_back(',');
        }
        packet.insert(packet.end(), digits.begin(), digits.end());
    }
    packet.push_back(kETX);
    return packet;
}

}  // namespace lumen::device
