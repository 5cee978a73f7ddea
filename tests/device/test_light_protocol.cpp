/*
 * test_light_protocol.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for the illumination controller packet encoding

**************************************************/

#include <gtest/gtest.h>

#include <string>

#include "device/light_protocol.hpp"
#include "device/serial_light.hpp"

using namespace lumen::device;

namespace {

auto payloadOf(const std::vector<uint8_t>& packet) -> std::string {
    return std::string(packet.begin() + 2, packet.end() - 1);
}

}  // namespace

// ============================================================================
// Packet Encoding Tests
// ============================================================================

TEST(LightProtocolTest, PacketFraming) {
    auto packet = encodeBrightnessPacket(100);
    ASSERT_EQ(packet.size(), 2u + 4u * 3u + 3u + 1u);
    EXPECT_EQ(packet.front(), kSTX);
    EXPECT_EQ(packet[1], static_cast<uint8_t>('A'));
    EXPECT_EQ(packet.back(), kETX);
}

TEST(LightProtocolTest, ZeroIsPadded) {
    EXPECT_EQ(payloadOf(encodeBrightnessPacket(0)), "000,000,000,000");
}

TEST(LightProtocolTest, SingleDigitIsPadded) {
    EXPECT_EQ(payloadOf(encodeBrightnessPacket(7)), "007,007,007,007");
}

TEST(LightProtocolTest, MaximumValue) {
    EXPECT_EQ(payloadOf(encodeBrightnessPacket(255)), "255,255,255,255");
}

TEST(LightProtocolTest, OutOfRangeValuesAreClamped) {
    EXPECT_EQ(encodeBrightnessPacket(300), encodeBrightnessPacket(255));
    EXPECT_EQ(encodeBrightnessPacket(-5), encodeBrightnessPacket(0));
}

TEST(LightProtocolTest, ClampBrightness) {
    static_assert(clampBrightness(-1) == 0);
    static_assert(clampBrightness(256) == 255);
    EXPECT_EQ(clampBrightness(128), 128);
}

// ============================================================================
// Serial Port Tests
// ============================================================================

TEST(SerialLightTest, MissingPortDoesNotOpen) {
    SerialLight light("/nonexistent/ttyLUMEN0", 9600);
    EXPECT_FALSE(light.open());
    EXPECT_FALSE(light.isOpen());
    EXPECT_EQ(light.port(), "/nonexistent/ttyLUMEN0");
    EXPECT_EQ(light.baudRate(), 9600);
}

TEST(SerialLightTest, SendOnClosedPortFails) {
    SerialLight light("/nonexistent/ttyLUMEN0", 9600);
    EXPECT_FALSE(light.send(encodeBrightnessPacket(10),
                            std::chrono::milliseconds(10)));
}
