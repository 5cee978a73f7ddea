/*
 * test_sequence.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for brightness sweep specifications

**************************************************/

#include <gtest/gtest.h>

#include <cstdint>

#include "capture/sequence.hpp"

using namespace lumen::capture;
using lumen::ErrorCode;

// ============================================================================
// Level Generation Tests
// ============================================================================

TEST(SequenceSpecTest, ForwardLevelsIncludeEnd) {
    SequenceSpec spec{30, 120, 10, SequenceDirection::Forward};
    auto levels = spec.levels();
    ASSERT_EQ(levels.size(), 10u);
    EXPECT_EQ(levels.front(), 30);
    EXPECT_EQ(levels.back(), 120);
}

TEST(SequenceSpecTest, ForwardLevelsStopBeforeOvershoot) {
    SequenceSpec spec{0, 25, 10, SequenceDirection::Forward};
    EXPECT_EQ(spec.levels(), (std::vector<int>{0, 10, 20}));
}

TEST(SequenceSpecTest, ReverseLevelsRunDownFromEnd) {
    SequenceSpec spec{30, 60, 10, SequenceDirection::Reverse};
    EXPECT_EQ(spec.levels(), (std::vector<int>{60, 50, 40, 30}));
}

TEST(SequenceSpecTest, SingleLevel) {
    SequenceSpec spec{255, 255, 5, SequenceDirection::Forward};
    EXPECT_EQ(spec.levels(), (std::vector<int>{255}));
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(SequenceSpecTest, Validation) {
    EXPECT_TRUE((SequenceSpec{0, 255, 1, SequenceDirection::Forward})
                    .validate()
                    .has_value());
    EXPECT_FALSE((SequenceSpec{10, 5, 1, SequenceDirection::Forward})
                     .validate()
                     .has_value());
    EXPECT_FALSE((SequenceSpec{0, 256, 1, SequenceDirection::Forward})
                     .validate()
                     .has_value());
    EXPECT_FALSE((SequenceSpec{-1, 10, 1, SequenceDirection::Forward})
                     .validate()
                     .has_value());
    EXPECT_FALSE((SequenceSpec{0, 10, 0, SequenceDirection::Forward})
                     .validate()
                     .has_value());
}

TEST(SequenceSpecTest, NegativeStepBecomesReverse) {
    auto spec = SequenceSpec::fromRequest(120, 30, -10, std::nullopt);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->direction, SequenceDirection::Reverse);
    EXPECT_EQ(spec->start, 30);
    EXPECT_EQ(spec->end, 120);
    EXPECT_EQ(spec->step, 10);
    EXPECT_EQ(spec->levels().front(), 120);
    EXPECT_EQ(spec->levels().back(), 30);

    EXPECT_EQ(spec->signedStart(), 120);
    EXPECT_EQ(spec->signedEnd(), 30);
    EXPECT_EQ(spec->signedStep(), -10);
}

TEST(SequenceSpecTest, NegativeStepWithForwardIsRejected) {
    auto spec = SequenceSpec::fromRequest(120, 30, -10,
                                          SequenceDirection::Forward);
    ASSERT_FALSE(spec.has_value());
    EXPECT_EQ(spec.error().code, ErrorCode::ValidationError);
}

TEST(SequenceSpecTest, ZeroStepIsRejected) {
    EXPECT_FALSE(SequenceSpec::fromRequest(0, 10, 0, std::nullopt).has_value());
}

TEST(SequenceSpecTest, ExplicitReverseWithPositiveStep) {
    auto spec = SequenceSpec::fromRequest(10, 40, 15,
                                          SequenceDirection::Reverse);
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->levels(), (std::vector<int>{40, 25, 10}));
}

// ============================================================================
// JSON Tests
// ============================================================================

TEST(SequenceSpecTest, FromJson) {
    auto spec = SequenceSpec::fromJson(
        {{"start", 0}, {"end", 20}, {"step", 10}, {"direction", "reverse"}});
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->levels(), (std::vector<int>{20, 10, 0}));

    auto j = spec->toJson();
    EXPECT_EQ(j["direction"], "reverse");
    EXPECT_EQ(j["levels"].size(), 3u);
}

TEST(SequenceSpecTest, FromJsonRejectsMissingOrMistypedFields) {
    EXPECT_FALSE(SequenceSpec::fromJson({{"start", 0}, {"end", 20}})
                     .has_value());
    EXPECT_FALSE(
        SequenceSpec::fromJson({{"start", "0"}, {"end", 20}, {"step", 1}})
            .has_value());
    EXPECT_FALSE(SequenceSpec::fromJson({{"start", 0},
                                         {"end", 20},
                                         {"step", 1},
                                         {"direction", "sideways"}})
                     .has_value());
    EXPECT_FALSE(SequenceSpec::fromJson(nlohmann::json::array()).has_value());
}

TEST(SequenceSpecTest, FromJsonRejectsBoundsBeyondIntRange) {
    auto wide = SequenceSpec::fromJson(
        nlohmann::json::parse(R"({"start":30,"end":4294967416,"step":10})"));
    ASSERT_FALSE(wide.has_value());
    EXPECT_EQ(wide.error().code, lumen::ErrorCode::ValidationError);
    EXPECT_NE(wide.error().message.find("end"), std::string::npos);

    EXPECT_FALSE(SequenceSpec::fromJson({{"start", std::int64_t{-4294967286}},
                                         {"end", 20},
                                         {"step", 10}})
                     .has_value());
}

TEST(SequenceStateTest, Terminal) {
    EXPECT_FALSE(isTerminal(SequenceState::Pending));
    EXPECT_FALSE(isTerminal(SequenceState::Running));
    EXPECT_TRUE(isTerminal(SequenceState::Completed));
    EXPECT_TRUE(isTerminal(SequenceState::Cancelled));
    EXPECT_TRUE(isTerminal(SequenceState::Failed));
    EXPECT_EQ(sequenceStateToString(SequenceState::Cancelled), "cancelled");
}
