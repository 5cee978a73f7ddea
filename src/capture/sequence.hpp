/*
 * sequence.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Brightness sweep specification and run bookkeeping

**************************************************/

#ifndef LUMEN_CAPTURE_SEQUENCE_HPP
#define LUMEN_CAPTURE_SEQUENCE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capture_types.hpp"
#include "common/result.hpp"
#include "device/device_record.hpp"

namespace lumen::capture {

enum class SequenceDirection { Forward, Reverse };

/**
 * @enum SequenceState
 * @brief Lifecycle of a sweep run
 */
enum class SequenceState { Pending, Running, Completed, Cancelled, Failed };

[[nodiscard]] auto sequenceDirectionToString(SequenceDirection direction)
    -> std::string;
[[nodiscard]] auto sequenceDirectionFromString(const std::string& value)
    -> std::optional<SequenceDirection>;
[[nodiscard]] auto sequenceStateToString(SequenceState state) -> std::string;

[[nodiscard]] inline auto isTerminal(SequenceState state) -> bool {
    return state == SequenceState::Completed ||
           state == SequenceState::Cancelled || state == SequenceState::Failed;
}

/**
 * @brief Brightness sweep: start <= end, step > 0
 *
 * Forward visits start, start+step, ... up to end. Reverse visits end,
 * end-step, ... down to start.
 */
struct SequenceSpec {
    int start{0};
    int end{0};
    int step{1};
    SequenceDirection direction{SequenceDirection::Forward};

    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Brightness of every step, in execution order
     */
    [[nodiscard]] auto levels() const -> std::vector<int>;

    /**
     * @brief Step with the sign convention of the settings (negative =
     *        reverse) and the bounds in traversal order
     */
    [[nodiscard]] auto signedStart() const -> int;
    [[nodiscard]] auto signedEnd() const -> int;
    [[nodiscard]] auto signedStep() const -> int;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Build from a request
     *
     * A negative step without an explicit direction means a descending sweep
     * from start down to end; it is normalized to Reverse with the bounds
     * swapped. Invalid combinations are a ValidationError.
     */
    [[nodiscard]] static auto fromRequest(int start, int end, int step,
                                          std::optional<SequenceDirection>
                                              direction = std::nullopt)
        -> Result<SequenceSpec>;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> Result<SequenceSpec>;
};

struct SequenceStepResult {
    size_t index{0};
    int brightness{0};
    std::vector<device::LightOutcome> lights;
    CaptureResult capture;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Copy of a run's state at one instant
 */
struct SequenceRunSnapshot {
    uint64_t id{0};
    SequenceSpec spec;
    SequenceState state{SequenceState::Pending};
    size_t currentIndex{0};  ///< Steps finished so far
    size_t totalSteps{0};
    std::vector<SequenceStepResult> steps;
    std::optional<std::string> failureMessage;
    std::chrono::system_clock::time_point startedAt;
    std::optional<std::chrono::system_clock::time_point> finishedAt;

    [[nodiscard]] auto isActive() const -> bool { return !isTerminal(state); }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace lumen::capture

#endif  // LUMEN_CAPTURE_SEQUENCE_HPP
