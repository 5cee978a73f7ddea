/*
 * sequence.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "sequence.hpp"

#include <array>
#include <cstdlib>
#include <utility>

#include "common/json_fields.hpp"
#include "device/light_protocol.hpp"

namespace lumen::capture {

namespace {

auto epochMs(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

}  // namespace

auto sequenceDirectionToString(SequenceDirection direction) -> std::string {
    switch (direction) {
        case SequenceDirection::Forward:
            return "forward";
        case SequenceDirection::Reverse:
            return "reverse";
    }
    return "forward";
}

auto sequenceDirectionFromString(const std::string& value)
    -> std::optional<SequenceDirection> {
    if (value == "forward") {
        return SequenceDirection::Forward;
    }
    if (value == "reverse") {
        return SequenceDirection::Reverse;
    }
    return std::nullopt;
}

auto sequenceStateToString(SequenceState state) -> std::string {
    switch (state) {
        case SequenceState::Pending:
            return "pending";
        case SequenceState::Running:
            return "running";
        case SequenceState::Completed:
            return "completed";
        case SequenceState::Cancelled:
            return "cancelled";
        case SequenceState::Failed:
            return "failed";
    }
    return "unknown";
}

// ==================== SequenceSpec ====================

auto SequenceSpec::validate() const -> VoidResult {
    if (step <= 0) {
        return failure<void>(ErrorCode::ValidationError,
                             "Sequence step must be positive");
    }
    if (start < device::kMinBrightness || end > device::kMaxBrightness) {
        return failure<void>(ErrorCode::ValidationError,
                             "Sequence bounds must be within [0,255]");
    }
    if (start > end) {
        return failure<void>(ErrorCode::ValidationError,
                             "Sequence start must not exceed end");
    }
    return success();
}

auto SequenceSpec::levels() const -> std::vector<int> {
    std::vector<int> result;
    if (step <= 0 || start > end) {
        return result;
    }
    result.reserve(static_cast<size_t>((end - start) / step + 1));
    if (direction == SequenceDirection::Forward) {
        for (int v = start; v <= end; v += step) {
            result.push_back(v);
        }
    } else {
        for (int v = end; v >= start; v -= step) {
            result.push_back(v);
        }
    }
    return result;
}

auto SequenceSpec::signedStart() const -> int {
    return direction == SequenceDirection::Forward ? start : end;
}

auto SequenceSpec::signedEnd() const -> int {
    return direction == SequenceDirection::Forward ? end : start;
}

auto SequenceSpec::signedStep() const -> int {
    return direction == SequenceDirection::Forward ? step : -step;
}

auto SequenceSpec::toJson() const -> nlohmann::json {
    return {{"start", start},
            {"end", end},
            {"step", step},
            {"direction", sequenceDirectionToString(direction)},
            {"levels", levels()}};
}

auto SequenceSpec::fromRequest(int start, int end, int step,
                               std::optional<SequenceDirection> direction)
    -> Result<SequenceSpec> {
    if (step == 0) {
        return failure<SequenceSpec>(ErrorCode::ValidationError,
                                     "Sequence step must not be zero");
    }

    SequenceSpec spec;
    if (step < 0) {
        if (direction == SequenceDirection::Forward) {
            return failure<SequenceSpec>(
                ErrorCode::ValidationError,
                "A negative step cannot run forward");
        }
        // Descending request: start is the high bound
        spec.start = end;
        spec.end = start;
        spec.step = std::abs(step);
        spec.direction = SequenceDirection::Reverse;
    } else {
        spec.start = start;
        spec.end = end;
        spec.step = step;
        spec.direction = direction.value_or(SequenceDirection::Forward);
    }

    if (auto valid = spec.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return spec;
}

auto SequenceSpec::fromJson(const nlohmann::json& j) -> Result<SequenceSpec> {
    if (!j.is_object()) {
        return failure<SequenceSpec>(ErrorCode::ValidationError,
                                     "Sequence body must be an object");
    }
    std::array<int, 3> bounds{};
    constexpr std::array<const char*, 3> keys{"start", "end", "step"};
    for (size_t i = 0; i < keys.size(); ++i) {
        if (!j.contains(keys[i])) {
            return failure<SequenceSpec>(
                ErrorCode::ValidationError,
                std::string("Field '") + keys[i] + "' must be an integer");
        }
        auto value = readIntField(j[keys[i]], keys[i]);
        if (!value) {
            return std::unexpected(value.error());
        }
        bounds[i] = *value;
    }

    std::optional<SequenceDirection> direction;
    if (j.contains("direction") && !j["direction"].is_null()) {
        if (!j["direction"].is_string()) {
            return failure<SequenceSpec>(ErrorCode::ValidationError,
                                         "Field 'direction' must be a string");
        }
        direction = sequenceDirectionFromString(j["direction"].get<std::string>());
        if (!direction) {
            return failure<SequenceSpec>(
                ErrorCode::ValidationError,
                "Direction must be 'forward' or 'reverse'");
        }
    }

    return fromRequest(bounds[0], bounds[1], bounds[2], direction);
}

// ==================== Results ====================

auto SequenceStepResult::toJson() const -> nlohmann::json {
    nlohmann::json lightJson = nlohmann::json::array();
    for (const auto& outcome : lights) {
        lightJson.push_back(outcome.toJson());
    }
    return {{"index", index},
            {"brightness", brightness},
            {"lights", lightJson},
            {"capture", capture.toJson()}};
}

auto SequenceRunSnapshot::toJson() const -> nlohmann::json {
    nlohmann::json stepJson = nlohmann::json::array();
    for (const auto& s : steps) {
        stepJson.push_back(s.toJson());
    }
    nlohmann::json j = {{"id", id},
                        {"spec", spec.toJson()},
                        {"state", sequenceStateToString(state)},
                        {"current_index", currentIndex},
                        {"total_steps", totalSteps},
                        {"steps", stepJson},
                        {"started_at_ms", epochMs(startedAt)}};
    if (failureMessage) {
        j["failure"] = *failureMessage;
    }
    if (finishedAt) {
        j["finished_at_ms"] = epochMs(*finishedAt);
    }
    return j;
}

}  // namespace lumen::capture
