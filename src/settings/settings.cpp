/*
 * settings.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "common/json_fields.hpp"
#include "config/runtime_config.hpp"
#include "device/light_protocol.hpp"

namespace lumen::settings {

auto saveModeToString(SaveMode mode) -> std::string {
    switch (mode) {
        case SaveMode::ExcludeDesignated:
            return "exclude_designated";
        case SaveMode::AllCameras:
            return "all_cameras";
        case SaveMode::DesignatedOnly:
            return "designated_only";
    }
    return "unknown";
}

auto saveModeFromInt(int value) -> std::optional<SaveMode> {
    switch (value) {
        case 1:
            return SaveMode::ExcludeDesignated;
        case 2:
            return SaveMode::AllCameras;
        case 3:
            return SaveMode::DesignatedOnly;
        default:
            return std::nullopt;
    }
}

auto isSafePathComponent(const std::string& name) -> bool {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (name.find("..") != std::string::npos) {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return c == '/' || c == '\\' || c == ':' || std::iscntrl(uc) != 0;
    });
}

// ==================== Settings ====================

auto Settings::toJson() const -> json {
    return {{"product", product},
            {"condition", condition},
            {"shot_no", shotNumber},
            {"save_path", savePath},
            {"save_mode", static_cast<int>(saveMode)},
            {"light_value", brightness},
            {"sequence_start", sequenceStart},
            {"sequence_end", sequenceEnd},
            {"sequence_step", sequenceStep}};
}

auto Settings::validate() const -> VoidResult {
    if (!isSafePathComponent(product)) {
        return failure<void>(ErrorCode::ValidationError,
                             "Product name must be a non-empty plain name");
    }
    if (!isSafePathComponent(condition)) {
        return failure<void>(ErrorCode::ValidationError,
                             "Condition must be a non-empty plain name");
    }
    if (shotNumber < 0) {
        return failure<void>(ErrorCode::ValidationError,
                             "Shot number must not be negative");
    }
    if (savePath.empty()) {
        return failure<void>(ErrorCode::ValidationError,
                             "Save path must not be empty");
    }
    if (!saveModeFromInt(static_cast<int>(saveMode))) {
        return failure<void>(ErrorCode::ValidationError,
                             "Save mode must be 1, 2 or 3");
    }
    if (brightness < device::kMinBrightness ||
        brightness > device::kMaxBrightness) {
        return failure<void>(ErrorCode::ValidationError,
                             "Brightness must be within [0,255]");
    }
    auto inRange = [](int v) {
        return v >= device::kMinBrightness && v <= device::kMaxBrightness;
    };
    if (!inRange(sequenceStart) || !inRange(sequenceEnd)) {
        return failure<void>(ErrorCode::ValidationError,
                             "Sequence bounds must be within [0,255]");
    }
    if (sequenceStep == 0) {
        return failure<void>(ErrorCode::ValidationError,
                             "Sequence step must not be zero");
    }
    return success();
}

auto Settings::fromConfig(const config::CaptureSection& section) -> Settings {
    Settings settings;
    settings.savePath = section.savePath;
    settings.product = section.product;
    settings.condition = section.condition;
    return settings;
}

// ==================== SettingsPatch ====================

auto SettingsPatch::empty() const -> bool {
    return !product && !condition && !shotNumber && !savePath && !saveMode &&
           !brightness && !sequenceStart && !sequenceEnd && !sequenceStep;
}

auto SettingsPatch::applyTo(const Settings& base) const -> Result<Settings> {
    Settings next = base;

    if (saveMode) {
        auto mode = saveModeFromInt(*saveMode);
        if (!mode) {
            return failure<Settings>(ErrorCode::ValidationError,
                                     "Save mode must be 1, 2 or 3");
        }
        next.saveMode = *mode;
    }
    if (product) {
        next.product = *product;
    }
    if (condition) {
        next.condition = *condition;
    }
    if (shotNumber) {
        next.shotNumber = *shotNumber;
    }
    if (savePath) {
        next.savePath = *savePath;
    }
    if (brightness) {
        next.brightness = *brightness;
    }
    if (sequenceStart) {
        next.sequenceStart = *sequenceStart;
    }
    if (sequenceEnd) {
        next.sequenceEnd = *sequenceEnd;
    }
    if (sequenceStep) {
        next.sequenceStep = *sequenceStep;
    }

    if (auto valid = next.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return next;
}

auto SettingsPatch::toJson() const -> json {
    json j = json::object();
    if (product) j["product"] = *product;
    if (condition) j["condition"] = *condition;
    if (shotNumber) j["shot_no"] = *shotNumber;
    if (savePath) j["save_path"] = *savePath;
    if (saveMode) j["save_mode"] = *saveMode;
    if (brightness) j["light_value"] = *brightness;
    if (sequenceStart) j["sequence_start"] = *sequenceStart;
    if (sequenceEnd) j["sequence_end"] = *sequenceEnd;
    if (sequenceStep) j["sequence_step"] = *sequenceStep;
    return j;
}

auto SettingsPatch::fromJson(const json& j) -> Result<SettingsPatch> {
    if (!j.is_object()) {
        return failure<SettingsPatch>(ErrorCode::ValidationError,
                                      "Settings body must be an object");
    }

    SettingsPatch patch;
    try {
        auto readString = [&j](const char* key,
                               std::optional<std::string>& field) {
            if (j.contains(key) && !j[key].is_null()) {
                field = j[key].get<std::string>();
            }
        };
        auto readInt = [&j](const char* key, std::optional<int>& field) {
            if (j.contains(key) && !j[key].is_null()) {
                auto value = readIntField(j[key], key);
                if (!value) {
                    throw std::invalid_argument(value.error().message);
                }
                field = *value;
            }
        };

        readString("product", patch.product);
        readString("condition", patch.condition);
        readInt("shot_no", patch.shotNumber);
        readString("save_path", patch.savePath);
        readInt("save_mode", patch.saveMode);
        readInt("light_value", patch.brightness);
        readInt("sequence_start", patch.sequenceStart);
        readInt("sequence_end", patch.sequenceEnd);
        readInt("sequence_step", patch.sequenceStep);
    } catch (const json::exception& e) {
        return failure<SettingsPatch>(ErrorCode::ValidationError,
                                      std::string("Invalid settings field: ") +
                                          e.what());
    } catch (const std::invalid_argument& e) {
        return failure<SettingsPatch>(ErrorCode::ValidationError, e.what());
    }
    return patch;
}

}  // namespace lumen::settings
