/*
 * settings.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Operator-facing capture settings and their partial updates

**************************************************/

#ifndef LUMEN_SETTINGS_SETTINGS_HPP
#define LUMEN_SETTINGS_SETTINGS_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/result.hpp"

namespace lumen::config {
struct CaptureSection;
}

namespace lumen::settings {

using json = nlohmann::json;

/**
 * @brief Which cameras a capture writes
 *
 * Wire values are kept from the field tool: 1, 2, 3.
 */
enum class SaveMode {
    ExcludeDesignated = 1,
    AllCameras = 2,
    DesignatedOnly = 3
};

[[nodiscard]] auto saveModeToString(SaveMode mode) -> std::string;
[[nodiscard]] auto saveModeFromInt(int value) -> std::optional<SaveMode>;

/**
 * @brief Reject empty names and anything that could escape a directory
 */
[[nodiscard]] auto isSafePathComponent(const std::string& name) -> bool;

struct Settings {
    std::string product{"ModelA"};
    std::string condition{"Test_A"};
    int shotNumber{1};
    std::string savePath{"./captured_images"};
    SaveMode saveMode{SaveMode::AllCameras};
    int brightness{100};  ///< Current light level, [0,255]

    // Last sweep request, step sign encodes direction
    int sequenceStart{30};
    int sequenceEnd{120};
    int sequenceStep{10};

    [[nodiscard]] auto toJson() const -> json;

    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Startup defaults taken from the capture configuration
     */
    [[nodiscard]] static auto fromConfig(const config::CaptureSection& section)
        -> Settings;
};

/**
 * @brief Partial update; unset fields are left untouched
 */
struct SettingsPatch {
    std::optional<std::string> product;
    std::optional<std::string> condition;
    std::optional<int> shotNumber;
    std::optional<std::string> savePath;
    std::optional<int> saveMode;  ///< Raw wire value, checked on apply
    std::optional<int> brightness;
    std::optional<int> sequenceStart;
    std::optional<int> sequenceEnd;
    std::optional<int> sequenceStep;

    [[nodiscard]] auto empty() const -> bool;

    /**
     * @brief Apply on top of a copy of base and validate the result
     */
    [[nodiscard]] auto applyTo(const Settings& base) const -> Result<Settings>;

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Parse a request body
     *
     * Unknown keys are ignored; a known key with the wrong type is a
     * ValidationError.
     */
    [[nodiscard]] static auto fromJson(const json& j) -> Result<SettingsPatch>;
};

}  // namespace lumen::settings

#endif  // LUMEN_SETTINGS_SETTINGS_HPP
