/*
 * json_fields.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Checked extraction of integer fields from request bodies

**************************************************/

#ifndef LUMEN_COMMON_JSON_FIELDS_HPP
#define LUMEN_COMMON_JSON_FIELDS_HPP

#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace lumen {

/**
 * @brief Read a JSON integer as int without narrowing
 *
 * Values outside the int range are rejected instead of being truncated.
 */
[[nodiscard]] inline auto readIntField(const nlohmann::json& value,
                                       const std::string& field)
    -> Result<int> {
    if (!value.is_number_integer()) {
        return failure<int>(ErrorCode::ValidationError,
                            "Field '" + field + "' must be an integer");
    }
    constexpr auto kMax = std::numeric_limits<int>::max();
    constexpr auto kMin = std::numeric_limits<int>::min();
    if (value.is_number_unsigned()) {
        auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(kMax)) {
            return failure<int>(ErrorCode::ValidationError,
                                "Field '" + field + "' is out of range");
        }
        return static_cast<int>(raw);
    }
    auto raw = value.get<std::int64_t>();
    if (raw > kMax || raw < kMin) {
        return failure<int>(ErrorCode::ValidationError,
                            "Field '" + field + "' is out of range");
    }
    return static_cast<int>(raw);
}

}  // namespace lumen

#endif  // LUMEN_COMMON_JSON_FIELDS_HPP
