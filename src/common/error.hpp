/*
 * error.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Error codes and structures shared by every core component

**************************************************/

#ifndef LUMEN_COMMON_ERROR_HPP
#define LUMEN_COMMON_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lumen {

/**
 * @brief Error kinds surfaced by the capture core
 *
 * DeviceUnavailable is absorbed at the registry boundary (fallback frame or
 * no-op brightness). The remaining kinds propagate to the request boundary.
 */
enum class ErrorCode {
    DeviceUnavailable,
    ValidationError,
    Conflict,
    StorageError,
    InternalError
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] inline auto errorCodeToString(ErrorCode code) -> std::string {
    switch (code) {
        case ErrorCode::DeviceUnavailable:
            return "DeviceUnavailable";
        case ErrorCode::ValidationError:
            return "ValidationError";
        case ErrorCode::Conflict:
            return "Conflict";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::InternalError:
            return "InternalError";
    }
    return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
}

/**
 * @brief Map an error code to the HTTP status a transport should answer with
 */
[[nodiscard]] inline auto errorCodeToHttpStatus(ErrorCode code) -> int {
    switch (code) {
        case ErrorCode::DeviceUnavailable:
            return 503;
        case ErrorCode::ValidationError:
            return 400;
        case ErrorCode::Conflict:
            return 409;
        case ErrorCode::StorageError:
        case ErrorCode::InternalError:
            return 500;
    }
    return 500;
}

/**
 * @brief Error structure with detailed information
 */
struct Error {
    ErrorCode code{ErrorCode::InternalError};
    std::string message;
    std::optional<std::string> device;
    std::optional<std::string> details;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    Error() = default;

    explicit Error(ErrorCode errorCode, std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    Error(ErrorCode errorCode, std::string errorMessage, std::string deviceId)
        : code(errorCode),
          message(std::move(errorMessage)),
          device(std::move(deviceId)) {}

    [[nodiscard]] auto toString() const -> std::string {
        std::string result = "[" + errorCodeToString(code) + "]";
        if (device) {
            result += " " + *device + ":";
        }
        result += " " + message;
        if (details) {
            result += " (" + *details + ")";
        }
        return result;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j = {{"code", errorCodeToString(code)},
                            {"message", message}};
        if (device) {
            j["device"] = *device;
        }
        if (details) {
            j["details"] = *details;
        }
        return j;
    }
};

}  // namespace lumen

#endif  // LUMEN_COMMON_ERROR_HPP
