/*
 * response.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Transport-neutral response envelope

**************************************************/

#ifndef LUMEN_SERVER_RESPONSE_HPP
#define LUMEN_SERVER_RESPONSE_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "common/error.hpp"

namespace lumen::server {

/**
 * @brief HTTP-like status plus JSON body, ready for any transport
 */
struct ApiResponse {
    int status{200};
    nlohmann::json body;

    [[nodiscard]] auto ok() const -> bool { return status < 400; }
};

/**
 * @brief Utility class for creating standardized API responses
 */
class ResponseBuilder {
public:
    /**
     * @brief Create a successful JSON response
     */
    static ApiResponse success(const nlohmann::json& data, int code = 200) {
        return {code, {{"status", "success"}, {"data", data}}};
    }

    /**
     * @brief Create an accepted response (202)
     */
    static ApiResponse accepted(const std::string& message,
                                const nlohmann::json& data = nullptr) {
        nlohmann::json body = {{"status", "success"}, {"message", message}};
        if (!data.is_null()) {
            body["data"] = data;
        }
        return {202, body};
    }

    /**
     * @brief Create an error response
     */
    static ApiResponse error(const std::string& code,
                             const std::string& message, int httpCode = 400,
                             const nlohmann::json& details = nullptr) {
        nlohmann::json errorObj = {{"code", code}, {"message", message}};
        if (!details.is_null()) {
            errorObj["details"] = details;
        }
        return {httpCode, {{"status", "error"}, {"error", errorObj}}};
    }

    /**
     * @brief Error response for a core Error, status derived from its code
     */
    static ApiResponse fromError(const Error& err,
                                 const nlohmann::json& details = nullptr) {
        nlohmann::json d = details;
        if (d.is_null()) {
            if (err.details) {
                d = *err.details;
            } else if (err.device) {
                d = {{"device", *err.device}};
            }
        }
        return error(errorCodeToString(err.code), err.message,
                     errorCodeToHttpStatus(err.code), d);
    }
};

}  // namespace lumen::server

#endif  // LUMEN_SERVER_RESPONSE_HPP
