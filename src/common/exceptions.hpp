/*
 * exceptions.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Exception hierarchy for the exceptional paths of the core

**************************************************/

#ifndef LUMEN_COMMON_EXCEPTIONS_HPP
#define LUMEN_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "error.hpp"

namespace lumen {

/**
 * @brief Base exception class carrying a structured Error
 */
class LumenException : public std::runtime_error {
public:
    explicit LumenException(const std::string& message,
                            ErrorCode code = ErrorCode::InternalError)
        : std::runtime_error(message), error_(code, message) {}

    explicit LumenException(const Error& error)
        : std::runtime_error(error.toString()), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const Error& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return error_.code;
    }

protected:
    Error error_;
};

/**
 * @brief Raised when a captured frame cannot be written to storage
 */
class StorageException : public LumenException {
public:
    StorageException(const std::string& message, const std::string& path)
        : LumenException(message, ErrorCode::StorageError), path_(path) {
        error_.details = path;
    }

    [[nodiscard]] auto path() const noexcept -> const std::string& {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Raised when startup configuration is malformed
 */
class ConfigException : public LumenException {
public:
    explicit ConfigException(const std::string& message)
        : LumenException(message, ErrorCode::ValidationError) {}
};

}  // namespace lumen

#endif  // LUMEN_COMMON_EXCEPTIONS_HPP
