/*
 * result.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Operation result types using std::expected

**************************************************/

#ifndef LUMEN_COMMON_RESULT_HPP
#define LUMEN_COMMON_RESULT_HPP

#include <expected>
#include <string>
#include <type_traits>
#include <utility>

#include "error.hpp"

namespace lumen {

/**
 * @brief Result type for operations that can fail with an Error
 */
template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

template <typename T>
[[nodiscard]] inline auto success(T&& value) -> Result<std::decay_t<T>> {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline auto success() -> VoidResult { return VoidResult(); }

template <typename T>
[[nodiscard]] inline auto failure(ErrorCode code, const std::string& message)
    -> Result<T> {
    return std::unexpected(Error(code, message));
}

template <typename T>
[[nodiscard]] inline auto failure(const Error& error) -> Result<T> {
    return std::unexpected(error);
}

}  // namespace lumen

#endif  // LUMEN_COMMON_RESULT_HPP
