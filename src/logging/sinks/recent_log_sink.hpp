/*
 * recent_log_sink.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Sink retaining the latest log records for the status report

**************************************************/

#ifndef LUMEN_LOGGING_SINKS_RECENT_LOG_SINK_HPP
#define LUMEN_LOGGING_SINKS_RECENT_LOG_SINK_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

#include "../types.hpp"

namespace lumen::logging {

/**
 * @brief Bounded in-memory history of log records
 *
 * Oldest records are evicted once capacity is reached. Warnings and errors
 * are also counted over the whole lifetime of the sink so a status report
 * can tell "quiet" from "evicted".
 */
class RecentLogSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit RecentLogSink(std::size_t capacity);

    /**
     * @brief Newest records, returned oldest first
     * @param limit 0 returns everything retained
     */
    [[nodiscard]] auto recent(std::size_t limit = 0) const
        -> std::vector<LogRecord>;

    /**
     * @brief Newest records at or above a level, returned oldest first
     */
    [[nodiscard]] auto atLeast(spdlog::level::level_enum level,
                               std::size_t limit) const
        -> std::vector<LogRecord>;

    [[nodiscard]] auto warningTotal() const -> std::uint64_t;

    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    const std::size_t capacity_;
    mutable std::mutex recordsMutex_;
    std::deque<LogRecord> records_;
    std::uint64_t warningTotal_{0};
};

}  // namespace lumen::logging

#endif  // LUMEN_LOGGING_SINKS_RECENT_LOG_SINK_HPP
