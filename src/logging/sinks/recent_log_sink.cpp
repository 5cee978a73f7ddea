/*
 * recent_log_sink.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "recent_log_sink.hpp"

#include <algorithm>

namespace lumen::logging {

RecentLogSink::RecentLogSink(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void RecentLogSink::sink_it_(const spdlog::details::log_msg& msg) {
    LogRecord record;
    record.timestamp = msg.time;
    record.level = msg.level;
    record.source.assign(msg.logger_name.data(), msg.logger_name.size());
    record.text.assign(msg.payload.data(), msg.payload.size());

    std::lock_guard lock(recordsMutex_);
    if (records_.size() == capacity_) {
        records_.pop_front();
    }
    records_.push_back(std::move(record));
    if (msg.level >= spdlog::level::warn && msg.level != spdlog::level::off) {
        ++warningTotal_;
    }
}

auto RecentLogSink::recent(std::size_t limit) const -> std::vector<LogRecord> {
    std::lock_guard lock(recordsMutex_);
    std::size_t n = (limit == 0) ? records_.size()
                                 : std::min(limit, records_.size());
    return std::vector<LogRecord>(
        records_.end() - static_cast<std::ptrdiff_t>(n), records_.end());
}

auto RecentLogSink::atLeast(spdlog::level::level_enum level,
                            std::size_t limit) const -> std::vector<LogRecord> {
    std::lock_guard lock(recordsMutex_);
    std::vector<LogRecord> result;
    for (auto it = records_.rbegin();
         it != records_.rend() && result.size() < limit; ++it) {
        if (it->level >= level) {
            result.push_back(*it);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}

auto RecentLogSink::warningTotal() const -> std::uint64_t {
    std::lock_guard lock(recordsMutex_);
    return warningTotal_;
}

void RecentLogSink::clear() {
    std::lock_guard lock(recordsMutex_);
    records_.clear();
}

auto RecentLogSink::size() const -> std::size_t {
    std::lock_guard lock(recordsMutex_);
    return records_.size();
}

}  // namespace lumen::logging
