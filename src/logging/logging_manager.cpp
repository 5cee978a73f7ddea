/*
 * logging_manager.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "logging_manager.hpp"

#include "sinks/sink_factory.hpp"

namespace lumen::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() { shutdown(); }

void LoggingManager::initialize(const LoggingConfig& config) {
    std::vector<Error> skipped;
    std::size_t installed = 0;
    {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            detachLocked();
        }
        config_ = config;

        // Every level is retained; readers filter
        recent_ = std::make_shared<RecentLogSink>(config.recentCapacity);
        recent_->set_level(spdlog::level::trace);
        sinks_.push_back(recent_);

        for (const auto& sinkConfig : config.sinks()) {
            auto sink = SinkFactory::create(sinkConfig);
            if (!sink) {
                skipped.push_back(sink.error());
                continue;
            }
            sinks_.push_back(*sink);
        }

        spdlog::set_default_logger(makeLogger("lumen"));
        installed = sinks_.size();
        initialized_ = true;
    }

    for (const auto& error : skipped) {
        spdlog::warn("Log sink skipped: {}", error.toString());
    }
    spdlog::debug("Logging ready: {} sinks, level {}", installed,
                  levelToString(config.level));
}

void LoggingManager::shutdown() {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return;
    }
    detachLocked();
    initialized_ = false;
}

void LoggingManager::detachLocked() {
    for (const auto& [name, named] : named_) {
        named->flush();
    }
    if (auto current = spdlog::default_logger()) {
        current->flush();
    }
    spdlog::drop_all();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "lumen", SinkFactory::console(spdlog::level::info)));

    named_.clear();
    sinks_.clear();
    recent_.reset();
}

auto LoggingManager::makeLogger(const std::string& name) const
    -> std::shared_ptr<spdlog::logger> {
    auto created =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    created->set_level(config_.level);
    created->set_pattern(config_.pattern);
    return created;
}

auto LoggingManager::isInitialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto LoggingManager::logger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = named_.try_emplace(name);
    if (inserted) {
        it->second = makeLogger(name);
    }
    return it->second;
}

void LoggingManager::setLevel(spdlog::level::level_enum level) {
    std::lock_guard lock(mutex_);
    config_.level = level;
    for (const auto& [name, named] : named_) {
        named->set_level(level);
    }
    spdlog::set_level(level);
}

auto LoggingManager::recentRecords(std::size_t limit) const
    -> std::vector<LogRecord> {
    std::lock_guard lock(mutex_);
    return recent_ ? recent_->recent(limit) : std::vector<LogRecord>{};
}

auto LoggingManager::recentWarnings(std::size_t limit) const
    -> std::vector<LogRecord> {
    std::lock_guard lock(mutex_);
    return recent_ ? recent_->atLeast(spdlog::level::warn, limit)
                   : std::vector<LogRecord>{};
}

auto LoggingManager::warningTotal() const -> std::uint64_t {
    std::lock_guard lock(mutex_);
    return recent_ ? recent_->warningTotal() : 0;
}

void LoggingManager::clearRecent() {
    std::lock_guard lock(mutex_);
    if (recent_) {
        recent_->clear();
    }
}

auto LoggingManager::config() const -> LoggingConfig {
    std::lock_guard lock(mutex_);
    return config_;
}

}  // namespace lumen::logging
