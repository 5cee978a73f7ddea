/*
 * sink_factory.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Builds spdlog sinks from SinkConfig entries

**************************************************/

#ifndef LUMEN_LOGGING_SINKS_SINK_FACTORY_HPP
#define LUMEN_LOGGING_SINKS_SINK_FACTORY_HPP

#include <spdlog/spdlog.h>

#include "../types.hpp"
#include "common/result.hpp"

namespace lumen::logging {

class SinkFactory {
public:
    /**
     * @brief Create the sink a config entry describes
     *
     * File kinds create their parent directory first. A file that cannot be
     * opened yields InternalError naming the path.
     */
    [[nodiscard]] static auto create(const SinkConfig& config)
        -> Result<spdlog::sink_ptr>;

    [[nodiscard]] static auto console(
        spdlog::level::level_enum level = spdlog::level::trace)
        -> spdlog::sink_ptr;
};

}  // namespace lumen::logging

#endif  // LUMEN_LOGGING_SINKS_SINK_FACTORY_HPP
