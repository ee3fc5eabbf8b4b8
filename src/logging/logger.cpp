#include "logger.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace logging {
    void init(bool verbose) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);

        spdlog::set_default_logger(logger);
        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_pattern(LOG_PATTERN);
        spdlog::flush_on(spdlog::level::warn);

        spdlog::cfg::load_env_levels();
    }
}  // namespace logging
