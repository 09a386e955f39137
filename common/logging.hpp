#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace ostiamesh {
namespace logging {

inline spdlog::level::level_enum level_from_name(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get("ostiamesh");
        if (!log) {
            log = spdlog::stderr_color_mt("ostiamesh");
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Level from OSTIAMESH_LOG_LEVEL, info when unset
        const char* level_env = std::getenv("OSTIAMESH_LOG_LEVEL");
        log->set_level(level_env ? level_from_name(level_env) : spdlog::level::info);

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace ostiamesh
