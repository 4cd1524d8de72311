#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace rearlink {
namespace logging {

// Level names accepted by REARLINK_LOG_LEVEL and --log-level
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Shared "rearlink" logger on stderr; stdout stays free for command output
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("rearlink");
        log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        const char* level_env = std::getenv("REARLINK_LOG_LEVEL");
        if (level_env) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown REARLINK_LOG_LEVEL '{}'", level_env);
            }
        }

        return log;
    }();
    return logger;
}

inline void set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) {
        throw std::runtime_error("Unknown log level '" + name +
                                 "' (expected trace, debug, info, warn, error or off)");
    }
    get_logger()->set_level(*level);
}

}  // namespace logging
}  // namespace rearlink
