#pragma once

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace vecindex_cpp::log {

inline constexpr const char* LOGGER_NAME = "vecindex";

/// Library-wide logger (stderr, colored)
/// Reuses a logger registered under the same name by the host application.
inline std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        return spdlog::stderr_color_mt(LOGGER_NAME);
    }();
    return instance;
}

} // namespace vecindex_cpp::log
