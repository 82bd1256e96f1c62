#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace co::batch::log {

// =============================================================================
// Diagnostics
// =============================================================================
//
// All library output goes through the "http_batch" logger. It is cloned from
// the spdlog default logger on first use, so applications control sinks and
// level either through the default logger or by registering their own
// "http_batch" logger beforehand.

inline constexpr const char* logger_name = "http_batch";

inline std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto created = spdlog::default_logger()->clone(logger_name);
    spdlog::register_logger(created);
    return created;
}

template<typename... Args>
void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->trace(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->debug(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->warn(fmt, std::forward<Args>(args)...);
}

} // namespace co::batch::log
