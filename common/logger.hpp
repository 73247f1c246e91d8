/*
 * SPDX-FileCopyrightText: (c) 2024 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 */

#pragma once

#include <atomic>
#include <string>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include <spdlog/spdlog.h>

namespace tt::reset::logger {

// Environment variable overriding Options::log_level, e.g. TT_RESET_LOG_LEVEL=debug.
inline constexpr const char* LOG_LEVEL_ENV = "TT_RESET_LOG_LEVEL";

/**
 * Parameters controlling the behavior of the logger.
 */
struct Options {
    bool log_to_stderr{true};
    std::string filename{};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v"};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

/**
 * One-time initialization of the logger.
 *
 * If you don't call it, the logger will be initialized with default options the
 * first time a message is logged.
 */
void initialize(const Options& options = Options{});

/**
 * Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
 * Throws std::invalid_argument for anything else.
 */
spdlog::level::level_enum level_from_string(const std::string& level);

#define TT_RESET_TRACE(...)                                \
    do {                                                   \
        ::tt::reset::logger::detail::ensure_initialized(); \
        SPDLOG_TRACE(__VA_ARGS__);                         \
    } while (0)

#define TT_RESET_DEBUG(...)                                \
    do {                                                   \
        ::tt::reset::logger::detail::ensure_initialized(); \
        SPDLOG_DEBUG(__VA_ARGS__);                         \
    } while (0)

#define TT_RESET_INFO(...)                                 \
    do {                                                   \
        ::tt::reset::logger::detail::ensure_initialized(); \
        SPDLOG_INFO(__VA_ARGS__);                          \
    } while (0)

#define TT_RESET_WARN(...)                                 \
    do {                                                   \
        ::tt::reset::logger::detail::ensure_initialized(); \
        SPDLOG_WARN(__VA_ARGS__);                          \
    } while (0)

#define TT_RESET_ERROR(...)                                \
    do {                                                   \
        ::tt::reset::logger::detail::ensure_initialized(); \
        SPDLOG_ERROR(__VA_ARGS__);                         \
    } while (0)

#define TT_RESET_CRITICAL(...)                             \
    do {                                                   \
        ::tt::reset::logger::detail::ensure_initialized(); \
        SPDLOG_CRITICAL(__VA_ARGS__);                      \
    } while (0)

/**
 * This is not part of the API.
 */
namespace detail {
extern std::atomic_bool is_initialized;

inline void ensure_initialized() {
    if (!is_initialized.load(std::memory_order_acquire)) {
        initialize();
    }
}

}  // namespace detail

}  // namespace tt::reset::logger
