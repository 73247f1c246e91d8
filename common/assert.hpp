/*
 * SPDX-FileCopyrightText: (c) 2023 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/core.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include "backtrace.hpp"
#include "logger.hpp"

namespace tt::reset::assert {

// Set to abort() instead of throwing, so a debugger or core dump catches the failing frame.
inline constexpr const char* ABORT_ENV = "TT_RESET_ASSERT_ABORT";

inline size_t count_placeholders(const std::string& format_str) {
    size_t count = 0;
    for (size_t pos = format_str.find("{}"); pos != std::string::npos; pos = format_str.find("{}", pos + 2)) {
        count++;
    }
    return count;
}

inline void tt_assert_message(std::ostream& os) {}

/**
 * Writes an assertion message to os, newline terminated.
 *
 * A first argument with "{}" placeholders is a format string for the remaining arguments; the number of
 * placeholders must match and every argument must be formattable by fmt. Without placeholders each argument
 * is streamed on its own line.
 */
template <typename T, typename... Ts>
void tt_assert_message(std::ostream& os, T const& first, Ts const&... rest) {
    std::ostringstream head;
    head << first;
    const std::string format_str = head.str();

    const size_t placeholders = sizeof...(rest) == 0 ? 0 : count_placeholders(format_str);
    if (placeholders == 0) {
        os << format_str << '\n';
        ((os << rest << '\n'), ...);
        return;
    }

    if (placeholders != sizeof...(rest)) {
        throw std::runtime_error(fmt::format(
            "Assert message '{}' has {} placeholders for {} arguments", format_str, placeholders, sizeof...(rest)));
    }
    if constexpr ((fmt::is_formattable<Ts>::value && ...)) {
        os << fmt::format(fmt::runtime(format_str), rest...) << '\n';
    } else {
        throw std::runtime_error(fmt::format("Assert message '{}' has arguments fmt cannot format", format_str));
    }
}

template <typename... Ts>
[[noreturn]] void tt_throw(char const* file, int line, char const* kind, char const* condition, Ts const&... messages) {
    std::ostringstream report;
    report << kind << " @ " << file << ":" << line << ": " << condition << '\n';

    if constexpr (sizeof...(messages) > 0) {
        std::ostringstream message;
        tt_assert_message(message, messages...);
        TT_RESET_ERROR("{}", message.str());
        report << message.str();
    }

    report << "Backtrace:\n" << backtrace_to_string(100, 3, " --- ");
    spdlog::default_logger()->flush();

    if (std::getenv(ABORT_ENV)) {
        std::abort();
    }
    throw std::runtime_error(report.str());
}

template <typename... Ts>
void tt_assert(char const* file, int line, bool condition, char const* condition_str, Ts const&... messages) {
    if (!condition) {
        tt_throw(file, line, "TT_RESET_ASSERT", condition_str, messages...);
    }
}

}  // namespace tt::reset::assert

#define TT_RESET_ASSERT(condition, ...) \
    ::tt::reset::assert::tt_assert(__FILE__, __LINE__, (condition), #condition, ##__VA_ARGS__)
#define TT_RESET_THROW(...) \
    ::tt::reset::assert::tt_throw(__FILE__, __LINE__, "TT_RESET_THROW", "tt::reset::exception", ##__VA_ARGS__)
