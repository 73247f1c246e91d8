/*
 * SPDX-FileCopyrightText: (c) 2024 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace tt::reset::logger {

spdlog::level::level_enum level_from_string(const std::string& level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lowered == "trace") {
        return spdlog::level::trace;
    } else if (lowered == "debug") {
        return spdlog::level::debug;
    } else if (lowered == "info") {
        return spdlog::level::info;
    } else if (lowered == "warn" || lowered == "warning") {
        return spdlog::level::warn;
    } else if (lowered == "error") {
        return spdlog::level::err;
    } else if (lowered == "critical") {
        return spdlog::level::critical;
    } else if (lowered == "off") {
        return spdlog::level::off;
    }
    throw std::invalid_argument(fmt::format("Unknown log level: '{}'", level));
}

void initialize(const Options& options) {
    static std::mutex mutex;
    std::scoped_lock lock{mutex};

    if (detail::is_initialized.load(std::memory_order_relaxed)) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (options.log_to_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (!options.filename.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.filename));
    }

    auto level = options.log_level;
    if (const char* env_level = std::getenv(LOG_LEVEL_ENV)) {
        try {
            level = level_from_string(env_level);
        } catch (const std::invalid_argument& e) {
            // Keep the configured level; the logger is not usable yet to report this.
            fmt::print(stderr, "Ignoring {}: {}\n", LOG_LEVEL_ENV, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("TT_RESET", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(options.pattern);

    spdlog::set_default_logger(logger);
    detail::is_initialized.store(true, std::memory_order_release);
}

namespace detail {
std::atomic_bool is_initialized = false;
}

}  // namespace tt::reset::logger
