/*
 * SPDX-FileCopyrightText: (c) 2024 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/ranges.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

#include "assert.hpp"

namespace tt::reset::utils {

inline std::optional<std::string> get_env_var_value(const char* env_var_name) {
    const char* env_var = std::getenv(env_var_name);
    if (!env_var) {
        return std::nullopt;
    }
    return std::string(env_var);
}

inline std::set<int> get_set_from_string(const std::string& input) {
    std::set<int> result_set;
    std::stringstream ss(input);
    std::string token;

    while (std::getline(ss, token, ',')) {
        try {
            result_set.insert(std::stoi(token));
        } catch (const std::exception& e) {
            TT_RESET_THROW("Input string is not a valid set of integers: '{}'. Error: {}", input, e.what());
        }
    }

    return result_set;
}

// Comma separated list of /dev/tenstorrent/<n> interface ids the tool is allowed to see.
inline constexpr std::string_view TT_VISIBLE_DEVICES_ENV = "TT_VISIBLE_DEVICES";

inline std::set<int> get_visible_devices() {
    const std::optional<std::string> env_var_value = get_env_var_value(TT_VISIBLE_DEVICES_ENV.data());
    return env_var_value.has_value() ? get_set_from_string(env_var_value.value()) : std::set<int>{};
}

template <typename T>
std::string to_hex_string(T value) {
    static_assert(std::is_integral<T>::value, "Template argument must be an integral type.");
    return fmt::format("{:#x}", value);
}

inline std::string get_host_name() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return std::string(buffer);
}

// Base directory for per-user tool state: $XDG_CONFIG_HOME, falling back to ~/.config.
inline std::filesystem::path get_user_config_dir() {
    if (auto xdg = get_env_var_value("XDG_CONFIG_HOME"); xdg.has_value() && !xdg->empty()) {
        return std::filesystem::path(*xdg);
    }
    if (auto home = get_env_var_value("HOME"); home.has_value() && !home->empty()) {
        return std::filesystem::path(*home) / ".config";
    }
    return std::filesystem::temp_directory_path();
}

// Polls predicate until it returns true or timeout elapses. Returns the last predicate value.
template <typename Predicate>
bool wait_until(Predicate&& predicate, std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (predicate()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

}  // namespace tt::reset::utils

constexpr bool is_arm_platform() {
#if defined(__aarch64__) || defined(__arm__)
    return true;
#else
    return false;
#endif
}
