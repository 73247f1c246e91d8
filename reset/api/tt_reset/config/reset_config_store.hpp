// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "tt_reset/config/reset_config.hpp"
#include "tt_reset/hardware/hardware_access.hpp"

namespace tt::reset {

/**
 * Loads and persists the reset configuration of this host as JSON.
 *
 * The store never falls back to defaults for a file that exists: anything it cannot read as a current config
 * (invalid JSON, unknown or mistyped fields, the legacy positional layout) is a MalformedConfigError.
 */
class ResetConfigStore {
public:
    explicit ResetConfigStore(std::filesystem::path path);

    // $XDG_CONFIG_HOME/tenstorrent/1e52/reset_config.json, with ~/.config as the fallback base.
    static std::filesystem::path default_path();

    const std::filesystem::path& path() const { return path_; }

    // Creates the parent directory if needed. Returns an empty config for this host if the file does not exist.
    ResetConfig load() const;

    // Writes to a temporary file next to the target and renames it over the target.
    void save(const ResetConfig& config) const;

    /**
     * Read-modify-write of the config file. Holds an exclusive lock on <path>.lock while the current file is
     * loaded, passed to modify and saved, so concurrent updates from other processes or threads are not lost.
     * Returns the saved config.
     */
    ResetConfig update(const std::function<void(ResetConfig&)>& modify) const;

    // Default config covering every given chip, saved to path().
    ResetConfig generate(const std::vector<DeviceInfo>& devices) const;

    static ResetConfig parse(const std::string& text);
    static std::string serialize(const ResetConfig& config);

    static std::string format_timestamp(std::chrono::system_clock::time_point time_point);

private:
    std::filesystem::path path_;
};

}  // namespace tt::reset
