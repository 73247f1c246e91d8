// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

#include "tt_reset/utils/kmd_versions.hpp"
#include "tt_reset/utils/semver.hpp"
#include "tt_reset/utils/timeouts.hpp"

namespace tt::reset {

struct ResetOptions {
    // Board level reset through the M3 controller instead of an ASIC reset (Wormhole and Blackhole).
    bool reset_m3 = false;
    // Narrate at debug level instead of info. Never changes what is done or how results are judged.
    bool silent = false;
    // Reset the Galaxy boards listed in the config instead of resetting chips one family at a time.
    bool galaxy = false;

    SemVer min_driver_version = KMD_MIN_RESET;

    // Re-detection after a reset: fixed number of attempts with a fixed pause between them.
    int redetect_attempts = timeout::REDETECT_ATTEMPTS;
    std::chrono::milliseconds redetect_backoff = timeout::REDETECT_BACKOFF;

    std::chrono::milliseconds post_reset_wait = timeout::POST_RESET_WAIT;
    std::chrono::milliseconds post_reset_wait_per_device = timeout::POST_RESET_WAIT_PER_DEVICE;
    std::chrono::milliseconds m3_reset_wait = timeout::M3_RESET_WAIT;
    std::chrono::milliseconds bmfw_upgrade_wait = timeout::BMFW_UPGRADE_WAIT;

    uint64_t refclk_min_delta = 0;
    bool strict_exit_codes = false;

    bool notify_listeners = true;
    std::chrono::milliseconds notification_timeout = timeout::NOTIFICATION_GRACE_PERIOD;
    // Empty means the default listener directory.
    std::filesystem::path listener_dir;
    // Empty means the default lock directory.
    std::filesystem::path lock_dir;
};

}  // namespace tt::reset
