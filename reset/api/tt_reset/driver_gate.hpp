// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include "tt_reset/hardware/hardware_access.hpp"
#include "tt_reset/utils/kmd_versions.hpp"
#include "tt_reset/utils/semver.hpp"

namespace tt::reset {

/**
 * Checks the installed kernel driver before any reset is attempted.
 */
class DriverGate {
public:
    explicit DriverGate(HardwareAccess& hardware) : hardware_(hardware) {}

    /**
     * Returns the installed driver version if it is at least min_version.
     * Throws DriverVersionUnparsableError if no driver is loaded or its version string cannot be parsed, and
     * DriverTooOldError if it is older than min_version. Build and extraversion suffixes ("1.28-bh") are ignored.
     */
    SemVer check(const SemVer& min_version = KMD_MIN_RESET);

    // Parses a driver version string, converting parse failures to DriverVersionUnparsableError.
    static SemVer parse_driver_version(const std::string& version_str);

private:
    HardwareAccess& hardware_;
};

}  // namespace tt::reset
