// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/driver_gate.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <tuple>

#include "logger.hpp"
#include "tt_reset/utils/exceptions.hpp"

namespace tt::reset {

SemVer DriverGate::parse_driver_version(const std::string& version_str) {
    try {
        return SemVer::parse(version_str);
    } catch (const std::invalid_argument& e) {
        throw DriverVersionUnparsableError(
            fmt::format("Cannot parse driver version '{}': {}", version_str, e.what()));
    }
}

// Patch levels and release candidates of the driver do not change the reset interface.
static bool meets_release_line(const SemVer& version, const SemVer& min_version) {
    return std::tie(version.major, version.minor) >= std::tie(min_version.major, min_version.minor);
}

SemVer DriverGate::check(const SemVer& min_version) {
    auto version_str = hardware_.read_driver_version();
    if (!version_str.has_value()) {
        throw DriverVersionUnparsableError("No tenstorrent driver version found, is the driver loaded?");
    }

    SemVer version = parse_driver_version(*version_str);
    if (!meets_release_line(version, min_version)) {
        throw DriverTooOldError(fmt::format(
            "Driver version {} is older than the required {}, please update the tenstorrent driver",
            version.to_string(),
            min_version.to_string()));
    }

    TT_RESET_DEBUG("Driver version {} satisfies minimum {}", version.to_string(), min_version.to_string());
    return version;
}

}  // namespace tt::reset
