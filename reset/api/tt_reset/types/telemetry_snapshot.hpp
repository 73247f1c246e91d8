// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "tt_reset/types/device_id.hpp"
#include "tt_reset/utils/semver.hpp"

namespace tt::reset {

/**
 * Firmware versions and refclk counter of one chip, captured at a single point in time.
 */
struct TelemetrySnapshot {
    DeviceId device_id;
    SemVer arc_fw_version;
    // Grayskull has no ethernet firmware.
    std::optional<SemVer> eth_fw_version;
    // Only families with an accessible ARC reset unit report the refclk counter.
    std::optional<uint64_t> refclk;
    std::chrono::system_clock::time_point timestamp;
};

}  // namespace tt::reset
