// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "tt_reset/hardware/hardware_access.hpp"
#include "tt_reset/types/chip_state.hpp"

namespace tt::reset {

struct ChipDetection {
    DeviceId device_id;
    ChipFamily family;
    ChipState state;
    // Set only for healthy chips.
    std::unique_ptr<ChipHandle> handle;
};

// Receives one human readable status line per chip.
using ProgressCallback = std::function<void(const std::string&)>;

/**
 * Enumerates chips and tries to bring each one up, classifying it as healthy, degraded or unrecoverable.
 * A failing chip never aborts the pass: every enumerated chip gets exactly one entry in the result.
 */
class ChipDetector {
public:
    explicit ChipDetector(HardwareAccess& hardware) : hardware_(hardware) {}

    std::vector<ChipDetection> detect_all(const ProgressCallback& progress = nullptr);

    /**
     * Detects the given chips only, in the given order. A chip that is not on the bus any more is reported as
     * unrecoverable.
     */
    std::vector<ChipDetection> detect(
        const std::vector<DeviceInfo>& expected, const ProgressCallback& progress = nullptr);

private:
    ChipDetection detect_one(const DeviceInfo& device);

    static void report(const ProgressCallback& progress, const ChipDetection& detection);

    HardwareAccess& hardware_;
};

}  // namespace tt::reset
