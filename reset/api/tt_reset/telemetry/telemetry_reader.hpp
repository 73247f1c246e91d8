// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tt_reset/hardware/hardware_access.hpp"
#include "tt_reset/types/telemetry_snapshot.hpp"

namespace tt::reset {

/**
 * Reads firmware versions and the refclk counter of a chip. Reading has no side effects on the chip.
 * Any failure, including use of a handle invalidated by a reset, is reported as TelemetryUnavailableError.
 */
class TelemetryReader {
public:
    explicit TelemetryReader(HardwareAccess& hardware) : hardware_(hardware) {}

    TelemetrySnapshot read(const ChipHandle& handle);

private:
    HardwareAccess& hardware_;
};

}  // namespace tt::reset
