// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "tt_reset/types/chip_state.hpp"
#include "tt_reset/types/reset_result.hpp"
#include "tt_reset/types/telemetry_snapshot.hpp"

namespace tt::reset {

struct VerifyPolicy {
    ChipFamily family = ChipFamily::WORMHOLE_B0;
    // The refclk counter restarts on a real reset; families that expose it are checked for that.
    bool requires_refclk_check = false;
    // The post reset counter must be below the pre reset one by more than this.
    uint64_t refclk_min_delta = 0;
    bool arm_host = false;
    // Failed resets of this family change the process exit code.
    bool failure_is_fatal = false;
    // Every failed reset changes the exit code, regardless of family.
    bool strict_exit_codes = false;
};

/**
 * Turns the post reset state of a chip and its telemetry into the final ResetResult.
 *
 *   Healthy                    -> Success (with a RefclkRegression warning if the refclk check fails)
 *   Degraded                   -> Failed, retry recommended
 *   Unrecoverable              -> NeedsHostReboot, host reboot recommended (plus an advisory on ARM hosts)
 */
class PostResetVerifier {
public:
    explicit PostResetVerifier(VerifyPolicy policy) : policy_(policy) {}

    ResetResult verify(
        const TelemetrySnapshot& pre, const ChipState& post_state, const std::optional<TelemetrySnapshot>& post) const;

    // Same as above for chips whose baseline telemetry could not be read.
    ResetResult verify(
        const DeviceId& device_id,
        const std::optional<TelemetrySnapshot>& pre,
        const ChipState& post_state,
        const std::optional<TelemetrySnapshot>& post) const;

    // Result for a chip whose reset sequence itself failed before it could be verified.
    ResetResult failed(const DeviceId& device_id, const std::string& reason) const;

    const VerifyPolicy& policy() const { return policy_; }

private:
    int failure_exit_code() const { return (policy_.failure_is_fatal || policy_.strict_exit_codes) ? 1 : 0; }

    void check_refclk(
        ResetResult& result,
        const std::optional<TelemetrySnapshot>& pre,
        const std::optional<TelemetrySnapshot>& post) const;

    VerifyPolicy policy_;
};

}  // namespace tt::reset
