// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/verification/post_reset_verifier.hpp"

#include <fmt/format.h>

#include "logger.hpp"

namespace tt::reset {

static constexpr const char* ARM_HOST_ADVISORY =
    "ARM hosts have a known issue recovering chips after a reset; reboot the host to bring the chip back";

ResetResult PostResetVerifier::verify(
    const TelemetrySnapshot& pre, const ChipState& post_state, const std::optional<TelemetrySnapshot>& post) const {
    return verify(pre.device_id, std::optional<TelemetrySnapshot>(pre), post_state, post);
}

ResetResult PostResetVerifier::verify(
    const DeviceId& device_id,
    const std::optional<TelemetrySnapshot>& pre,
    const ChipState& post_state,
    const std::optional<TelemetrySnapshot>& post) const {
    ResetResult result{device_id, policy_.family};

    switch (post_state.health) {
        case Health::HEALTHY:
            result.outcome = ResetOutcome::SUCCESS;
            result.exit_code = 0;
            if (!post.has_value()) {
                result.warnings.push_back(ResetWarning::TELEMETRY_UNAVAILABLE);
            }
            if (pre.has_value() && post.has_value() && pre->arc_fw_version != post->arc_fw_version) {
                result.warnings.push_back(ResetWarning::FIRMWARE_VERSION_CHANGED);
                TT_RESET_INFO(
                    "{}: ARC firmware changed from {} to {} across the reset",
                    device_id,
                    pre->arc_fw_version,
                    post->arc_fw_version);
            }
            if (policy_.requires_refclk_check) {
                check_refclk(result, pre, post);
            }
            return result;

        case Health::DEGRADED:
            result.outcome = ResetOutcome::FAILED;
            result.reason = post_state.reason;
            result.recommendation = Recommendation::RETRY;
            result.exit_code = failure_exit_code();
            return result;

        case Health::UNRECOVERABLE:
            result.outcome = ResetOutcome::NEEDS_HOST_REBOOT;
            result.reason = post_state.reason;
            result.recommendation = Recommendation::REBOOT_HOST;
            if (policy_.arm_host) {
                result.advisory = ARM_HOST_ADVISORY;
            }
            result.exit_code = failure_exit_code();
            return result;
    }
    return result;
}

void PostResetVerifier::check_refclk(
    ResetResult& result,
    const std::optional<TelemetrySnapshot>& pre,
    const std::optional<TelemetrySnapshot>& post) const {
    if (!pre.has_value() || !post.has_value() || !pre->refclk.has_value() || !post->refclk.has_value()) {
        result.warnings.push_back(ResetWarning::REFCLK_UNAVAILABLE);
        TT_RESET_WARN("{}: refclk could not be compared across the reset", result.device_id);
        return;
    }

    uint64_t before = *pre->refclk;
    uint64_t after = *post->refclk;
    bool reset_happened = after < before && before - after > policy_.refclk_min_delta;
    if (!reset_happened) {
        result.warnings.push_back(ResetWarning::REFCLK_REGRESSION);
        result.reason = fmt::format("refclk did not reset, value before: {}, value after: {}", before, after);
        TT_RESET_WARN("Reset for {} didn't go through! {}", result.device_id, result.reason);
    }
}

ResetResult PostResetVerifier::failed(const DeviceId& device_id, const std::string& reason) const {
    ResetResult result{device_id, policy_.family};
    result.outcome = ResetOutcome::FAILED;
    result.reason = reason;
    result.recommendation = Recommendation::RETRY;
    result.exit_code = failure_exit_code();
    return result;
}

}  // namespace tt::reset
