// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fmt/core.h>

#include <optional>
#include <string>
#include <vector>

#include "tt_reset/types/chip_family.hpp"
#include "tt_reset/types/device_id.hpp"

namespace tt::reset {

enum class ResetOutcome {
    SUCCESS,
    FAILED,
    NEEDS_HOST_REBOOT,
};

enum class Recommendation {
    NONE,
    RETRY,
    REBOOT_HOST,
};

enum class ResetWarning {
    // Refclk counter did not go down across the reset, the chip probably was not reset.
    REFCLK_REGRESSION,
    // Refclk could not be compared because one of the snapshots is missing it.
    REFCLK_UNAVAILABLE,
    FIRMWARE_VERSION_CHANGED,
    TELEMETRY_UNAVAILABLE,
};

std::string reset_outcome_to_str(ResetOutcome outcome);
std::string recommendation_to_str(Recommendation recommendation);
std::string reset_warning_to_str(ResetWarning warning);

struct ResetResult {
    DeviceId device_id;
    ChipFamily family;
    ResetOutcome outcome = ResetOutcome::FAILED;
    std::string reason;
    Recommendation recommendation = Recommendation::NONE;
    std::vector<ResetWarning> warnings;
    // Remediation hint specific to the host, e.g. the ARM reset recovery issue.
    std::optional<std::string> advisory;
    int exit_code = 0;

    bool has_warning(ResetWarning warning) const;

    std::string to_string() const;
};

// Process exit status for a batch of results: the largest per-device exit code.
int exit_code_from_results(const std::vector<ResetResult>& results);

}  // namespace tt::reset

namespace fmt {
template <>
struct formatter<tt::reset::ResetOutcome> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::ResetOutcome const& outcome, Context& ctx) const {
        return formatter<std::string>::format(tt::reset::reset_outcome_to_str(outcome), ctx);
    }
};

template <>
struct formatter<tt::reset::ResetWarning> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::ResetWarning const& warning, Context& ctx) const {
        return formatter<std::string>::format(tt::reset::reset_warning_to_str(warning), ctx);
    }
};
}  // namespace fmt
