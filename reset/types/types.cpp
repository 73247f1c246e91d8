// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

#include "tt_reset/types/chip_family.hpp"
#include "tt_reset/types/chip_state.hpp"
#include "tt_reset/types/device_id.hpp"
#include "tt_reset/types/reset_result.hpp"
#include "tt_reset/utils/exceptions.hpp"

namespace tt::reset {

static constexpr uint16_t GS_PCIE_DEVICE_ID = 0xfaca;
static constexpr uint16_t WH_PCIE_DEVICE_ID = 0x401e;
static constexpr uint16_t BH_PCIE_DEVICE_ID = 0xb140;

std::string chip_family_to_str(ChipFamily family) {
    switch (family) {
        case ChipFamily::GRAYSKULL:
            return "grayskull";
        case ChipFamily::WORMHOLE_B0:
            return "wormhole_b0";
        case ChipFamily::BLACKHOLE:
            return "blackhole";
    }
    return "invalid";
}

std::optional<ChipFamily> chip_family_from_str(const std::string& family_str) {
    std::string lower = family_str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "grayskull") {
        return ChipFamily::GRAYSKULL;
    } else if (lower == "wormhole" || lower == "wormhole_b0") {
        return ChipFamily::WORMHOLE_B0;
    } else if (lower == "blackhole") {
        return ChipFamily::BLACKHOLE;
    }
    return std::nullopt;
}

std::optional<ChipFamily> chip_family_from_pci_device_id(uint16_t pci_device_id) {
    switch (pci_device_id) {
        case GS_PCIE_DEVICE_ID:
            return ChipFamily::GRAYSKULL;
        case WH_PCIE_DEVICE_ID:
            return ChipFamily::WORMHOLE_B0;
        case BH_PCIE_DEVICE_ID:
            return ChipFamily::BLACKHOLE;
        default:
            return std::nullopt;
    }
}

DeviceId::DeviceId(std::string pci_bdf) : pci_bdf_(std::move(pci_bdf)) {
    if (!is_valid_bdf(pci_bdf_)) {
        throw std::invalid_argument(fmt::format("'{}' is not a PCI address (expected dddd:bb:dd.f)", pci_bdf_));
    }
}

bool DeviceId::is_valid_bdf(const std::string& pci_bdf) {
    static const std::regex bdf_pattern(R"([0-9a-f]{4}:[0-9a-f]{2}:[0-1][0-9a-f]\.[0-7])");
    return std::regex_match(pci_bdf, bdf_pattern);
}

std::string chip_init_result_to_str(ChipInitResult result) {
    switch (result) {
        case ChipInitResult::UNKNOWN:
            return "unknown";
        case ChipInitResult::DEVICE_UNAVAILABLE:
            return "device unavailable";
        case ChipInitResult::HANG_READ:
            return "hang read";
        case ChipInitResult::ARC_STARTUP_FAILED:
            return "ARC startup failed";
        case ChipInitResult::ARC_MESSENGER_UNAVAILABLE:
            return "ARC messenger unavailable";
        case ChipInitResult::ARC_TELEMETRY_UNAVAILABLE:
            return "ARC telemetry unavailable";
        case ChipInitResult::FIRMWARE_INFO_PROVIDER_UNAVAILABLE:
            return "firmware info unavailable";
        case ChipInitResult::SUCCESSFUL:
            return "successful";
    }
    return "unknown";
}

std::string health_to_str(Health health) {
    switch (health) {
        case Health::HEALTHY:
            return "Healthy";
        case Health::DEGRADED:
            return "Degraded";
        case Health::UNRECOVERABLE:
            return "Unrecoverable";
    }
    return "Unknown";
}

std::string ChipState::to_string() const {
    if (reason.empty()) {
        return health_to_str(health);
    }
    return fmt::format("{}({})", health_to_str(health), reason);
}

ChipState chip_state_from_init_result(ChipInitResult result, const std::string& detail) {
    std::string reason = detail.empty() ? chip_init_result_to_str(result)
                                        : fmt::format("{}: {}", chip_init_result_to_str(result), detail);
    switch (result) {
        case ChipInitResult::SUCCESSFUL:
            return ChipState::healthy();
        case ChipInitResult::DEVICE_UNAVAILABLE:
        case ChipInitResult::HANG_READ:
            return ChipState::unrecoverable(std::move(reason));
        default:
            return ChipState::degraded(std::move(reason));
    }
}

std::string reset_error_code_to_str(ResetErrorCode code) {
    switch (code) {
        case ResetErrorCode::DRIVER_TOO_OLD:
            return "DriverTooOld";
        case ResetErrorCode::DRIVER_VERSION_UNPARSABLE:
            return "DriverVersionUnparsable";
        case ResetErrorCode::MALFORMED_CONFIG:
            return "MalformedConfig";
        case ResetErrorCode::CHIP_DEGRADED:
            return "ChipDegraded";
        case ResetErrorCode::CHIP_UNRECOVERABLE:
            return "ChipUnrecoverable";
        case ResetErrorCode::TELEMETRY_UNAVAILABLE:
            return "TelemetryUnavailable";
        case ResetErrorCode::REFCLK_REGRESSION:
            return "RefclkRegression";
        case ResetErrorCode::RESET_TIMEOUT:
            return "ResetTimeout";
        case ResetErrorCode::STALE_CHIP_HANDLE:
            return "StaleChipHandle";
        case ResetErrorCode::HARDWARE_ACCESS_FAILED:
            return "HardwareAccessFailed";
    }
    return "Unknown";
}

std::string reset_outcome_to_str(ResetOutcome outcome) {
    switch (outcome) {
        case ResetOutcome::SUCCESS:
            return "Success";
        case ResetOutcome::FAILED:
            return "Failed";
        case ResetOutcome::NEEDS_HOST_REBOOT:
            return "NeedsHostReboot";
    }
    return "Unknown";
}

std::string recommendation_to_str(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::NONE:
            return "none";
        case Recommendation::RETRY:
            return "retry the reset";
        case Recommendation::REBOOT_HOST:
            return "reboot the host";
    }
    return "none";
}

std::string reset_warning_to_str(ResetWarning warning) {
    switch (warning) {
        case ResetWarning::REFCLK_REGRESSION:
            return "RefclkRegression";
        case ResetWarning::REFCLK_UNAVAILABLE:
            return "RefclkUnavailable";
        case ResetWarning::FIRMWARE_VERSION_CHANGED:
            return "FirmwareVersionChanged";
        case ResetWarning::TELEMETRY_UNAVAILABLE:
            return "TelemetryUnavailable";
    }
    return "Unknown";
}

bool ResetResult::has_warning(ResetWarning warning) const {
    return std::find(warnings.begin(), warnings.end(), warning) != warnings.end();
}

std::string ResetResult::to_string() const {
    std::string text = fmt::format("{} [{}]: {}", device_id, family, outcome);
    if (!reason.empty()) {
        text += fmt::format(" - {}", reason);
    }
    if (!warnings.empty()) {
        text += fmt::format(" (warnings: {})", fmt::join(warnings, ", "));
    }
    if (recommendation != Recommendation::NONE) {
        text += fmt::format(", recommended: {}", recommendation_to_str(recommendation));
    }
    return text;
}

int exit_code_from_results(const std::vector<ResetResult>& results) {
    int exit_code = 0;
    for (const auto& result : results) {
        exit_code = std::max(exit_code, result.exit_code);
    }
    return exit_code;
}

}  // namespace tt::reset
