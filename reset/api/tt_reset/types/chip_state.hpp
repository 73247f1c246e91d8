// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fmt/core.h>

#include <ostream>
#include <string>
#include <utility>

namespace tt::reset {

/**
 * Where chip initialization stopped. Anything but SUCCESSFUL describes a chip that is visible on the bus but did
 * not come up completely.
 */
enum class ChipInitResult {
    UNKNOWN,
    // Device node could not be opened or config space is unreadable.
    DEVICE_UNAVAILABLE,
    // Reads return 0xffffffff, the chip is hung and only a host reboot brings it back.
    HANG_READ,
    ARC_STARTUP_FAILED,
    ARC_MESSENGER_UNAVAILABLE,
    ARC_TELEMETRY_UNAVAILABLE,
    FIRMWARE_INFO_PROVIDER_UNAVAILABLE,
    SUCCESSFUL,
};

std::string chip_init_result_to_str(ChipInitResult result);

enum class Health {
    HEALTHY,
    // Visible but not fully responsive. A retry may recover it.
    DEGRADED,
    // Not recoverable without a host reboot.
    UNRECOVERABLE,
};

std::string health_to_str(Health health);

struct ChipState {
    Health health = Health::HEALTHY;
    std::string reason;

    static ChipState healthy() { return ChipState{Health::HEALTHY, ""}; }

    static ChipState degraded(std::string reason) { return ChipState{Health::DEGRADED, std::move(reason)}; }

    static ChipState unrecoverable(std::string reason) { return ChipState{Health::UNRECOVERABLE, std::move(reason)}; }

    bool is_healthy() const { return health == Health::HEALTHY; }

    std::string to_string() const;
};

// Classification of a failed initialization.
ChipState chip_state_from_init_result(ChipInitResult result, const std::string& detail);

inline std::ostream& operator<<(std::ostream& out, const ChipState& state) { return out << state.to_string(); }

}  // namespace tt::reset

namespace fmt {
template <>
struct formatter<tt::reset::Health> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::Health const& health, Context& ctx) const {
        return formatter<std::string>::format(tt::reset::health_to_str(health), ctx);
    }
};

template <>
struct formatter<tt::reset::ChipState> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::ChipState const& state, Context& ctx) const {
        return formatter<std::string>::format(state.to_string(), ctx);
    }
};
}  // namespace fmt
