// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace tt::reset {

/**
 * Chip families the reset engine knows how to drive.
 */
enum class ChipFamily {
    GRAYSKULL,
    WORMHOLE_B0,
    BLACKHOLE,
};

std::string chip_family_to_str(ChipFamily family);

// Accepts the canonical names plus "wormhole" for WORMHOLE_B0. Returns nullopt for anything else.
std::optional<ChipFamily> chip_family_from_str(const std::string& family_str);

// Maps a Tenstorrent PCI device id to its family.
std::optional<ChipFamily> chip_family_from_pci_device_id(uint16_t pci_device_id);

inline std::ostream& operator<<(std::ostream& out, const ChipFamily& family) {
    return out << chip_family_to_str(family);
}

}  // namespace tt::reset

namespace fmt {
template <>
struct formatter<tt::reset::ChipFamily> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template <typename Context>
    auto format(tt::reset::ChipFamily const& family, Context& ctx) const {
        return format_to(ctx.out(), "{}", tt::reset::chip_family_to_str(family));
    }
};
}  // namespace fmt
