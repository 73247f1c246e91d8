// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tt_reset/types/chip_family.hpp"
#include "tt_reset/types/device_id.hpp"

namespace tt::reset {

enum class BoardRole {
    STANDALONE,
    // Neighbor board host: a chip whose PCIe link partners a Galaxy board.
    NB_HOST,
    GALAXY_MEMBER,
};

std::string board_role_to_str(BoardRole role);
std::optional<BoardRole> board_role_from_str(const std::string& role_str);

struct FeatureFlags {
    bool report_sw_version = true;
    bool report_serial = true;

    bool operator==(const FeatureFlags& other) const {
        return report_sw_version == other.report_sw_version && report_serial == other.report_serial;
    }
};

struct DeviceConfig {
    ChipFamily family = ChipFamily::WORMHOLE_B0;
    BoardRole role = BoardRole::STANDALONE;
    // UTC timestamp in ISO 8601 form, e.g. "2025-06-01T12:30:00Z".
    std::optional<std::string> last_successful_reset;
    FeatureFlags features;
};

/**
 * One Galaxy board and the host chips linked to it. Boards are reset in the order they are listed.
 */
struct GalaxyBoard {
    // Host name or address of the motherboard management server.
    std::string mobo;
    std::vector<DeviceId> nb_host_devices;
    // Retimer ports to boot, e.g. "6:0". Empty means the board has no credos to boot.
    std::vector<std::string> credo_ports;
    std::vector<std::string> disabled_ports;
};

/**
 * Per host reset configuration, keyed by DeviceId so it stays valid when chips are enumerated in a different
 * order.
 */
struct ResetConfig {
    static constexpr int CURRENT_VERSION = 1;

    int version = CURRENT_VERSION;
    std::string host_name;
    std::map<DeviceId, DeviceConfig> devices;
    std::vector<GalaxyBoard> galaxy_boards;

    bool contains(const DeviceId& device_id) const { return devices.find(device_id) != devices.end(); }
};

}  // namespace tt::reset
