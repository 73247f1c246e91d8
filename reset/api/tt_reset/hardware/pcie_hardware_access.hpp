/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "tt_reset/hardware/hardware_access.hpp"

namespace tt::reset {

/**
 * HardwareAccess backed by the Tenstorrent kernel driver: chips are found under /dev/tenstorrent and sysfs,
 * resets are issued through TENSTORRENT_IOCTL_RESET_DEVICE, and Wormhole ARC registers are accessed through a
 * BAR0 mapping.
 *
 * Drivers from 2.4.1 on implement every reset in the driver. Older drivers need the legacy sequences: ARC
 * messages for Wormhole, a config space write for Blackhole.
 */
class PcieHardwareAccess : public HardwareAccess {
public:
    std::vector<DeviceInfo> enumerate() override;

    std::unique_ptr<ChipHandle> init(const DeviceId& device_id) override;

    void finish_reset(const DeviceId& device_id) override;

    RawTelemetry read_telemetry(const DeviceId& device_id) override;

    void powercycle_modules(const GalaxyBoard& board) override;

    std::optional<std::string> read_driver_version() override;

    // Info for /dev/tenstorrent/<interface_id>, nullopt if it is not a Tenstorrent chip.
    static std::optional<DeviceInfo> read_device_info(int interface_id);

protected:
    void do_reset(const DeviceId& device_id, ResetMode mode) override;

private:
    DeviceInfo lookup(const DeviceId& device_id);

    bool is_arch_agnostic_reset_supported();

    void reset_wormhole_legacy(const DeviceInfo& device, ResetMode mode);

    void reset_blackhole_legacy(const DeviceInfo& device);

    // Last enumeration, interface ids change across resets.
    std::map<DeviceId, DeviceInfo> devices_;
    // Chips reset since their last finish_reset.
    std::set<DeviceId> pending_finish_;
};

}  // namespace tt::reset
