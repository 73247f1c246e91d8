// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tt_reset/hardware/chip_handle.hpp"
#include "tt_reset/types/chip_family.hpp"
#include "tt_reset/types/device_id.hpp"

namespace tt::reset {

struct GalaxyBoard;

struct DeviceInfo {
    DeviceId device_id;
    ChipFamily family;
    // /dev/tenstorrent/<interface_id>. Not stable across resets.
    int interface_id = -1;
};

enum class ResetMode {
    // Tensix core reset, the only reset Grayskull supports.
    TENSIX,
    // PCIe link reset.
    LINK,
    // Full ASIC reset through the ARC.
    ASIC,
    // Board level reset through the M3 board management controller.
    ASIC_M3,
};

std::string reset_mode_to_str(ResetMode mode);

/**
 * Raw values as reported by the driver and firmware, before validation.
 */
struct RawTelemetry {
    std::string arc_fw_version;
    std::string eth_fw_version;
    std::optional<uint64_t> refclk;
};

/**
 * Everything the reset flow needs from the host and the chips. The core only talks to hardware through this
 * interface; PcieHardwareAccess is the implementation backed by the kernel driver.
 */
class HardwareAccess {
public:
    HardwareAccess();
    virtual ~HardwareAccess() = default;

    // Chips currently visible to the driver, sorted by DeviceId.
    virtual std::vector<DeviceInfo> enumerate() = 0;

    // Brings up a chip. Throws ChipInitError when the chip is visible but does not come up.
    virtual std::unique_ptr<ChipHandle> init(const DeviceId& device_id) = 0;

    // Issues one reset step. Bumps the device generation before touching the chip.
    void reset(const DeviceId& device_id, ResetMode mode);

    // Completes a reset after the chip has had time to come back: waits for it to reappear on the bus and
    // restores driver state.
    virtual void finish_reset(const DeviceId& device_id) = 0;

    virtual RawTelemetry read_telemetry(const DeviceId& device_id) = 0;

    // Turns the modules of one Galaxy board off and on again through its motherboard management server.
    virtual void powercycle_modules(const GalaxyBoard& board) = 0;

    // Installed driver version string, nullopt if no driver is loaded.
    virtual std::optional<std::string> read_driver_version() = 0;

    virtual bool is_arm_host() const;

    // Marks every handle to device_id as stale.
    void invalidate_handles(const DeviceId& device_id);

    const std::shared_ptr<ChipGenerationTracker>& generations() const { return generations_; }

protected:
    virtual void do_reset(const DeviceId& device_id, ResetMode mode) = 0;

    std::unique_ptr<ChipHandle> make_handle(const DeviceId& device_id, ChipFamily family) const;

private:
    std::shared_ptr<ChipGenerationTracker> generations_;
};

}  // namespace tt::reset
