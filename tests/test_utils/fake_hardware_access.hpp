// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "tt_reset/config/reset_config.hpp"
#include "tt_reset/hardware/hardware_access.hpp"
#include "tt_reset/types/chip_state.hpp"

namespace tt::reset::test_utils {

/**
 * Behaviour of one simulated chip.
 */
struct FakeChip {
    DeviceInfo info;
    bool present = true;

    // Results of consecutive init() calls. The last entry repeats; empty means every init succeeds.
    std::vector<ChipInitResult> init_results;

    std::string arc_fw_version = "2.30.0.0";
    std::string eth_fw_version = "6.14.0";
    bool telemetry_fails = false;

    // Refclk counter: keeps running between reads and restarts at refclk_after_reset when the chip is reset.
    std::optional<uint64_t> refclk = 5'000'000;
    std::optional<uint64_t> refclk_after_reset = 1'000;
    uint64_t refclk_tick = 100;

    bool reset_fails = false;
    // Reset is accepted but never completes, like a config space reset that does not go through.
    bool reset_times_out = false;
    bool finish_fails = false;
    // Chip drops off the bus for good once it is reset.
    bool vanishes_on_reset = false;
};

FakeChip make_chip(const std::string& bdf, ChipFamily family, int interface_id = 0);

/**
 * In-memory HardwareAccess. Records every call that touches a chip or a board, in order, as
 * "<operation> <target>" strings, e.g. "reset link 0000:01:00.0" or "powercycle mobo-1".
 */
class FakeHardwareAccess : public HardwareAccess {
public:
    FakeHardwareAccess();

    void add_chip(FakeChip chip);

    FakeChip& chip(const std::string& bdf);

    void set_driver_version(std::optional<std::string> version) { driver_version_ = std::move(version); }

    void set_arm_host(bool arm_host) { arm_host_ = arm_host; }

    void fail_powercycle(const std::string& mobo) { failing_mobos_.insert(mobo); }

    std::vector<DeviceInfo> enumerate() override;
    std::unique_ptr<ChipHandle> init(const DeviceId& device_id) override;
    void finish_reset(const DeviceId& device_id) override;
    RawTelemetry read_telemetry(const DeviceId& device_id) override;
    void powercycle_modules(const GalaxyBoard& board) override;
    std::optional<std::string> read_driver_version() override;
    bool is_arm_host() const override { return arm_host_; }

    const std::vector<std::string>& operations() const { return operations_; }

    // Operations starting with one of the given prefixes, in call order.
    std::vector<std::string> operations_matching(const std::vector<std::string>& prefixes) const;

    // Number of calls that changed chip or board state (resets, reset completions, powercycles).
    size_t mutation_count() const;

    int init_count(const std::string& bdf) const;

protected:
    void do_reset(const DeviceId& device_id, ResetMode mode) override;

private:
    FakeChip& lookup(const DeviceId& device_id);

    std::map<DeviceId, FakeChip> chips_;
    std::map<DeviceId, int> init_calls_;
    std::optional<std::string> driver_version_ = "2.4.1";
    bool arm_host_ = false;
    std::set<std::string> failing_mobos_;
    std::vector<std::string> operations_;
};

}  // namespace tt::reset::test_utils
