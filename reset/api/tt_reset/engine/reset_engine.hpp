// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tt_reset/config/reset_config_store.hpp"
#include "tt_reset/detection/chip_detector.hpp"
#include "tt_reset/engine/reset_options.hpp"
#include "tt_reset/engine/reset_state_machine.hpp"
#include "tt_reset/engine/reset_strategy.hpp"
#include "tt_reset/hardware/hardware_access.hpp"
#include "tt_reset/types/reset_result.hpp"
#include "tt_reset/types/telemetry_snapshot.hpp"

namespace tt::reset {

/**
 * Runs a complete reset of a set of chips:
 *
 *   driver check -> config load -> lock -> baseline telemetry -> notify listeners -> family specific reset ->
 *   wait -> re-detect -> verify -> locked config update -> notify listeners
 *
 * Every chip ends up with exactly one ResetResult, whatever happened to the others. Failures that happen
 * before any chip is touched (driver too old, malformed config, unknown device) are thrown instead.
 */
class ResetEngine {
public:
    ResetEngine(HardwareAccess& hardware, const ResetConfigStore& config_store, ResetOptions options = {});

    // Called for every state change of every chip.
    void set_transition_observer(TransitionObserver observer) { observer_ = std::move(observer); }

    // Resets the requested chips, or every chip on the host if none are given. Results are sorted by DeviceId.
    std::vector<ResetResult> run(const std::vector<DeviceId>& requested = {});

    const ResetOptions& options() const { return options_; }

private:
    struct DeviceRun {
        DeviceInfo info;
        ResetStateMachine machine;
        std::optional<TelemetrySnapshot> baseline;
    };

    struct ResetGroup {
        std::unique_ptr<ResetStrategy> strategy;
        std::vector<DeviceRun*> devices;
    };

    void narrate(const std::string& message) const;

    std::vector<DeviceInfo> select_targets(const std::vector<DeviceId>& requested) const;

    // In galaxy mode a partial request also covers every board's NB hosts, they are reset with their board.
    std::vector<DeviceId> with_nb_hosts(const std::vector<DeviceId>& requested, const ResetConfig& config) const;

    void capture_baselines(std::vector<DeviceRun>& runs);

    std::vector<ResetGroup> make_groups(std::vector<DeviceRun>& runs, const ResetConfig& config) const;

    void reset_group(ResetGroup& group);

    // Re-detects the chips of a group until they are all healthy or the attempts and the strategy's extended
    // window run out. Returns the last detection of every chip.
    std::map<DeviceId, ChipDetection> redetect(ResetStrategy& strategy, const std::vector<DeviceRun*>& devices);

    void verify(ResetStrategy& strategy, DeviceRun& run, ChipDetection& detection);

    // Adds missing entries for this run's devices and stamps the successful ones. Other entries are untouched.
    void update_config(ResetConfig& config, const std::vector<DeviceRun>& runs) const;

    HardwareAccess& hardware_;
    const ResetConfigStore& config_store_;
    ResetOptions options_;
    TransitionObserver observer_;
};

}  // namespace tt::reset
