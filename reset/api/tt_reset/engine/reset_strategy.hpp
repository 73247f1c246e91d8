// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tt_reset/config/reset_config.hpp"
#include "tt_reset/engine/reset_options.hpp"
#include "tt_reset/hardware/hardware_access.hpp"

namespace tt::reset {

struct ResetContext {
    HardwareAccess& hardware;
    const ResetOptions& options;
    // Progress narration, at info or debug level depending on ResetOptions::silent.
    std::function<void(const std::string&)> narrate;
};

// Device -> reason for every device whose reset sequence failed.
using ResetFailures = std::map<DeviceId, std::string>;

/**
 * Family specific part of a reset: the steps issued while RESETTING, how long the chips need before they can be
 * re-detected, and how the outcome is judged. The state machine around it is shared by all families.
 */
class ResetStrategy {
public:
    virtual ~ResetStrategy() = default;

    virtual std::string name() const = 0;

    // Issues the reset steps for a batch of devices. A device failing does not stop the others.
    virtual ResetFailures reset(ResetContext& context, const std::vector<DeviceId>& devices) = 0;

    // Wait between the last reset step and finish_reset.
    virtual std::chrono::milliseconds reinit_wait(const ResetOptions& options, size_t device_count) const;

    // Extra time chips may legitimately stay away after the regular re-detection attempts ran out.
    virtual std::chrono::milliseconds extended_reinit_window(const ResetOptions& options) const {
        return std::chrono::milliseconds(0);
    }

    virtual bool requires_refclk_check() const { return false; }

    virtual bool failure_is_fatal() const { return false; }

protected:
    // Runs step on every device not already in failures, recording the devices it throws for.
    static void for_each_device(
        const std::vector<DeviceId>& devices,
        ResetFailures& failures,
        const std::function<void(const DeviceId&)>& step);
};

// Tensix core reset only.
class GrayskullResetStrategy : public ResetStrategy {
public:
    std::string name() const override { return "grayskull"; }

    ResetFailures reset(ResetContext& context, const std::vector<DeviceId>& devices) override;
};

// PCIe link reset on every chip, then an ARC (or M3) reset. The refclk counter must restart.
class WormholeResetStrategy : public ResetStrategy {
public:
    std::string name() const override { return "wormhole"; }

    ResetFailures reset(ResetContext& context, const std::vector<DeviceId>& devices) override;

    std::chrono::milliseconds reinit_wait(const ResetOptions& options, size_t device_count) const override;

    bool requires_refclk_check() const override { return true; }
};

/**
 * ASIC reset, or an M3 reset. An M3 reset may make the board management firmware upgrade itself, which keeps
 * the chip off the bus for much longer than a regular reset.
 */
class BlackholeResetStrategy : public ResetStrategy {
public:
    std::string name() const override { return "blackhole"; }

    ResetFailures reset(ResetContext& context, const std::vector<DeviceId>& devices) override;

    std::chrono::milliseconds reinit_wait(const ResetOptions& options, size_t device_count) const override;

    std::chrono::milliseconds extended_reinit_window(const ResetOptions& options) const override;

    bool failure_is_fatal() const override { return true; }
};

/**
 * Galaxy boards are reset one at a time, in config order: NB host reset, module powercycle, NB host reset. An NB
 * host reset is the wormhole sequence, link reset then ARC (or M3) reset. Board i+1 is not touched before board i
 * has finished. Every NB host must be among the devices passed to reset().
 */
class GalaxyResetStrategy : public ResetStrategy {
public:
    explicit GalaxyResetStrategy(std::vector<GalaxyBoard> boards) : boards_(std::move(boards)) {}

    std::string name() const override { return "galaxy"; }

    ResetFailures reset(ResetContext& context, const std::vector<DeviceId>& devices) override;

private:
    std::vector<GalaxyBoard> boards_;
};

std::unique_ptr<ResetStrategy> make_reset_strategy(ChipFamily family);

}  // namespace tt::reset
