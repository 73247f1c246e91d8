// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/engine/reset_strategy.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>

#include "logger.hpp"

namespace tt::reset {

static std::vector<std::string> to_strings(const std::vector<DeviceId>& devices) {
    std::vector<std::string> strings;
    for (const auto& device_id : devices) {
        strings.push_back(device_id.str());
    }
    return strings;
}

void ResetStrategy::for_each_device(
    const std::vector<DeviceId>& devices,
    ResetFailures& failures,
    const std::function<void(const DeviceId&)>& step) {
    for (const auto& device_id : devices) {
        if (failures.count(device_id)) {
            continue;
        }
        try {
            step(device_id);
        } catch (const std::exception& e) {
            TT_RESET_ERROR("Reset step failed for {}: {}", device_id, e.what());
            failures.emplace(device_id, e.what());
        }
    }
}

std::chrono::milliseconds ResetStrategy::reinit_wait(const ResetOptions& options, size_t device_count) const {
    return options.post_reset_wait;
}

ResetFailures GrayskullResetStrategy::reset(ResetContext& context, const std::vector<DeviceId>& devices) {
    ResetFailures failures;
    context.narrate(fmt::format("Resetting tensix cores on {}", fmt::join(to_strings(devices), ", ")));
    for_each_device(devices, failures, [&](const DeviceId& device_id) {
        context.hardware.reset(device_id, ResetMode::TENSIX);
    });
    return failures;
}

ResetFailures WormholeResetStrategy::reset(ResetContext& context, const std::vector<DeviceId>& devices) {
    ResetFailures failures;
    context.narrate(fmt::format("Resetting PCIe link on {}", fmt::join(to_strings(devices), ", ")));
    for_each_device(devices, failures, [&](const DeviceId& device_id) {
        context.hardware.reset(device_id, ResetMode::LINK);
    });

    ResetMode mode = context.options.reset_m3 ? ResetMode::ASIC_M3 : ResetMode::ASIC;
    context.narrate(fmt::format("Issuing {} reset through the ARC", reset_mode_to_str(mode)));
    for_each_device(devices, failures, [&](const DeviceId& device_id) { context.hardware.reset(device_id, mode); });
    return failures;
}

// Arch agnostic reset: 0.4 s per chip with the regular wait as the floor, the M3 wait for M3 resets.
static std::chrono::milliseconds scaled_reinit_wait(const ResetOptions& options, size_t device_count) {
    if (options.reset_m3) {
        return options.m3_reset_wait;
    }
    auto scaled = options.post_reset_wait_per_device * static_cast<int64_t>(device_count);
    return std::max(options.post_reset_wait, scaled);
}

std::chrono::milliseconds WormholeResetStrategy::reinit_wait(const ResetOptions& options, size_t device_count) const {
    return scaled_reinit_wait(options, device_count);
}

ResetFailures BlackholeResetStrategy::reset(ResetContext& context, const std::vector<DeviceId>& devices) {
    ResetFailures failures;
    ResetMode mode = context.options.reset_m3 ? ResetMode::ASIC_M3 : ResetMode::ASIC;
    context.narrate(
        fmt::format("Issuing {} reset on {}", reset_mode_to_str(mode), fmt::join(to_strings(devices), ", ")));
    for_each_device(devices, failures, [&](const DeviceId& device_id) { context.hardware.reset(device_id, mode); });
    return failures;
}

std::chrono::milliseconds BlackholeResetStrategy::reinit_wait(const ResetOptions& options, size_t device_count) const {
    return scaled_reinit_wait(options, device_count);
}

std::chrono::milliseconds BlackholeResetStrategy::extended_reinit_window(const ResetOptions& options) const {
    return options.reset_m3 ? options.bmfw_upgrade_wait : std::chrono::milliseconds(0);
}

ResetFailures GalaxyResetStrategy::reset(ResetContext& context, const std::vector<DeviceId>& devices) {
    ResetFailures failures;
    const std::set<DeviceId> targets(devices.begin(), devices.end());

    for (const auto& board : boards_) {
        context.narrate(fmt::format("{} - resetting board", board.mobo));

        // Full wormhole reset of the board's NB hosts: link reset on all of them, then the ARC reset.
        const ResetMode nb_host_mode = context.options.reset_m3 ? ResetMode::ASIC_M3 : ResetMode::ASIC;
        auto nb_host_reset = [&]() {
            for (const auto& nb_host : board.nb_host_devices) {
                context.hardware.reset(nb_host, ResetMode::LINK);
            }
            for (const auto& nb_host : board.nb_host_devices) {
                context.hardware.reset(nb_host, nb_host_mode);
            }
        };

        try {
            nb_host_reset();
            context.narrate(fmt::format("{} - powercycling modules", board.mobo));
            context.hardware.powercycle_modules(board);
            nb_host_reset();
        } catch (const std::exception& e) {
            TT_RESET_ERROR("Galaxy board {} reset failed: {}", board.mobo, e.what());
            for (const auto& nb_host : board.nb_host_devices) {
                if (targets.count(nb_host)) {
                    failures.emplace(nb_host, fmt::format("board {} reset failed: {}", board.mobo, e.what()));
                }
            }
        }
    }
    return failures;
}

std::unique_ptr<ResetStrategy> make_reset_strategy(ChipFamily family) {
    switch (family) {
        case ChipFamily::GRAYSKULL:
            return std::make_unique<GrayskullResetStrategy>();
        case ChipFamily::WORMHOLE_B0:
            return std::make_unique<WormholeResetStrategy>();
        case ChipFamily::BLACKHOLE:
            return std::make_unique<BlackholeResetStrategy>();
    }
    return nullptr;
}

}  // namespace tt::reset
