// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/engine/reset_engine.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>
#include <thread>

#include "logger.hpp"
#include "tt_reset/driver_gate.hpp"
#include "tt_reset/notification/reset_notifier.hpp"
#include "tt_reset/telemetry/telemetry_reader.hpp"
#include "tt_reset/utils/device_lock_manager.hpp"
#include "tt_reset/utils/exceptions.hpp"
#include "tt_reset/verification/post_reset_verifier.hpp"
#include "utils.hpp"

namespace tt::reset {

static constexpr auto ARM_RESET_WARNING =
    "Resetting chips on an ARM host. Chips that do not come back after the reset need a host reboot.";

ResetEngine::ResetEngine(HardwareAccess& hardware, const ResetConfigStore& config_store, ResetOptions options) :
    hardware_(hardware), config_store_(config_store), options_(std::move(options)) {}

void ResetEngine::narrate(const std::string& message) const {
    if (options_.silent) {
        TT_RESET_DEBUG("{}", message);
    } else {
        TT_RESET_INFO("{}", message);
    }
}

std::vector<DeviceInfo> ResetEngine::select_targets(const std::vector<DeviceId>& requested) const {
    std::vector<DeviceInfo> enumerated = hardware_.enumerate();
    if (requested.empty()) {
        return enumerated;
    }

    std::vector<DeviceInfo> targets;
    for (const auto& device_id : std::set<DeviceId>(requested.begin(), requested.end())) {
        auto it = std::find_if(enumerated.begin(), enumerated.end(), [&](const DeviceInfo& info) {
            return info.device_id == device_id;
        });
        if (it == enumerated.end()) {
            throw HardwareAccessError(fmt::format("Device {} is not present on this host", device_id));
        }
        targets.push_back(*it);
    }
    return targets;
}

std::vector<DeviceId> ResetEngine::with_nb_hosts(
    const std::vector<DeviceId>& requested, const ResetConfig& config) const {
    if (!options_.galaxy || requested.empty()) {
        return requested;
    }
    std::set<DeviceId> devices(requested.begin(), requested.end());
    for (const auto& board : config.galaxy_boards) {
        for (const auto& nb_host : board.nb_host_devices) {
            if (devices.insert(nb_host).second) {
                TT_RESET_INFO("Adding NB host {} of board {} to the reset", nb_host, board.mobo);
            }
        }
    }
    return std::vector<DeviceId>(devices.begin(), devices.end());
}

std::vector<ResetEngine::ResetGroup> ResetEngine::make_groups(
    std::vector<DeviceRun>& runs, const ResetConfig& config) const {
    std::vector<ResetGroup> groups;
    if (options_.galaxy) {
        if (config.galaxy_boards.empty()) {
            throw MalformedConfigError(
                fmt::format("Galaxy reset requested but {} lists no galaxy boards", config_store_.path().string()));
        }
        ResetGroup group{std::make_unique<GalaxyResetStrategy>(config.galaxy_boards), {}};
        std::set<DeviceId> targets;
        for (auto& run : runs) {
            group.devices.push_back(&run);
            targets.insert(run.info.device_id);
        }
        for (const auto& board : config.galaxy_boards) {
            for (const auto& nb_host : board.nb_host_devices) {
                if (!targets.count(nb_host)) {
                    throw HardwareAccessError(fmt::format(
                        "NB host {} of galaxy board {} is not present on this host", nb_host, board.mobo));
                }
            }
        }
        groups.push_back(std::move(group));
        return groups;
    }

    std::map<ChipFamily, std::vector<DeviceRun*>> by_family;
    for (auto& run : runs) {
        by_family[run.info.family].push_back(&run);
    }
    for (auto& [family, devices] : by_family) {
        groups.push_back(ResetGroup{make_reset_strategy(family), devices});
    }
    return groups;
}

void ResetEngine::capture_baselines(std::vector<DeviceRun>& runs) {
    std::vector<DeviceInfo> infos;
    for (const auto& run : runs) {
        infos.push_back(run.info);
    }

    ChipDetector detector(hardware_);
    TelemetryReader reader(hardware_);
    auto detections = detector.detect(infos, [this](const std::string& line) { narrate(line); });
    for (size_t i = 0; i < detections.size(); i++) {
        auto& detection = detections[i];
        if (!detection.handle) {
            continue;
        }
        try {
            runs[i].baseline = reader.read(*detection.handle);
        } catch (const TelemetryUnavailableError& e) {
            TT_RESET_WARN("No baseline telemetry for {}: {}", detection.device_id, e.what());
        }
    }
}

static VerifyPolicy make_policy(
    const ResetStrategy& strategy, ChipFamily family, const ResetOptions& options, bool arm) {
    VerifyPolicy policy;
    policy.family = family;
    policy.requires_refclk_check = strategy.requires_refclk_check();
    policy.refclk_min_delta = options.refclk_min_delta;
    policy.arm_host = arm;
    policy.failure_is_fatal = strategy.failure_is_fatal();
    policy.strict_exit_codes = options.strict_exit_codes;
    return policy;
}

std::map<DeviceId, ChipDetection> ResetEngine::redetect(
    ResetStrategy& strategy, const std::vector<DeviceRun*>& devices) {
    std::map<DeviceId, ChipDetection> detections;
    std::vector<DeviceInfo> pending;
    for (const auto* run : devices) {
        pending.push_back(run->info);
        detections.emplace(
            run->info.device_id,
            ChipDetection{
                run->info.device_id, run->info.family, ChipState::unrecoverable("not detected after reset"), nullptr});
    }

    // Chips whose driver state could not be restored yet, retried before every detection attempt.
    std::set<DeviceId> unfinished;
    auto finish = [&](const DeviceId& device_id) {
        try {
            hardware_.finish_reset(device_id);
            unfinished.erase(device_id);
        } catch (const std::exception& e) {
            TT_RESET_WARN("Could not complete reset of {} yet: {}", device_id, e.what());
            unfinished.insert(device_id);
        }
    };
    for (const auto& info : pending) {
        finish(info.device_id);
    }

    ChipDetector detector(hardware_);
    auto attempt = [&]() {
        for (const auto& device_id : std::set<DeviceId>(unfinished)) {
            finish(device_id);
        }

        std::vector<ChipDetection> results;
        try {
            results = detector.detect(pending);
        } catch (const std::exception& e) {
            TT_RESET_WARN("Re-detection failed: {}", e.what());
            return;
        }

        std::vector<DeviceInfo> still_pending;
        for (size_t i = 0; i < results.size(); i++) {
            if (!results[i].state.is_healthy()) {
                still_pending.push_back(pending[i]);
            }
            detections.insert_or_assign(results[i].device_id, std::move(results[i]));
        }
        pending = std::move(still_pending);
    };

    for (int i = 1; i <= options_.redetect_attempts && !pending.empty(); i++) {
        if (i > 1) {
            std::this_thread::sleep_for(options_.redetect_backoff);
        }
        TT_RESET_DEBUG("Re-detection attempt {}/{} for {} chip(s)", i, options_.redetect_attempts, pending.size());
        attempt();
    }

    const auto window = strategy.extended_reinit_window(options_);
    if (!pending.empty() && window.count() > 0) {
        narrate(fmt::format(
            "{} chip(s) not back yet, waiting up to {} s for a board firmware upgrade to finish",
            pending.size(),
            std::chrono::duration_cast<std::chrono::seconds>(window).count()));
        utils::wait_until(
            [&]() {
                attempt();
                return pending.empty();
            },
            window,
            options_.redetect_backoff);
    }
    return detections;
}

void ResetEngine::verify(ResetStrategy& strategy, DeviceRun& run, ChipDetection& detection) {
    const PostResetVerifier verifier(make_policy(strategy, run.info.family, options_, hardware_.is_arm_host()));
    narrate(fmt::format("{} ({}): {}", detection.device_id, detection.family, detection.state));

    if (!detection.state.is_healthy() || !detection.handle) {
        run.machine.finish(verifier.verify(run.info.device_id, run.baseline, detection.state, std::nullopt));
        return;
    }

    run.machine.transition_to(ResetState::VERIFYING);
    std::optional<TelemetrySnapshot> post;
    try {
        post = TelemetryReader(hardware_).read(*detection.handle);
    } catch (const TelemetryUnavailableError& e) {
        TT_RESET_WARN("No post reset telemetry for {}: {}", run.info.device_id, e.what());
    }
    run.machine.finish(verifier.verify(run.info.device_id, run.baseline, detection.state, post));
}

void ResetEngine::reset_group(ResetGroup& group) {
    ResetStrategy& strategy = *group.strategy;
    ResetContext context{hardware_, options_, [this](const std::string& message) { narrate(message); }};

    std::vector<DeviceId> device_ids;
    for (auto* run : group.devices) {
        run->machine.transition_to(ResetState::RESETTING);
        device_ids.push_back(run->info.device_id);
    }

    narrate(fmt::format("Starting {} reset of {} chip(s)", strategy.name(), device_ids.size()));
    const ResetFailures failures = strategy.reset(context, device_ids);

    std::vector<DeviceRun*> awaiting;
    for (auto* run : group.devices) {
        auto failure = failures.find(run->info.device_id);
        if (failure != failures.end()) {
            const PostResetVerifier verifier(
                make_policy(strategy, run->info.family, options_, hardware_.is_arm_host()));
            run->machine.finish(verifier.failed(run->info.device_id, failure->second));
            continue;
        }
        run->machine.transition_to(ResetState::AWAITING_REINIT);
        awaiting.push_back(run);
    }
    if (awaiting.empty()) {
        return;
    }

    const auto wait = strategy.reinit_wait(options_, awaiting.size());
    narrate(fmt::format("Waiting {} ms for chips to re-initialize", wait.count()));
    std::this_thread::sleep_for(wait);

    auto detections = redetect(strategy, awaiting);
    for (auto* run : awaiting) {
        verify(strategy, *run, detections.at(run->info.device_id));
    }
}

void ResetEngine::update_config(ResetConfig& config, const std::vector<DeviceRun>& runs) const {
    std::set<DeviceId> nb_hosts;
    for (const auto& board : config.galaxy_boards) {
        nb_hosts.insert(board.nb_host_devices.begin(), board.nb_host_devices.end());
    }

    const std::string now = ResetConfigStore::format_timestamp(std::chrono::system_clock::now());
    for (const auto& run : runs) {
        const DeviceId& device_id = run.info.device_id;
        if (!config.contains(device_id)) {
            DeviceConfig device_config;
            device_config.family = run.info.family;
            if (nb_hosts.count(device_id)) {
                device_config.role = BoardRole::NB_HOST;
            } else if (options_.galaxy) {
                device_config.role = BoardRole::GALAXY_MEMBER;
            }
            config.devices.emplace(device_id, device_config);
        }
        const auto& result = run.machine.result();
        if (result.has_value() && result->outcome == ResetOutcome::SUCCESS) {
            config.devices.at(device_id).last_successful_reset = now;
        }
    }
}

std::vector<ResetResult> ResetEngine::run(const std::vector<DeviceId>& requested) {
    if (hardware_.is_arm_host()) {
        TT_RESET_WARN("{}", ARM_RESET_WARNING);
    }

    // Nothing below may touch a chip before the driver and the config are known to be usable.
    const SemVer driver_version = DriverGate(hardware_).check(options_.min_driver_version);
    narrate(fmt::format("Kernel driver version {}", driver_version));

    const ResetConfig config = config_store_.load();
    const std::vector<DeviceInfo> targets = select_targets(with_nb_hosts(requested, config));
    if (targets.empty()) {
        narrate("No chips to reset");
        return {};
    }

    std::vector<DeviceRun> runs;
    runs.reserve(targets.size());
    for (const auto& info : targets) {
        runs.push_back(DeviceRun{info, ResetStateMachine(info.device_id, observer_), std::nullopt});
    }
    std::vector<ResetGroup> groups = make_groups(runs, config);

    std::vector<DeviceId> target_ids;
    for (auto& run : runs) {
        run.machine.transition_to(ResetState::DRIVER_CHECKED);
        target_ids.push_back(run.info.device_id);
    }

    const DeviceLockManager lock_manager(
        options_.lock_dir.empty() ? std::filesystem::path(DeviceLockManager::DEFAULT_LOCK_DIR) : options_.lock_dir);
    const auto locks = lock_manager.acquire_all(target_ids);

    capture_baselines(runs);

    const std::filesystem::path listener_dir = options_.listener_dir.empty()
                                                   ? std::filesystem::path(ResetNotifier::DEFAULT_LISTENER_DIR)
                                                   : options_.listener_dir;
    if (options_.notify_listeners) {
        ResetNotifier::Notifier::notify_pre_reset(options_.notification_timeout, listener_dir);
    }

    for (auto& group : groups) {
        reset_group(group);
    }

    std::vector<ResetResult> results;
    for (const auto& run : runs) {
        TT_RESET_ASSERT(run.machine.is_done(), "Reset of {} did not finish", run.info.device_id);
        results.push_back(*run.machine.result());
    }
    std::sort(results.begin(), results.end(), [](const ResetResult& a, const ResetResult& b) {
        return a.device_id < b.device_id;
    });

    try {
        config_store_.update([&](ResetConfig& latest) { update_config(latest, runs); });
    } catch (const std::exception& e) {
        TT_RESET_ERROR("Failed to save reset config to {}: {}", config_store_.path().string(), e.what());
        throw;
    }

    if (options_.notify_listeners) {
        ResetNotifier::Notifier::notify_post_reset(listener_dir);
    }

    for (const auto& result : results) {
        if (result.outcome == ResetOutcome::SUCCESS && result.warnings.empty()) {
            narrate(result.to_string());
        } else {
            TT_RESET_WARN("{}", result.to_string());
        }
    }
    return results;
}

}  // namespace tt::reset
