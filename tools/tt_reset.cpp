// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include <fmt/core.h>
#include <fmt/format.h>

#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "logger.hpp"
#include "tt_reset/config/reset_config_store.hpp"
#include "tt_reset/detection/chip_detector.hpp"
#include "tt_reset/engine/reset_engine.hpp"
#include "tt_reset/hardware/pcie_hardware_access.hpp"
#include "tt_reset/telemetry/telemetry_reader.hpp"
#include "tt_reset/utils/exceptions.hpp"

using namespace tt::reset;

static int run_detect(HardwareAccess& hardware) {
    ChipDetector detector(hardware);
    TelemetryReader reader(hardware);

    auto detections = detector.detect_all([](const std::string& line) { TT_RESET_INFO("{}", line); });
    if (detections.empty()) {
        TT_RESET_INFO("No Tenstorrent chips found.");
        return 0;
    }

    for (const auto& detection : detections) {
        if (!detection.handle) {
            continue;
        }
        try {
            auto snapshot = reader.read(*detection.handle);
            TT_RESET_INFO(
                "{} - ARC fw {}, ETH fw {}",
                detection.device_id,
                snapshot.arc_fw_version,
                snapshot.eth_fw_version.has_value() ? snapshot.eth_fw_version->to_string() : "n/a");
        } catch (const TelemetryUnavailableError& e) {
            TT_RESET_WARN("{} - {}", detection.device_id, e.what());
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("tt-reset", "Reset Tenstorrent chips and verify they came back.");

    options.add_options()(
        "d,devices",
        "PCI addresses of the chips to reset, e.g. 0000:01:00.0. All chips if omitted.",
        cxxopts::value<std::vector<std::string>>())(
        "m3", "Board level reset through the M3 controller (Wormhole and Blackhole).")(
        "galaxy", "Reset the Galaxy boards listed in the reset config.")(
        "s,silent", "Report reset progress at debug level only.")(
        "c,config", "Reset config file.", cxxopts::value<std::string>())(
        "detect", "Detect chips and print their state without resetting them.")(
        "generate-config", "Write a default reset config for the chips on this host and exit.")(
        "min-driver",
        "Minimum kernel driver version.",
        cxxopts::value<std::string>()->default_value(KMD_MIN_RESET.to_string()))(
        "refclk-min-delta",
        "Amount the refclk counter must drop by across a Wormhole reset.",
        cxxopts::value<uint64_t>()->default_value("0"))(
        "strict", "Exit with a failure code when any chip fails to reset, not just Blackhole.")(
        "no-notify", "Do not notify other processes before and after the reset.")(
        "l,log-level",
        "Log level: trace, debug, info, warn, error, critical or off.",
        cxxopts::value<std::string>()->default_value("info"))("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << std::endl << options.help() << std::endl;
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    try {
        logger::Options logger_options;
        logger_options.log_level = logger::level_from_string(result["log-level"].as<std::string>());
        logger::initialize(logger_options);

        PcieHardwareAccess hardware;
        const ResetConfigStore config_store(
            result.count("config") ? std::filesystem::path(result["config"].as<std::string>())
                                   : ResetConfigStore::default_path());

        if (result.count("detect")) {
            return run_detect(hardware);
        }

        if (result.count("generate-config")) {
            auto config = config_store.generate(hardware.enumerate());
            TT_RESET_INFO(
                "Wrote reset config for {} chip(s) to {}", config.devices.size(), config_store.path().string());
            return 0;
        }

        ResetOptions reset_options;
        reset_options.reset_m3 = result.count("m3") > 0;
        reset_options.galaxy = result.count("galaxy") > 0;
        reset_options.silent = result.count("silent") > 0;
        reset_options.strict_exit_codes = result.count("strict") > 0;
        reset_options.notify_listeners = result.count("no-notify") == 0;
        reset_options.min_driver_version = SemVer(result["min-driver"].as<std::string>());
        reset_options.refclk_min_delta = result["refclk-min-delta"].as<uint64_t>();

        std::vector<DeviceId> device_ids;
        if (result.count("devices")) {
            for (const auto& bdf : result["devices"].as<std::vector<std::string>>()) {
                device_ids.emplace_back(bdf);
            }
        }

        ResetEngine engine(hardware, config_store, reset_options);
        auto results = engine.run(device_ids);
        return exit_code_from_results(results);
    } catch (const ResetError& e) {
        TT_RESET_ERROR("Reset aborted ({}): {}", reset_error_code_to_str(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        TT_RESET_ERROR("Error during reset: {}", e.what());
        return 1;
    }
}
