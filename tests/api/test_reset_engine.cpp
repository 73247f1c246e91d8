// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <stdlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "common/logger.hpp"
#include "test_utils/fake_hardware_access.hpp"
#include "tt_reset/engine/reset_engine.hpp"
#include "tt_reset/utils/exceptions.hpp"

using namespace tt::reset;
using namespace tt::reset::test_utils;

namespace {

// Copies everything the default logger emits at info level and above while in scope.
class LogCapture {
public:
    LogCapture() : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
        tt::reset::logger::initialize();
        logger_ = spdlog::default_logger();
        saved_level_ = logger_->level();
        logger_->set_level(spdlog::level::info);
        logger_->sinks().push_back(sink_);
    }

    ~LogCapture() {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        logger_->set_level(saved_level_);
    }

    std::string text() {
        logger_->flush();
        return stream_.str();
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum saved_level_ = spdlog::level::info;
};

}  // namespace

class ResetEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string tmpl = (std::filesystem::temp_directory_path() / "tt_reset_engine_XXXXXX").string();
        ASSERT_NE(mkdtemp(tmpl.data()), nullptr);
        temp_dir = tmpl;
        store = std::make_unique<ResetConfigStore>(temp_dir / "config" / "reset_config.json");

        options.post_reset_wait = std::chrono::milliseconds(0);
        options.post_reset_wait_per_device = std::chrono::milliseconds(0);
        options.m3_reset_wait = std::chrono::milliseconds(0);
        options.bmfw_upgrade_wait = std::chrono::milliseconds(0);
        options.redetect_backoff = std::chrono::milliseconds(1);
        options.notify_listeners = false;
        options.lock_dir = temp_dir / "locks";
        options.listener_dir = temp_dir / "listeners";
    }

    void TearDown() override { std::filesystem::remove_all(temp_dir); }

    std::vector<ResetResult> run(const std::vector<DeviceId>& requested = {}) {
        ResetEngine engine(hardware, *store, options);
        if (observer) {
            engine.set_transition_observer(observer);
        }
        return engine.run(requested);
    }

    static const ResetResult& result_for(const std::vector<ResetResult>& results, const std::string& bdf) {
        auto it = std::find_if(results.begin(), results.end(), [&](const ResetResult& result) {
            return result.device_id == DeviceId(bdf);
        });
        if (it == results.end()) {
            throw std::runtime_error("no result for " + bdf);
        }
        return *it;
    }

    // Two boards, each with one NB host and one member chip.
    void add_galaxy() {
        hardware.add_chip(make_chip("0000:01:00.0", ChipFamily::WORMHOLE_B0, 0));
        hardware.add_chip(make_chip("0000:02:00.0", ChipFamily::WORMHOLE_B0, 1));
        hardware.add_chip(make_chip("0000:10:00.0", ChipFamily::WORMHOLE_B0, 2));
        hardware.add_chip(make_chip("0000:20:00.0", ChipFamily::WORMHOLE_B0, 3));

        ResetConfig config;
        GalaxyBoard board_a;
        board_a.mobo = "mobo-a";
        board_a.nb_host_devices = {DeviceId("0000:01:00.0")};
        GalaxyBoard board_b;
        board_b.mobo = "mobo-b";
        board_b.nb_host_devices = {DeviceId("0000:02:00.0")};
        config.galaxy_boards = {board_a, board_b};
        store->save(config);

        options.galaxy = true;
    }

    std::filesystem::path temp_dir;
    std::unique_ptr<ResetConfigStore> store;
    FakeHardwareAccess hardware;
    ResetOptions options;
    TransitionObserver observer;
};

TEST_F(ResetEngineTest, WormholeResetSucceeds) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0, 0));
    hardware.add_chip(make_chip("0000:05:00.0", ChipFamily::WORMHOLE_B0, 1));

    auto results = run();

    ASSERT_EQ(results.size(), 2);
    for (const auto& result : results) {
        EXPECT_EQ(result.outcome, ResetOutcome::SUCCESS) << result.to_string();
        EXPECT_TRUE(result.warnings.empty()) << result.to_string();
        EXPECT_EQ(result.exit_code, 0);
    }
    EXPECT_EQ(results[0].device_id, DeviceId("0000:04:00.0"));

    // Link reset on every chip before any ASIC reset.
    const std::vector<std::string> expected = {
        "reset link 0000:04:00.0",
        "reset link 0000:05:00.0",
        "reset asic 0000:04:00.0",
        "reset asic 0000:05:00.0",
    };
    EXPECT_EQ(hardware.operations_matching({"reset "}), expected);
}

TEST_F(ResetEngineTest, WormholeM3Reset) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    options.reset_m3 = true;

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::SUCCESS);
    const std::vector<std::string> expected = {"reset link 0000:04:00.0", "reset asic_m3 0000:04:00.0"};
    EXPECT_EQ(hardware.operations_matching({"reset "}), expected);
}

TEST_F(ResetEngineTest, WormholeRefclkRegressionIsWarned) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    // The counter keeps running: the chip never actually reset.
    chip.refclk_after_reset.reset();
    hardware.add_chip(chip);

    auto results = run();

    const auto& result = results.at(0);
    EXPECT_EQ(result.outcome, ResetOutcome::SUCCESS);
    EXPECT_TRUE(result.has_warning(ResetWarning::REFCLK_REGRESSION));
    EXPECT_NE(result.reason.find("refclk"), std::string::npos);
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(ResetEngineTest, RefclkMinDelta) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    chip.refclk = 10'000;
    chip.refclk_after_reset = 9'000;
    hardware.add_chip(chip);

    options.refclk_min_delta = 5'000;
    EXPECT_TRUE(run().at(0).has_warning(ResetWarning::REFCLK_REGRESSION));
}

TEST_F(ResetEngineTest, GrayskullTensixReset) {
    hardware.add_chip(make_chip("0000:07:00.0", ChipFamily::GRAYSKULL));

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::SUCCESS);
    EXPECT_TRUE(results.at(0).warnings.empty());
    EXPECT_EQ(hardware.operations_matching({"reset "}), std::vector<std::string>{"reset tensix 0000:07:00.0"});
}

TEST_F(ResetEngineTest, MixedFamiliesAreResetByFamily) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0, 0));
    hardware.add_chip(make_chip("0000:41:00.0", ChipFamily::BLACKHOLE, 1));
    hardware.add_chip(make_chip("0000:07:00.0", ChipFamily::GRAYSKULL, 2));

    auto results = run();

    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(exit_code_from_results(results), 0);
    auto resets = hardware.operations_matching({"reset "});
    EXPECT_NE(std::find(resets.begin(), resets.end(), "reset tensix 0000:07:00.0"), resets.end());
    EXPECT_NE(std::find(resets.begin(), resets.end(), "reset asic 0000:41:00.0"), resets.end());
    // Blackhole does not get a link reset.
    EXPECT_EQ(std::find(resets.begin(), resets.end(), "reset link 0000:41:00.0"), resets.end());
}

TEST_F(ResetEngineTest, RequestedSubsetOnly) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0, 0));
    hardware.add_chip(make_chip("0000:05:00.0", ChipFamily::WORMHOLE_B0, 1));

    auto results = run({DeviceId("0000:05:00.0")});

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].device_id, DeviceId("0000:05:00.0"));
    for (const auto& operation : hardware.operations()) {
        EXPECT_EQ(operation.find("0000:04:00.0"), std::string::npos) << operation;
    }
}

TEST_F(ResetEngineTest, UnknownDeviceIsRejectedBeforeAnyReset) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));

    EXPECT_THROW(run({DeviceId("0000:04:00.0"), DeviceId("0000:99:00.0")}), HardwareAccessError);
    EXPECT_EQ(hardware.mutation_count(), 0);
}

TEST_F(ResetEngineTest, OldDriverStopsEverything) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    hardware.set_driver_version("1.25.0");

    EXPECT_THROW(run(), DriverTooOldError);
    EXPECT_TRUE(hardware.operations().empty());
}

TEST_F(ResetEngineTest, MissingDriverStopsEverything) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    hardware.set_driver_version(std::nullopt);

    EXPECT_THROW(run(), DriverVersionUnparsableError);
    EXPECT_TRUE(hardware.operations().empty());
}

TEST_F(ResetEngineTest, MalformedConfigStopsEverything) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    std::filesystem::create_directories(store->path().parent_path());
    std::ofstream(store->path()) << "{\"version\": 1, \"devices\": [";

    EXPECT_THROW(run(), MalformedConfigError);
    EXPECT_EQ(hardware.mutation_count(), 0);
}

TEST_F(ResetEngineTest, NoChips) {
    EXPECT_TRUE(run().empty());
    EXPECT_EQ(hardware.mutation_count(), 0);
}

TEST_F(ResetEngineTest, ResetStepFailureIsContained) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0, 0));
    hardware.add_chip(make_chip("0000:05:00.0", ChipFamily::WORMHOLE_B0, 1));
    hardware.chip("0000:04:00.0").reset_fails = true;

    auto results = run();

    const auto& failed = result_for(results, "0000:04:00.0");
    EXPECT_EQ(failed.outcome, ResetOutcome::FAILED);
    EXPECT_EQ(failed.recommendation, Recommendation::RETRY);
    EXPECT_EQ(failed.exit_code, 0);
    EXPECT_EQ(result_for(results, "0000:05:00.0").outcome, ResetOutcome::SUCCESS);

    // No ASIC reset after a failed link reset.
    auto resets = hardware.operations_matching({"reset asic"});
    EXPECT_EQ(resets, std::vector<std::string>{"reset asic 0000:05:00.0"});
}

TEST_F(ResetEngineTest, RedetectRetriesUntilHealthy) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    chip.init_results = {
        ChipInitResult::SUCCESSFUL,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::SUCCESSFUL,
    };
    hardware.add_chip(chip);

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::SUCCESS) << results.at(0).to_string();
    EXPECT_EQ(hardware.init_count("0000:04:00.0"), 4);
}

TEST_F(ResetEngineTest, RedetectGivesUpAfterAttempts) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    chip.init_results = {ChipInitResult::SUCCESSFUL, ChipInitResult::ARC_STARTUP_FAILED};
    hardware.add_chip(chip);
    options.redetect_attempts = 3;

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::FAILED);
    EXPECT_EQ(results.at(0).recommendation, Recommendation::RETRY);
    EXPECT_EQ(hardware.init_count("0000:04:00.0"), 1 + 3);
}

TEST_F(ResetEngineTest, BlackholeFailureIsFatal) {
    FakeChip chip = make_chip("0000:41:00.0", ChipFamily::BLACKHOLE);
    chip.vanishes_on_reset = true;
    hardware.add_chip(chip);
    options.redetect_attempts = 2;

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::NEEDS_HOST_REBOOT);
    EXPECT_EQ(results.at(0).recommendation, Recommendation::REBOOT_HOST);
    EXPECT_EQ(results.at(0).exit_code, 1);
    EXPECT_EQ(exit_code_from_results(results), 1);
}

TEST_F(ResetEngineTest, BlackholeResetThatNeverCompletesIsFatal) {
    FakeChip chip = make_chip("0000:41:00.0", ChipFamily::BLACKHOLE);
    chip.reset_times_out = true;
    hardware.add_chip(chip);

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::FAILED);
    EXPECT_NE(results.at(0).reason.find("did not complete"), std::string::npos) << results.at(0).reason;
    EXPECT_EQ(results.at(0).exit_code, 1);
    EXPECT_EQ(exit_code_from_results(results), 1);
    EXPECT_TRUE(hardware.operations_matching({"finish "}).empty());
}

TEST_F(ResetEngineTest, WormholeFailureKeepsExitCodeUnlessStrict) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    chip.vanishes_on_reset = true;
    hardware.add_chip(chip);
    options.redetect_attempts = 1;

    auto results = run();
    EXPECT_EQ(results.at(0).outcome, ResetOutcome::NEEDS_HOST_REBOOT);
    EXPECT_EQ(exit_code_from_results(results), 0);

    chip.vanishes_on_reset = true;
    FakeHardwareAccess strict_hardware;
    strict_hardware.add_chip(chip);
    options.strict_exit_codes = true;
    ResetEngine engine(strict_hardware, *store, options);
    EXPECT_EQ(exit_code_from_results(engine.run()), 1);
}

TEST_F(ResetEngineTest, BoardFirmwareUpgradeWindow) {
    FakeChip chip = make_chip("0000:41:00.0", ChipFamily::BLACKHOLE);
    chip.init_results = {
        ChipInitResult::SUCCESSFUL,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::SUCCESSFUL,
    };
    hardware.add_chip(chip);
    options.redetect_attempts = 2;
    options.reset_m3 = true;
    options.bmfw_upgrade_wait = std::chrono::seconds(5);

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::SUCCESS) << results.at(0).to_string();
    EXPECT_EQ(hardware.init_count("0000:41:00.0"), 6);
    EXPECT_EQ(hardware.operations_matching({"reset "}), std::vector<std::string>{"reset asic_m3 0000:41:00.0"});
}

TEST_F(ResetEngineTest, NoUpgradeWindowWithoutM3Reset) {
    FakeChip chip = make_chip("0000:41:00.0", ChipFamily::BLACKHOLE);
    chip.init_results = {
        ChipInitResult::SUCCESSFUL,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::ARC_STARTUP_FAILED,
        ChipInitResult::SUCCESSFUL,
    };
    hardware.add_chip(chip);
    options.redetect_attempts = 2;
    options.bmfw_upgrade_wait = std::chrono::seconds(5);

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::FAILED);
    EXPECT_EQ(results.at(0).exit_code, 1);
    EXPECT_EQ(hardware.init_count("0000:41:00.0"), 3);
}

TEST_F(ResetEngineTest, FinishResetIsRetried) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    chip.finish_fails = true;
    chip.init_results = {ChipInitResult::SUCCESSFUL, ChipInitResult::ARC_STARTUP_FAILED};
    hardware.add_chip(chip);
    options.redetect_attempts = 2;

    EXPECT_EQ(run().at(0).outcome, ResetOutcome::FAILED);

    // Once after the reset and once more before each detection attempt.
    EXPECT_EQ(hardware.operations_matching({"finish "}).size(), 3);
}

TEST_F(ResetEngineTest, ArmHostAdvisory) {
    FakeChip chip = make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0);
    chip.vanishes_on_reset = true;
    hardware.add_chip(chip);
    hardware.set_arm_host(true);
    options.redetect_attempts = 1;

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::NEEDS_HOST_REBOOT);
    ASSERT_TRUE(results.at(0).advisory.has_value());
    EXPECT_NE(results.at(0).advisory->find("ARM"), std::string::npos);
}

TEST_F(ResetEngineTest, ArmHostStillResetsHealthyChips) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    hardware.set_arm_host(true);

    auto results = run();

    EXPECT_EQ(results.at(0).outcome, ResetOutcome::SUCCESS);
    EXPECT_FALSE(results.at(0).advisory.has_value());
}

TEST_F(ResetEngineTest, GalaxyBoardsAreResetInOrder) {
    add_galaxy();

    auto results = run();

    // Each NB host gets the full wormhole sequence on both sides of its board's powercycle.
    const std::vector<std::string> expected = {
        "reset link 0000:01:00.0",
        "reset asic 0000:01:00.0",
        "powercycle mobo-a",
        "reset link 0000:01:00.0",
        "reset asic 0000:01:00.0",
        "reset link 0000:02:00.0",
        "reset asic 0000:02:00.0",
        "powercycle mobo-b",
        "reset link 0000:02:00.0",
        "reset asic 0000:02:00.0",
    };
    EXPECT_EQ(hardware.operations_matching({"reset ", "powercycle "}), expected);
    ASSERT_EQ(results.size(), 4);
    for (const auto& result : results) {
        EXPECT_EQ(result.outcome, ResetOutcome::SUCCESS) << result.to_string();
    }
}

TEST_F(ResetEngineTest, GalaxyBoardFailureDoesNotStopNextBoard) {
    add_galaxy();
    hardware.fail_powercycle("mobo-a");

    auto results = run();

    const std::vector<std::string> expected = {
        "reset link 0000:01:00.0",
        "reset asic 0000:01:00.0",
        "powercycle mobo-a",
        "reset link 0000:02:00.0",
        "reset asic 0000:02:00.0",
        "powercycle mobo-b",
        "reset link 0000:02:00.0",
        "reset asic 0000:02:00.0",
    };
    EXPECT_EQ(hardware.operations_matching({"reset ", "powercycle "}), expected);

    const auto& failed = result_for(results, "0000:01:00.0");
    EXPECT_EQ(failed.outcome, ResetOutcome::FAILED);
    EXPECT_NE(failed.reason.find("mobo-a"), std::string::npos);
    EXPECT_EQ(result_for(results, "0000:02:00.0").outcome, ResetOutcome::SUCCESS);
}

TEST_F(ResetEngineTest, GalaxyM3ResetOfNbHosts) {
    add_galaxy();
    options.reset_m3 = true;

    run();

    const std::vector<std::string> expected = {
        "reset link 0000:01:00.0",
        "reset asic_m3 0000:01:00.0",
        "powercycle mobo-a",
        "reset link 0000:01:00.0",
        "reset asic_m3 0000:01:00.0",
    };
    auto operations = hardware.operations_matching({"reset ", "powercycle "});
    ASSERT_GE(operations.size(), expected.size());
    operations.resize(expected.size());
    EXPECT_EQ(operations, expected);
}

TEST_F(ResetEngineTest, GalaxySubsetRequestIncludesNbHosts) {
    add_galaxy();

    auto results = run({DeviceId("0000:10:00.0")});

    // The NB hosts are reset with their boards, so they are locked, finished, verified and reported too.
    ASSERT_EQ(results.size(), 3);
    for (const std::string bdf : {"0000:01:00.0", "0000:02:00.0", "0000:10:00.0"}) {
        EXPECT_EQ(result_for(results, bdf).outcome, ResetOutcome::SUCCESS) << bdf;
        std::string lock_name = bdf;
        std::replace(lock_name.begin(), lock_name.end(), ':', '_');
        EXPECT_TRUE(std::filesystem::exists(options.lock_dir / (lock_name + ".lock"))) << bdf;
    }
    const std::vector<std::string> finished = {"finish 0000:01:00.0", "finish 0000:02:00.0", "finish 0000:10:00.0"};
    EXPECT_EQ(hardware.operations_matching({"finish "}), finished);
    for (const auto& operation : hardware.operations()) {
        EXPECT_EQ(operation.find("0000:20:00.0"), std::string::npos) << operation;
    }
}

TEST_F(ResetEngineTest, GalaxyMissingNbHostIsRejectedBeforeAnyReset) {
    add_galaxy();
    hardware.chip("0000:02:00.0").present = false;

    EXPECT_THROW(run(), HardwareAccessError);
    EXPECT_EQ(hardware.mutation_count(), 0);
}

TEST_F(ResetEngineTest, GalaxyWithoutBoardsIsMalformed) {
    hardware.add_chip(make_chip("0000:01:00.0", ChipFamily::WORMHOLE_B0));
    options.galaxy = true;

    EXPECT_THROW(run(), MalformedConfigError);
    EXPECT_EQ(hardware.mutation_count(), 0);
}

TEST_F(ResetEngineTest, ConfigRecordsRolesAndLastReset) {
    add_galaxy();
    hardware.fail_powercycle("mobo-b");

    run();

    ResetConfig config = store->load();
    ASSERT_EQ(config.devices.size(), 4);
    EXPECT_EQ(config.devices.at(DeviceId("0000:01:00.0")).role, BoardRole::NB_HOST);
    EXPECT_EQ(config.devices.at(DeviceId("0000:02:00.0")).role, BoardRole::NB_HOST);
    EXPECT_EQ(config.devices.at(DeviceId("0000:10:00.0")).role, BoardRole::GALAXY_MEMBER);

    EXPECT_TRUE(config.devices.at(DeviceId("0000:01:00.0")).last_successful_reset.has_value());
    EXPECT_FALSE(config.devices.at(DeviceId("0000:02:00.0")).last_successful_reset.has_value());
    ASSERT_EQ(config.galaxy_boards.size(), 2);
    EXPECT_EQ(config.galaxy_boards[0].mobo, "mobo-a");
}

TEST_F(ResetEngineTest, NestedRunsKeepBothConfigEntries) {
    hardware.add_chip(make_chip("0000:01:00.0", ChipFamily::WORMHOLE_B0, 0));
    FakeHardwareAccess other_hardware;
    other_hardware.add_chip(make_chip("0000:02:00.0", ChipFamily::WORMHOLE_B0, 1));

    // A second reset of another device starts and finishes while the first one is resetting.
    bool other_ran = false;
    observer = [&](const DeviceId& device_id, ResetState from, ResetState to) {
        if (to == ResetState::RESETTING && !other_ran) {
            other_ran = true;
            EXPECT_EQ(ResetEngine(other_hardware, *store, options).run().at(0).outcome, ResetOutcome::SUCCESS);
            EXPECT_TRUE(store->load().contains(DeviceId("0000:02:00.0")));
        }
    };

    EXPECT_EQ(run().at(0).outcome, ResetOutcome::SUCCESS);

    ASSERT_TRUE(other_ran);
    ResetConfig config = store->load();
    EXPECT_TRUE(config.contains(DeviceId("0000:01:00.0")));
    EXPECT_TRUE(config.contains(DeviceId("0000:02:00.0")));
    EXPECT_TRUE(config.devices.at(DeviceId("0000:02:00.0")).last_successful_reset.has_value());
}

TEST_F(ResetEngineTest, ParallelRunsKeepEveryConfigEntry) {
    constexpr int NUM_RUNS = 4;
    std::vector<std::unique_ptr<FakeHardwareAccess>> hosts;
    for (int i = 0; i < NUM_RUNS; i++) {
        hosts.push_back(std::make_unique<FakeHardwareAccess>());
        hosts.back()->add_chip(make_chip(fmt::format("0000:0{}:00.0", i + 1), ChipFamily::WORMHOLE_B0, i));
    }

    std::vector<ResetOutcome> outcomes(NUM_RUNS, ResetOutcome::FAILED);
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_RUNS; i++) {
        threads.emplace_back([&, i]() { outcomes[i] = ResetEngine(*hosts[i], *store, options).run().at(0).outcome; });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ResetConfig config = store->load();
    for (int i = 0; i < NUM_RUNS; i++) {
        EXPECT_EQ(outcomes[i], ResetOutcome::SUCCESS);
        EXPECT_TRUE(config.contains(DeviceId(fmt::format("0000:0{}:00.0", i + 1)))) << i;
    }
}

TEST_F(ResetEngineTest, ObserverSeesEveryTransition) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0, 0));
    hardware.add_chip(make_chip("0000:05:00.0", ChipFamily::WORMHOLE_B0, 1));
    hardware.chip("0000:05:00.0").reset_fails = true;

    std::map<DeviceId, std::vector<ResetState>> seen;
    observer = [&](const DeviceId& device_id, ResetState from, ResetState to) {
        auto& states = seen[device_id];
        if (states.empty()) {
            states.push_back(from);
        }
        states.push_back(to);
    };

    run();

    const std::vector<ResetState> healthy = {
        ResetState::IDLE,
        ResetState::DRIVER_CHECKED,
        ResetState::RESETTING,
        ResetState::AWAITING_REINIT,
        ResetState::VERIFYING,
        ResetState::DONE,
    };
    EXPECT_EQ(seen[DeviceId("0000:04:00.0")], healthy);

    const std::vector<ResetState> failed = {
        ResetState::IDLE, ResetState::DRIVER_CHECKED, ResetState::RESETTING, ResetState::DONE};
    EXPECT_EQ(seen[DeviceId("0000:05:00.0")], failed);
}

TEST_F(ResetEngineTest, SilentModeOnlyChangesNarration) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));

    std::vector<ResetResult> loud_results;
    std::string loud_log;
    {
        LogCapture capture;
        loud_results = run();
        loud_log = capture.text();
    }
    const auto loud_operations = hardware.operations();

    FakeHardwareAccess quiet_hardware;
    quiet_hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    options.silent = true;
    std::vector<ResetResult> quiet_results;
    std::string quiet_log;
    {
        LogCapture capture;
        quiet_results = ResetEngine(quiet_hardware, *store, options).run();
        quiet_log = capture.text();
    }

    EXPECT_NE(loud_log.find("Starting wormhole reset"), std::string::npos);
    EXPECT_EQ(quiet_log.find("Starting wormhole reset"), std::string::npos);

    EXPECT_EQ(quiet_hardware.operations(), loud_operations);
    ASSERT_EQ(quiet_results.size(), loud_results.size());
    EXPECT_EQ(quiet_results[0].outcome, loud_results[0].outcome);
    EXPECT_EQ(quiet_results[0].warnings, loud_results[0].warnings);
}

TEST_F(ResetEngineTest, NotifiesWithoutListeners) {
    hardware.add_chip(make_chip("0000:04:00.0", ChipFamily::WORMHOLE_B0));
    options.notify_listeners = true;
    options.notification_timeout = std::chrono::milliseconds(10);

    EXPECT_EQ(run().at(0).outcome, ResetOutcome::SUCCESS);
}
