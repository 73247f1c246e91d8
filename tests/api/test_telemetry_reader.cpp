// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <limits>

#include "test_utils/fake_hardware_access.hpp"
#include "tt_reset/telemetry/telemetry_reader.hpp"
#include "tt_reset/utils/exceptions.hpp"

using namespace tt::reset;
using namespace tt::reset::test_utils;

class TelemetryReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto chip = make_chip(BDF, ChipFamily::WORMHOLE_B0);
        chip.arc_fw_version = "2.30.0.0";
        chip.eth_fw_version = "6.14.0";
        chip.refclk = 123'456;
        hardware.add_chip(chip);
        handle = hardware.init(DeviceId(BDF));
    }

    static constexpr const char* BDF = "0000:07:00.0";
    FakeHardwareAccess hardware;
    std::unique_ptr<ChipHandle> handle;
};

TEST_F(TelemetryReaderTest, ReadsVersionsAndRefclk) {
    auto snapshot = TelemetryReader(hardware).read(*handle);

    EXPECT_EQ(snapshot.device_id, DeviceId(BDF));
    EXPECT_EQ(snapshot.arc_fw_version, SemVer(2, 30, 0));
    ASSERT_TRUE(snapshot.eth_fw_version.has_value());
    EXPECT_EQ(*snapshot.eth_fw_version, SemVer(6, 14, 0));
    ASSERT_TRUE(snapshot.refclk.has_value());
    EXPECT_EQ(*snapshot.refclk, 123'456);
}

TEST_F(TelemetryReaderTest, ReadingIsRepeatable) {
    TelemetryReader reader(hardware);
    auto first = reader.read(*handle);
    auto second = reader.read(*handle);

    EXPECT_EQ(first.arc_fw_version, second.arc_fw_version);
    // The counter keeps running while the chip is up.
    EXPECT_GT(*second.refclk, *first.refclk);
    EXPECT_TRUE(handle->is_valid());
}

TEST_F(TelemetryReaderTest, GrayskullHasNoEthernetOrRefclk) {
    auto chip = make_chip("0000:08:00.0", ChipFamily::GRAYSKULL);
    chip.arc_fw_version = "1.7.0";
    hardware.add_chip(chip);
    auto gs_handle = hardware.init(DeviceId("0000:08:00.0"));

    auto snapshot = TelemetryReader(hardware).read(*gs_handle);
    EXPECT_EQ(snapshot.arc_fw_version, SemVer(1, 7, 0));
    EXPECT_FALSE(snapshot.eth_fw_version.has_value());
    EXPECT_FALSE(snapshot.refclk.has_value());
}

TEST_F(TelemetryReaderTest, InvalidVersions) {
    TelemetryReader reader(hardware);

    hardware.chip(BDF).arc_fw_version = "";
    EXPECT_THROW(reader.read(*handle), TelemetryUnavailableError);

    hardware.chip(BDF).arc_fw_version = "not-a-version";
    EXPECT_THROW(reader.read(*handle), TelemetryUnavailableError);

    // Firmware reports all zeroes while it is still booting.
    hardware.chip(BDF).arc_fw_version = "0.0.0.0";
    EXPECT_THROW(reader.read(*handle), TelemetryUnavailableError);

    hardware.chip(BDF).arc_fw_version = "2.30.0.0";
    hardware.chip(BDF).eth_fw_version = "6.x";
    EXPECT_THROW(reader.read(*handle), TelemetryUnavailableError);
}

TEST_F(TelemetryReaderTest, HangReadRefclk) {
    hardware.chip(BDF).refclk = std::numeric_limits<uint64_t>::max();
    hardware.chip(BDF).refclk_tick = 0;
    EXPECT_THROW(TelemetryReader(hardware).read(*handle), TelemetryUnavailableError);
}

TEST_F(TelemetryReaderTest, HardwareFailure) {
    hardware.chip(BDF).telemetry_fails = true;
    try {
        TelemetryReader(hardware).read(*handle);
        FAIL() << "Expected TelemetryUnavailableError";
    } catch (const TelemetryUnavailableError& e) {
        EXPECT_EQ(e.code(), ResetErrorCode::TELEMETRY_UNAVAILABLE);
    }
}

TEST_F(TelemetryReaderTest, StaleHandle) {
    hardware.reset(DeviceId(BDF), ResetMode::LINK);
    EXPECT_THROW(TelemetryReader(hardware).read(*handle), TelemetryUnavailableError);
    // The stale handle never reaches the hardware.
    EXPECT_TRUE(hardware.operations_matching({"telemetry "}).empty());
}
