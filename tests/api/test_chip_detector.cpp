// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "test_utils/fake_hardware_access.hpp"
#include "tt_reset/detection/chip_detector.hpp"

using namespace tt::reset;
using namespace tt::reset::test_utils;

class ChipDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        hardware.add_chip(make_chip("0000:01:00.0", ChipFamily::WORMHOLE_B0, 0));

        auto hung = make_chip("0000:02:00.0", ChipFamily::WORMHOLE_B0, 1);
        hung.init_results = {ChipInitResult::HANG_READ};
        hardware.add_chip(hung);

        hardware.add_chip(make_chip("0000:03:00.0", ChipFamily::BLACKHOLE, 2));
    }

    FakeHardwareAccess hardware;
};

TEST_F(ChipDetectorTest, FailingChipDoesNotAbortDetection) {
    ChipDetector detector(hardware);
    auto detections = detector.detect_all();

    ASSERT_EQ(detections.size(), 3);
    EXPECT_EQ(detections[0].device_id, DeviceId("0000:01:00.0"));
    EXPECT_TRUE(detections[0].state.is_healthy());
    ASSERT_NE(detections[0].handle, nullptr);
    EXPECT_TRUE(detections[0].handle->is_valid());

    EXPECT_EQ(detections[1].state.health, Health::UNRECOVERABLE);
    EXPECT_EQ(detections[1].handle, nullptr);

    EXPECT_TRUE(detections[2].state.is_healthy());
    EXPECT_EQ(detections[2].family, ChipFamily::BLACKHOLE);
}

TEST_F(ChipDetectorTest, ClassifiesInitFailures) {
    hardware.chip("0000:01:00.0").init_results = {ChipInitResult::ARC_STARTUP_FAILED};
    hardware.chip("0000:03:00.0").init_results = {ChipInitResult::DEVICE_UNAVAILABLE};

    auto detections = ChipDetector(hardware).detect_all();
    ASSERT_EQ(detections.size(), 3);
    EXPECT_EQ(detections[0].state.health, Health::DEGRADED);
    EXPECT_NE(detections[0].state.reason.find("ARC"), std::string::npos);
    EXPECT_EQ(detections[2].state.health, Health::UNRECOVERABLE);
}

TEST_F(ChipDetectorTest, ProgressCallback) {
    std::vector<std::string> lines;
    ChipDetector(hardware).detect_all([&](const std::string& line) { lines.push_back(line); });

    ASSERT_EQ(lines.size(), 3);
    EXPECT_NE(lines[0].find("0000:01:00.0"), std::string::npos);
    EXPECT_NE(lines[1].find("0000:02:00.0"), std::string::npos);
}

TEST_F(ChipDetectorTest, ThrowingCallbackIsContained) {
    int calls = 0;
    auto detections = ChipDetector(hardware).detect_all([&](const std::string&) {
        calls++;
        throw std::runtime_error("display went away");
    });
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(detections.size(), 3);
}

TEST_F(ChipDetectorTest, NullCallback) {
    EXPECT_EQ(ChipDetector(hardware).detect_all(nullptr).size(), 3);
}

TEST_F(ChipDetectorTest, MissingExpectedChipIsUnrecoverable) {
    hardware.chip("0000:03:00.0").present = false;

    std::vector<DeviceInfo> expected = {
        hardware.chip("0000:03:00.0").info,
        hardware.chip("0000:01:00.0").info,
    };
    auto detections = ChipDetector(hardware).detect(expected);

    ASSERT_EQ(detections.size(), 2);
    EXPECT_EQ(detections[0].device_id, DeviceId("0000:03:00.0"));
    EXPECT_EQ(detections[0].state.health, Health::UNRECOVERABLE);
    EXPECT_EQ(detections[1].device_id, DeviceId("0000:01:00.0"));
    EXPECT_TRUE(detections[1].state.is_healthy());
    // Only the chip that is still on the bus is brought up.
    EXPECT_EQ(hardware.init_count("0000:03:00.0"), 0);
}

TEST(ChipDetector, NoChips) {
    FakeHardwareAccess hardware;
    EXPECT_TRUE(ChipDetector(hardware).detect_all().empty());
}
