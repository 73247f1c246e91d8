// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/detection/chip_detector.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>

#include "logger.hpp"
#include "tt_reset/utils/exceptions.hpp"

namespace tt::reset {

ChipDetection ChipDetector::detect_one(const DeviceInfo& device) {
    ChipDetection detection{device.device_id, device.family, ChipState::healthy(), nullptr};
    try {
        detection.handle = hardware_.init(device.device_id);
    } catch (const ChipInitError& e) {
        detection.state = chip_state_from_init_result(e.result(), e.what());
    } catch (const std::exception& e) {
        detection.state = ChipState::degraded(e.what());
    }

    if (!detection.state.is_healthy()) {
        TT_RESET_WARN("Chip {} ({}) is {}", device.device_id, device.family, detection.state);
    }
    return detection;
}

void ChipDetector::report(const ProgressCallback& progress, const ChipDetection& detection) {
    if (!progress) {
        return;
    }
    try {
        progress(fmt::format("{} ({}): {}", detection.device_id, detection.family, detection.state));
    } catch (const std::exception& e) {
        TT_RESET_WARN("Detection progress callback failed: {}", e.what());
    }
}

std::vector<ChipDetection> ChipDetector::detect_all(const ProgressCallback& progress) {
    std::vector<ChipDetection> detections;
    for (const auto& device : hardware_.enumerate()) {
        detections.push_back(detect_one(device));
        report(progress, detections.back());
    }
    TT_RESET_DEBUG("Detected {} chip(s)", detections.size());
    return detections;
}

std::vector<ChipDetection> ChipDetector::detect(
    const std::vector<DeviceInfo>& expected, const ProgressCallback& progress) {
    std::map<DeviceId, DeviceInfo> present;
    for (const auto& device : hardware_.enumerate()) {
        present.emplace(device.device_id, device);
    }

    std::vector<ChipDetection> detections;
    for (const auto& device : expected) {
        auto it = present.find(device.device_id);
        if (it == present.end()) {
            detections.push_back(ChipDetection{
                device.device_id, device.family, ChipState::unrecoverable("not found on the PCI bus"), nullptr});
        } else {
            detections.push_back(detect_one(it->second));
        }
        report(progress, detections.back());
    }
    return detections;
}

}  // namespace tt::reset
