// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/hardware/chip_handle.hpp"

#include <fmt/format.h>

#include "tt_reset/hardware/hardware_access.hpp"
#include "tt_reset/utils/exceptions.hpp"
#include "utils.hpp"

namespace tt::reset {

uint64_t ChipGenerationTracker::current(const DeviceId& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(device_id);
    return it == generations_.end() ? 0 : it->second;
}

uint64_t ChipGenerationTracker::advance(const DeviceId& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++generations_[device_id];
}

ChipHandle::ChipHandle(DeviceId device_id, ChipFamily family, std::shared_ptr<const ChipGenerationTracker> tracker) :
    device_id_(std::move(device_id)),
    family_(family),
    tracker_(std::move(tracker)),
    generation_(tracker_->current(device_id_)) {}

bool ChipHandle::is_valid() const { return tracker_->current(device_id_) == generation_; }

void ChipHandle::ensure_valid() const {
    if (!is_valid()) {
        throw StaleChipHandleError(fmt::format(
            "Handle to {} is from generation {} but the chip has been reset since (generation {})",
            device_id_,
            generation_,
            tracker_->current(device_id_)));
    }
}

std::string reset_mode_to_str(ResetMode mode) {
    switch (mode) {
        case ResetMode::TENSIX:
            return "tensix";
        case ResetMode::LINK:
            return "link";
        case ResetMode::ASIC:
            return "asic";
        case ResetMode::ASIC_M3:
            return "asic_m3";
    }
    return "unknown";
}

HardwareAccess::HardwareAccess() : generations_(std::make_shared<ChipGenerationTracker>()) {}

void HardwareAccess::reset(const DeviceId& device_id, ResetMode mode) {
    invalidate_handles(device_id);
    do_reset(device_id, mode);
}

bool HardwareAccess::is_arm_host() const { return is_arm_platform(); }

void HardwareAccess::invalidate_handles(const DeviceId& device_id) { generations_->advance(device_id); }

std::unique_ptr<ChipHandle> HardwareAccess::make_handle(const DeviceId& device_id, ChipFamily family) const {
    return std::make_unique<ChipHandle>(device_id, family, generations_);
}

}  // namespace tt::reset
