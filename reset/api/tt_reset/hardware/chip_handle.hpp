// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "tt_reset/types/chip_family.hpp"
#include "tt_reset/types/device_id.hpp"

namespace tt::reset {

/**
 * Per-device reset generation counters. Every reset of a device bumps its generation, which invalidates every
 * ChipHandle created before it.
 */
class ChipGenerationTracker {
public:
    uint64_t current(const DeviceId& device_id) const;

    // Returns the new generation.
    uint64_t advance(const DeviceId& device_id);

private:
    mutable std::mutex mutex_;
    std::map<DeviceId, uint64_t> generations_;
};

/**
 * Runtime handle to an initialized chip. Backends derive from it to own their low level resources (device file
 * descriptor, BAR mappings). A handle is only usable in the generation it was created in.
 */
class ChipHandle {
public:
    ChipHandle(DeviceId device_id, ChipFamily family, std::shared_ptr<const ChipGenerationTracker> tracker);
    virtual ~ChipHandle() = default;

    ChipHandle(const ChipHandle&) = delete;
    ChipHandle& operator=(const ChipHandle&) = delete;

    const DeviceId& device_id() const { return device_id_; }

    ChipFamily family() const { return family_; }

    uint64_t generation() const { return generation_; }

    // False once the chip went through a reset after this handle was created.
    bool is_valid() const;

    // Throws StaleChipHandleError if the handle is no longer valid.
    void ensure_valid() const;

private:
    DeviceId device_id_;
    ChipFamily family_;
    std::shared_ptr<const ChipGenerationTracker> tracker_;
    uint64_t generation_;
};

}  // namespace tt::reset
