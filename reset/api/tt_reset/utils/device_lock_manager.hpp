/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <boost/interprocess/sync/file_lock.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "tt_reset/types/device_id.hpp"

namespace tt::reset {

/**
 * Exclusive ownership of one device for the duration of a reset, across threads and processes.
 * Released on destruction.
 */
class DeviceLock {
public:
    DeviceLock(
        DeviceId device_id, std::unique_lock<std::mutex> thread_lock, boost::interprocess::file_lock file_lock);
    ~DeviceLock();

    DeviceLock(const DeviceLock&) = delete;
    DeviceLock& operator=(const DeviceLock&) = delete;

    const DeviceId& device_id() const { return device_id_; }

private:
    DeviceId device_id_;
    std::unique_lock<std::mutex> thread_lock_;
    boost::interprocess::file_lock file_lock_;
};

/**
 * Hands out DeviceLocks. A lock is a file lock on <lock_dir>/<bdf>.lock, guarded by a mutex per device since file
 * locks do not exclude threads of the same process.
 */
class DeviceLockManager {
public:
    static constexpr const char* DEFAULT_LOCK_DIR = "/tmp/tt_reset_locks";

    explicit DeviceLockManager(std::filesystem::path lock_dir = DEFAULT_LOCK_DIR);

    // Blocks until the device is free.
    std::unique_ptr<DeviceLock> acquire(const DeviceId& device_id) const;

    // Locks every device, always in DeviceId order so that two callers with overlapping sets cannot deadlock.
    std::vector<std::unique_ptr<DeviceLock>> acquire_all(std::vector<DeviceId> device_ids) const;

    // Returns nullptr if the device is held by someone else.
    std::unique_ptr<DeviceLock> try_acquire(const DeviceId& device_id) const;

    const std::filesystem::path& lock_dir() const { return lock_dir_; }

private:
    std::filesystem::path lock_file_path(const DeviceId& device_id) const;

    boost::interprocess::file_lock open_lock_file(const DeviceId& device_id) const;

    static std::mutex& thread_mutex(const DeviceId& device_id);

    std::filesystem::path lock_dir_;
};

}  // namespace tt::reset
