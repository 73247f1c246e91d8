/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */
#include "tt_reset/utils/device_lock_manager.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <boost/interprocess/exceptions.hpp>
#include <cerrno>
#include <cstring>
#include <map>

#include "logger.hpp"
#include "tt_reset/utils/exceptions.hpp"

namespace tt::reset {

DeviceLock::DeviceLock(
    DeviceId device_id, std::unique_lock<std::mutex> thread_lock, boost::interprocess::file_lock file_lock) :
    device_id_(std::move(device_id)), thread_lock_(std::move(thread_lock)), file_lock_(std::move(file_lock)) {}

DeviceLock::~DeviceLock() {
    try {
        file_lock_.unlock();
    } catch (const boost::interprocess::interprocess_exception& e) {
        TT_RESET_WARN("Failed to release lock on {}: {}", device_id_, e.what());
    }
    TT_RESET_TRACE("Released lock on {}", device_id_);
}

DeviceLockManager::DeviceLockManager(std::filesystem::path lock_dir) : lock_dir_(std::move(lock_dir)) {}

std::mutex& DeviceLockManager::thread_mutex(const DeviceId& device_id) {
    static std::mutex registry_mutex;
    static std::map<DeviceId, std::unique_ptr<std::mutex>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& mutex = registry[device_id];
    if (!mutex) {
        mutex = std::make_unique<std::mutex>();
    }
    return *mutex;
}

std::filesystem::path DeviceLockManager::lock_file_path(const DeviceId& device_id) const {
    std::string name = device_id.str();
    std::replace(name.begin(), name.end(), ':', '_');
    return lock_dir_ / (name + ".lock");
}

boost::interprocess::file_lock DeviceLockManager::open_lock_file(const DeviceId& device_id) const {
    std::error_code ec;
    std::filesystem::create_directories(lock_dir_, ec);
    if (ec) {
        throw HardwareAccessError(
            fmt::format("Failed to create lock directory {}: {}", lock_dir_.string(), ec.message()));
    }
    // Other users must be able to lock the same devices.
    std::filesystem::permissions(lock_dir_, std::filesystem::perms::all, ec);

    const auto path = lock_file_path(device_id);
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR, 0666);
    if (fd < 0) {
        throw HardwareAccessError(fmt::format("Failed to create lock file {}: {}", path.string(), strerror(errno)));
    }
    ::fchmod(fd, 0666);
    ::close(fd);

    try {
        return boost::interprocess::file_lock(path.c_str());
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw HardwareAccessError(fmt::format("Failed to open lock file {}: {}", path.string(), e.what()));
    }
}

std::unique_ptr<DeviceLock> DeviceLockManager::acquire(const DeviceId& device_id) const {
    std::unique_lock<std::mutex> thread_lock(thread_mutex(device_id));
    auto file_lock = open_lock_file(device_id);
    if (!file_lock.try_lock()) {
        TT_RESET_INFO("Device {} is locked by another process, waiting", device_id);
        file_lock.lock();
    }
    TT_RESET_TRACE("Acquired lock on {}", device_id);
    return std::make_unique<DeviceLock>(device_id, std::move(thread_lock), std::move(file_lock));
}

std::vector<std::unique_ptr<DeviceLock>> DeviceLockManager::acquire_all(std::vector<DeviceId> device_ids) const {
    std::sort(device_ids.begin(), device_ids.end());
    device_ids.erase(std::unique(device_ids.begin(), device_ids.end()), device_ids.end());

    std::vector<std::unique_ptr<DeviceLock>> locks;
    for (const auto& device_id : device_ids) {
        locks.push_back(acquire(device_id));
    }
    return locks;
}

std::unique_ptr<DeviceLock> DeviceLockManager::try_acquire(const DeviceId& device_id) const {
    std::unique_lock<std::mutex> thread_lock(thread_mutex(device_id), std::try_to_lock);
    if (!thread_lock.owns_lock()) {
        return nullptr;
    }
    auto file_lock = open_lock_file(device_id);
    if (!file_lock.try_lock()) {
        return nullptr;
    }
    return std::make_unique<DeviceLock>(device_id, std::move(thread_lock), std::move(file_lock));
}

}  // namespace tt::reset
