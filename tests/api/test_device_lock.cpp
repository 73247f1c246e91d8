// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

#include "test_utils/process_sync.hpp"
#include "tt_reset/utils/device_lock_manager.hpp"

using namespace tt::reset;

class DeviceLockTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string tmpl = (std::filesystem::temp_directory_path() / "tt_reset_locks_XXXXXX").string();
        ASSERT_NE(mkdtemp(tmpl.data()), nullptr);
        lock_dir = tmpl;
    }

    void TearDown() override { std::filesystem::remove_all(lock_dir); }

    std::filesystem::path lock_dir;
};

TEST_F(DeviceLockTest, TryAcquireWhileHeld) {
    DeviceLockManager manager(lock_dir);
    const DeviceId device_id("0000:04:00.0");

    auto lock = manager.try_acquire(device_id);
    ASSERT_NE(lock, nullptr);
    EXPECT_EQ(lock->device_id(), device_id);
    EXPECT_TRUE(std::filesystem::exists(lock_dir / "0000_04_00.0.lock"));

    // Held by this thread; another thread cannot take it.
    std::unique_ptr<DeviceLock> contender;
    std::thread([&]() { contender = manager.try_acquire(device_id); }).join();
    EXPECT_EQ(contender, nullptr);

    // Other devices are independent.
    EXPECT_NE(manager.try_acquire(DeviceId("0000:05:00.0")), nullptr);

    lock.reset();
    EXPECT_NE(manager.try_acquire(device_id), nullptr);
}

TEST_F(DeviceLockTest, AcquireBlocksUntilReleased) {
    DeviceLockManager manager(lock_dir);
    const DeviceId device_id("0000:04:00.0");

    auto lock = manager.acquire(device_id);
    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto second = manager.acquire(device_id);
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());
    lock.reset();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST_F(DeviceLockTest, AcquireAllIsOrderedAndDeduplicated) {
    DeviceLockManager manager(lock_dir);
    auto locks = manager.acquire_all(
        {DeviceId("0000:41:00.0"), DeviceId("0000:04:00.0"), DeviceId("0000:41:00.0"), DeviceId("0000:05:00.0")});

    ASSERT_EQ(locks.size(), 3);
    EXPECT_EQ(locks[0]->device_id(), DeviceId("0000:04:00.0"));
    EXPECT_EQ(locks[1]->device_id(), DeviceId("0000:05:00.0"));
    EXPECT_EQ(locks[2]->device_id(), DeviceId("0000:41:00.0"));
}

TEST_F(DeviceLockTest, CreatesLockDirectory) {
    DeviceLockManager manager(lock_dir / "nested" / "locks");
    EXPECT_NE(manager.acquire(DeviceId("0000:04:00.0")), nullptr);
    EXPECT_TRUE(std::filesystem::exists(lock_dir / "nested" / "locks" / "0000_04_00.0.lock"));
}

TEST_F(DeviceLockTest, ExcludesOtherProcesses) {
    const DeviceId device_id("0000:04:00.0");
    test_utils::ChildReadySignal ready;

    pid_t pid = fork();
    if (pid == 0) {
        DeviceLockManager child_manager(lock_dir);
        auto lock = child_manager.acquire(device_id);
        ready.notify_parent();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        _exit(0);
    }
    ASSERT_GT(pid, 0);
    ASSERT_TRUE(ready.wait_for_child());

    DeviceLockManager manager(lock_dir);
    EXPECT_EQ(manager.try_acquire(device_id), nullptr);

    // Blocks until the child exits and its lock goes with it.
    auto lock = manager.acquire(device_id);
    EXPECT_NE(lock, nullptr);

    int status;
    waitpid(pid, &status, 0);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
