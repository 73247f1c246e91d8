/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace tt::reset::timeout {
inline constexpr auto ARC_MESSAGE_TIMEOUT = std::chrono::milliseconds(1'000);
inline constexpr auto ARC_STARTUP_TIMEOUT = std::chrono::milliseconds(1'000);
inline constexpr auto ARC_STATE3_PROPAGATION_WAIT = std::chrono::milliseconds(30);

// Fixed wait between issuing a reset and touching the chip again.
inline constexpr auto POST_RESET_WAIT = std::chrono::milliseconds(2'000);
// Arch agnostic reset waits 0.4 s per chip, never less than POST_RESET_WAIT.
inline constexpr auto POST_RESET_WAIT_PER_DEVICE = std::chrono::milliseconds(400);
inline constexpr auto M3_RESET_WAIT = std::chrono::milliseconds(20'000);
// Upper bound for a board management firmware self upgrade triggered by an m3 reset.
inline constexpr auto BMFW_UPGRADE_WAIT = std::chrono::milliseconds(60'000);

inline constexpr auto DEVICE_REAPPEAR_TIMEOUT = std::chrono::milliseconds(10'000);
inline constexpr auto DEVICE_REAPPEAR_POLL_INTERVAL = std::chrono::milliseconds(100);
inline constexpr auto BH_CONFIG_RESET_TIMEOUT = std::chrono::milliseconds(2'000);

inline constexpr int REDETECT_ATTEMPTS = 5;
inline constexpr auto REDETECT_BACKOFF = std::chrono::milliseconds(1'000);

inline constexpr auto NOTIFICATION_GRACE_PERIOD = std::chrono::milliseconds(1'000);

inline constexpr auto MOBO_REQUEST_TIMEOUT = std::chrono::milliseconds(30'000);
inline constexpr auto MOBO_BOOT_TIMEOUT = std::chrono::milliseconds(600'000);
inline constexpr auto MOBO_BOOT_POLL_INTERVAL = std::chrono::milliseconds(1'000);
}  // namespace tt::reset::timeout
