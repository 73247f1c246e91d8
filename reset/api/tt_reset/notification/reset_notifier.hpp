/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

#include "tt_reset/utils/timeouts.hpp"

namespace tt::reset {

/**
 * Lets other processes using the chips know that a reset is about to happen, and that it is over.
 *
 * Every interested process runs a Monitor, which listens on a UNIX socket named client_<pid>.sock in the
 * listener directory. The Notifier connects to every such socket except its own and sends "PRE_RESET" or
 * "POST_RESET".
 */
class ResetNotifier {
public:
    static constexpr const char* DEFAULT_LISTENER_DIR = "/tmp/tt_reset_listeners";

    struct Monitor {
        // Starts a background listener. Returns false if one is already running in this process.
        static bool start_monitoring(
            std::function<void()>&& pre_reset_callback,
            std::function<void()>&& post_reset_callback,
            const std::filesystem::path& listener_dir = DEFAULT_LISTENER_DIR);

        static void stop_monitoring();

        static bool is_monitoring();
    };

    struct Notifier {
        // Sends PRE_RESET to every listener and then gives them timeout to clean up. Returns the number of
        // listeners reached.
        static size_t notify_pre_reset(
            std::chrono::milliseconds timeout = timeout::NOTIFICATION_GRACE_PERIOD,
            const std::filesystem::path& listener_dir = DEFAULT_LISTENER_DIR);

        static size_t notify_post_reset(const std::filesystem::path& listener_dir = DEFAULT_LISTENER_DIR);
    };

    // PID encoded in a client_<pid>.sock file name, -1 if the name does not follow that pattern.
    static int extract_pid_from_socket_name(const std::string& filename);

    static std::string socket_name_for_pid(int pid);
};

}  // namespace tt::reset
