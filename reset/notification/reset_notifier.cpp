/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tt_reset/notification/reset_notifier.hpp"

#include <unistd.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <regex>
#include <string_view>
#include <thread>
#include <vector>

#include "logger.hpp"
#include "reset_asio.hpp"

namespace tt::reset {

namespace {

constexpr std::string_view PRE_RESET_MESSAGE = "PRE_RESET";
constexpr std::string_view POST_RESET_MESSAGE = "POST_RESET";

using LocalSocket = local_stream::socket;

std::atomic<bool> keep_monitoring{false};
std::mutex monitor_mutex;
std::weak_ptr<asio::io_context> weak_io;

std::vector<std::shared_ptr<LocalSocket>> get_connected_listeners(
    asio::io_context& io, const std::filesystem::path& listener_dir) {
    std::vector<std::shared_ptr<LocalSocket>> connected_sockets;

    std::error_code fs_ec;
    std::filesystem::directory_iterator it(listener_dir, fs_ec);
    if (fs_ec) {
        TT_RESET_DEBUG("Listener directory {} not readable: {}", listener_dir.string(), fs_ec.message());
        return connected_sockets;
    }

    const int my_pid = getpid();
    for (const auto& entry : it) {
        if (!entry.is_socket(fs_ec)) {
            continue;
        }

        const int target_pid = ResetNotifier::extract_pid_from_socket_name(entry.path().filename().string());
        if (target_pid == -1 || target_pid == my_pid) {
            continue;
        }

        auto sock = std::make_shared<LocalSocket>(io);
        error_code ec;
        sock->connect(local_stream::endpoint(entry.path().string()), ec);
        if (ec) {
            // Left behind by a process that exited without cleaning up.
            TT_RESET_DEBUG("Skipping stale listener {}: {}", entry.path().string(), ec.message());
            continue;
        }
        connected_sockets.push_back(sock);
    }
    return connected_sockets;
}

void send_to_all(const std::vector<std::shared_ptr<LocalSocket>>& sockets, std::string_view message) {
    for (const auto& sock : sockets) {
        asio::async_write(*sock, asio::buffer(message.data(), message.size()), [sock](const error_code& ec, size_t) {
            if (ec) {
                TT_RESET_WARN("Failed to notify a reset listener: {}", ec.message());
            }
        });
    }
}

void dispatch(
    std::string_view msg,
    const std::function<void()>& pre_reset_callback,
    const std::function<void()>& post_reset_callback) {
    if (msg.find(PRE_RESET_MESSAGE) != std::string_view::npos) {
        TT_RESET_INFO("Received pre-reset notification");
        if (pre_reset_callback) {
            pre_reset_callback();
        }
        return;
    }

    if (msg.find(POST_RESET_MESSAGE) != std::string_view::npos) {
        TT_RESET_INFO("Received post-reset notification");
        if (post_reset_callback) {
            post_reset_callback();
        }
        return;
    }

    TT_RESET_WARN("Unknown message received: {}", msg);
}

}  // namespace

int ResetNotifier::extract_pid_from_socket_name(const std::string& filename) {
    static const std::regex socket_name_regex("^client_([0-9]+)\\.sock$");
    std::smatch match;
    if (!std::regex_match(filename, match, socket_name_regex)) {
        return -1;
    }
    try {
        return std::stoi(match[1].str());
    } catch (const std::out_of_range&) {
        return -1;
    }
}

std::string ResetNotifier::socket_name_for_pid(int pid) { return "client_" + std::to_string(pid) + ".sock"; }

bool ResetNotifier::Monitor::start_monitoring(
    std::function<void()>&& pre_reset_callback,
    std::function<void()>&& post_reset_callback,
    const std::filesystem::path& listener_dir) {
    std::lock_guard<std::mutex> lock(monitor_mutex);
    if (keep_monitoring.exchange(true)) {
        TT_RESET_WARN("Reset monitoring is already running.");
        return false;
    }

    std::error_code fs_ec;
    std::filesystem::create_directories(listener_dir, fs_ec);
    std::filesystem::permissions(listener_dir, std::filesystem::perms::all, fs_ec);

    const std::filesystem::path socket_path = listener_dir / socket_name_for_pid(getpid());
    // Left over from a previous run of this process id.
    ::unlink(socket_path.c_str());

    auto io = std::make_shared<asio::io_context>();
    std::shared_ptr<local_stream::acceptor> acceptor;
    try {
        acceptor = std::make_shared<local_stream::acceptor>(*io, local_stream::endpoint(socket_path.string()));
    } catch (const system_error& e) {
        TT_RESET_ERROR("Failed to listen on {}: {}", socket_path.string(), e.what());
        keep_monitoring.store(false);
        return false;
    }

    // Listeners may run as a different user than the process doing the reset.
    std::filesystem::permissions(socket_path, std::filesystem::perms::all, fs_ec);
    weak_io = io;

    std::thread([io,
                 acceptor,
                 socket_path,
                 pre_reset_callback = std::move(pre_reset_callback),
                 post_reset_callback = std::move(post_reset_callback)]() {
        std::function<void()> do_accept;
        do_accept = [&]() {
            auto sock = std::make_shared<LocalSocket>(*io);
            acceptor->async_accept(*sock, [&, sock](const error_code& ec) {
                if (ec || !keep_monitoring) {
                    return;
                }
                auto buf = std::make_shared<std::vector<char>>(64);
                sock->async_read_some(asio::buffer(*buf), [&, sock, buf](const error_code& ec, size_t len) {
                    if (ec) {
                        return;
                    }
                    dispatch(std::string_view(buf->data(), len), pre_reset_callback, post_reset_callback);
                });
                do_accept();
            });
        };

        do_accept();
        io->run();

        ::unlink(socket_path.c_str());
        keep_monitoring.store(false);
    }).detach();

    return true;
}

void ResetNotifier::Monitor::stop_monitoring() {
    std::lock_guard<std::mutex> lock(monitor_mutex);
    keep_monitoring.store(false);
    if (auto io = weak_io.lock()) {
        io->stop();
    }
}

bool ResetNotifier::Monitor::is_monitoring() { return keep_monitoring.load(); }

size_t ResetNotifier::Notifier::notify_pre_reset(
    std::chrono::milliseconds timeout, const std::filesystem::path& listener_dir) {
    asio::io_context io;
    auto active_sockets = get_connected_listeners(io, listener_dir);
    if (active_sockets.empty()) {
        return 0;
    }

    TT_RESET_INFO("Sending PRE_RESET to {} listener(s)", active_sockets.size());
    send_to_all(active_sockets, PRE_RESET_MESSAGE);

    asio::steady_timer timer(io, timeout);
    timer.async_wait([&](const error_code& ec) {
        if (!ec) {
            TT_RESET_DEBUG("Listener grace period elapsed");
            io.stop();
        }
    });

    // Blocks until the grace period elapses.
    io.run();
    return active_sockets.size();
}

size_t ResetNotifier::Notifier::notify_post_reset(const std::filesystem::path& listener_dir) {
    asio::io_context io;
    auto active_sockets = get_connected_listeners(io, listener_dir);
    if (active_sockets.empty()) {
        return 0;
    }

    TT_RESET_INFO("Sending POST_RESET to {} listener(s)", active_sockets.size());
    send_to_all(active_sockets, POST_RESET_MESSAGE);

    // Blocks until all writes are done.
    io.run();
    return active_sockets.size();
}

}  // namespace tt::reset
