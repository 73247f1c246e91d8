// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "tt_reset/config/reset_config.hpp"
#include "tt_reset/utils/semver.hpp"
#include "tt_reset/utils/timeouts.hpp"

namespace tt::reset {

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * Client for the management server running on a Galaxy motherboard. Commands are plain HTTP on port 8000 with
 * basic auth, JSON in both directions. One connection per request, through cpp-httplib.
 *
 * A response reports failure through an "error" key, or a non-null "exception" key for boot/progress. An empty
 * body is a success.
 */
class MoboClient {
public:
    static constexpr uint16_t DEFAULT_PORT = 8000;

    explicit MoboClient(
        std::string host,
        uint16_t port = DEFAULT_PORT,
        std::string user = "admin",
        std::string password = "admin",
        std::chrono::milliseconds request_timeout = timeout::MOBO_REQUEST_TIMEOUT);
    virtual ~MoboClient() = default;

    const std::string& host() const { return host_; }

    // Older servers have no about endpoint, they are reported as 0.0.0.
    SemVer get_server_version();

    // Boots the retimers listed in board.credo_ports. Does nothing if there are none.
    void credo_boot(const GalaxyBoard& board);

    // Polls boot progress until it reaches 100%. Servers older than 0.3.0 boot synchronously and are not polled.
    void wait_for_boot_complete(
        std::chrono::milliseconds timeout = timeout::MOBO_BOOT_TIMEOUT,
        std::chrono::milliseconds poll_interval = timeout::MOBO_BOOT_POLL_INTERVAL);

    // Errors are ignored, modules that are already off report one.
    void shutdown_modules();

    void boot_modules();

    // Credo boot, wait for the boot to finish, modules off, modules on.
    void powercycle(const GalaxyBoard& board);

    // Decodes the response body and checks it for a reported error. With check_error false only undecodable
    // bodies are errors.
    static nlohmann::json check_response(
        const std::string& host, const std::string& command, const HttpResponse& response, bool check_error = true);

    static nlohmann::json make_boot_request_body(const GalaxyBoard& board, const SemVer& server_version);

    static constexpr auto DISABLE_PORTS_MIN_SERVER_VERSION = "1.3.2";
    static constexpr auto BOOT_PROGRESS_MIN_SERVER_VERSION = "0.3.0";

protected:
    // Sends one GET or POST request. Throws HardwareAccessError on transport failures.
    virtual HttpResponse send(
        const std::string& method, const std::string& command, const std::optional<nlohmann::json>& body);

private:
    nlohmann::json request(
        const std::string& method,
        const std::string& command,
        const std::optional<nlohmann::json>& body = std::nullopt,
        bool check_error = true);

    std::string host_;
    uint16_t port_;
    std::string user_;
    std::string password_;
    std::chrono::milliseconds request_timeout_;
};

}  // namespace tt::reset
