// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/hardware/mobo_client.hpp"

#include <fmt/format.h>
#include <httplib.h>

#include <thread>

#include "logger.hpp"
#include "tt_reset/utils/exceptions.hpp"

namespace tt::reset {

MoboClient::MoboClient(
    std::string host,
    uint16_t port,
    std::string user,
    std::string password,
    std::chrono::milliseconds request_timeout) :
    host_(std::move(host)),
    port_(port),
    user_(std::move(user)),
    password_(std::move(password)),
    request_timeout_(request_timeout) {}

nlohmann::json MoboClient::check_response(
    const std::string& host, const std::string& command, const HttpResponse& response, bool check_error) {
    nlohmann::json response_json = nlohmann::json::object();
    // shutdown/modules and boot/modules answer a success with an empty body.
    if (!response.body.empty()) {
        try {
            response_json = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw HardwareAccessError(
                fmt::format("{} request {} failed with unexpected response {}", host, command, response.body));
        }
    }

    if (!check_error) {
        return response_json;
    }

    if (response_json.is_object() && response_json.contains("error")) {
        throw HardwareAccessError(
            fmt::format("{} request {} returned with error {}", host, command, response_json["error"].dump()));
    }
    if (response_json.is_object() && response_json.contains("exception") && !response_json["exception"].is_null()) {
        throw HardwareAccessError(fmt::format(
            "{} request {} returned with exception {}", host, command, response_json["exception"].dump()));
    }
    if (response.status >= 400) {
        throw HardwareAccessError(fmt::format(
            "{} request {} failed with HTTP error {}, response {}", host, command, response.status, response.body));
    }
    return response_json;
}

nlohmann::json MoboClient::make_boot_request_body(const GalaxyBoard& board, const SemVer& server_version) {
    nlohmann::json body = {
        {"groups", nullptr},
        {"credo", true},
        {"retimer_sel", board.credo_ports},
    };
    if (server_version >= SemVer(DISABLE_PORTS_MIN_SERVER_VERSION)) {
        body["disable_sel"] = board.disabled_ports;
    } else if (!board.disabled_ports.empty()) {
        TT_RESET_WARN(
            "Port disable is only available for server version {} and above, ignoring disabled ports for {}",
            DISABLE_PORTS_MIN_SERVER_VERSION,
            board.mobo);
    }
    return body;
}

HttpResponse MoboClient::send(
    const std::string& method, const std::string& command, const std::optional<nlohmann::json>& body) {
    httplib::Client client(host_, port_);
    client.set_basic_auth(user_, password_);
    client.set_connection_timeout(request_timeout_);
    client.set_read_timeout(request_timeout_);
    client.set_write_timeout(request_timeout_);

    if (method != "GET" && method != "POST") {
        throw HardwareAccessError(fmt::format("Unsupported request method {} for {}", method, command));
    }

    const std::string path = "/" + command;
    const httplib::Headers headers = {{"Accept", "application/json"}};
    httplib::Result result = method == "POST" ? client.Post(
                                                    path,
                                                    headers,
                                                    body.has_value() ? body->dump() : std::string(),
                                                    "application/json")
                                              : client.Get(path, headers);
    if (!result) {
        throw HardwareAccessError(
            fmt::format("{} request {} failed: {}", host_, command, httplib::to_string(result.error())));
    }
    return HttpResponse{result->status, result->body};
}

nlohmann::json MoboClient::request(
    const std::string& method,
    const std::string& command,
    const std::optional<nlohmann::json>& body,
    bool check_error) {
    TT_RESET_DEBUG("{} - {} /{}", host_, method, command);
    return check_response(host_, command, send(method, command, body), check_error);
}

SemVer MoboClient::get_server_version() {
    try {
        auto response = request("GET", "about");
        return SemVer(response.at("version").get<std::string>());
    } catch (const std::exception& e) {
        TT_RESET_DEBUG("{} - could not read server version, assuming 0.0.0: {}", host_, e.what());
        return SemVer(0, 0, 0);
    }
}

void MoboClient::credo_boot(const GalaxyBoard& board) {
    if (board.credo_ports.empty()) {
        TT_RESET_INFO("{} - No credos to be booted, moving on ...", host_);
        return;
    }

    auto body = make_boot_request_body(board, get_server_version());
    TT_RESET_INFO("{} - Booting credo ...", host_);
    request("POST", "boot", body);
}

void MoboClient::wait_for_boot_complete(std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval) {
    const SemVer server_version = get_server_version();
    if (server_version < SemVer(BOOT_PROGRESS_MIN_SERVER_VERSION)) {
        return;
    }
    const bool verbose_progress = server_version >= SemVer(DISABLE_PORTS_MIN_SERVER_VERSION);

    const auto start = std::chrono::steady_clock::now();
    double boot_progress = 0.0;
    while (boot_progress < 100.0) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            throw ResetTimeoutError(
                fmt::format("{} - Boot timeout, please power cycle the galaxy and try boot again", host_));
        }

        auto response = request("GET", "boot/progress");
        const auto& percent = response.at("boot_percent");
        boot_progress = percent.is_string() ? std::stod(percent.get<std::string>()) : percent.get<double>();

        std::string extra_info;
        if (verbose_progress && response.contains("step") && response["step"].is_string()) {
            extra_info = fmt::format(" ({})", response["step"].get<std::string>());
        }
        TT_RESET_INFO("{} - Waiting for server boot to complete... {:6.2f}%{}", host_, boot_progress, extra_info);

        if (boot_progress < 100.0) {
            std::this_thread::sleep_for(poll_interval);
        }
    }
}

void MoboClient::shutdown_modules() {
    TT_RESET_INFO("{} - Turning off modules ...", host_);
    request("POST", "shutdown/modules", nlohmann::json{{"groups", nullptr}}, false);
}

void MoboClient::boot_modules() {
    TT_RESET_INFO("{} - Turning on modules ...", host_);
    request("POST", "boot/modules", nlohmann::json{{"groups", nullptr}});
}

void MoboClient::powercycle(const GalaxyBoard& board) {
    credo_boot(board);
    wait_for_boot_complete();
    shutdown_modules();
    boot_modules();
}

}  // namespace tt::reset
