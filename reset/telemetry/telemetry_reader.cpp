// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/telemetry/telemetry_reader.hpp"

#include <fmt/format.h>

#include <limits>
#include <stdexcept>

#include "logger.hpp"
#include "tt_reset/utils/exceptions.hpp"

namespace tt::reset {

// Value read back from a chip that dropped off the bus.
static constexpr uint64_t HANG_READ_VALUE_64 = std::numeric_limits<uint64_t>::max();

static SemVer parse_fw_version(const DeviceId& device_id, const std::string& name, const std::string& raw) {
    SemVer version;
    try {
        version = SemVer::from_firmware_string(raw);
    } catch (const std::invalid_argument& e) {
        throw TelemetryUnavailableError(
            fmt::format("{}: {} firmware version '{}' is invalid: {}", device_id, name, raw, e.what()));
    }
    if (version == SemVer()) {
        throw TelemetryUnavailableError(fmt::format("{}: {} firmware version is not reported", device_id, name));
    }
    return version;
}

TelemetrySnapshot TelemetryReader::read(const ChipHandle& handle) {
    try {
        handle.ensure_valid();
    } catch (const StaleChipHandleError& e) {
        throw TelemetryUnavailableError(e.what());
    }

    const DeviceId& device_id = handle.device_id();
    RawTelemetry raw;
    try {
        raw = hardware_.read_telemetry(device_id);
    } catch (const TelemetryUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw TelemetryUnavailableError(fmt::format("{}: reading telemetry failed: {}", device_id, e.what()));
    }

    if (raw.arc_fw_version.empty()) {
        throw TelemetryUnavailableError(fmt::format("{}: ARC firmware version is not reported", device_id));
    }

    TelemetrySnapshot snapshot{
        device_id,
        parse_fw_version(device_id, "ARC", raw.arc_fw_version),
        std::nullopt,
        std::nullopt,
        std::chrono::system_clock::now()};

    if (!raw.eth_fw_version.empty()) {
        snapshot.eth_fw_version = parse_fw_version(device_id, "ETH", raw.eth_fw_version);
    }

    if (raw.refclk.has_value()) {
        if (*raw.refclk == HANG_READ_VALUE_64) {
            throw TelemetryUnavailableError(fmt::format("{}: refclk read returned the hang value", device_id));
        }
        snapshot.refclk = raw.refclk;
    }

    TT_RESET_TRACE(
        "{}: ARC fw {}, ETH fw {}, refclk {}",
        device_id,
        snapshot.arc_fw_version,
        snapshot.eth_fw_version.has_value() ? snapshot.eth_fw_version->to_string() : "n/a",
        snapshot.refclk.has_value() ? std::to_string(*snapshot.refclk) : "n/a");
    return snapshot;
}

}  // namespace tt::reset
