// SPDX-FileCopyrightText: © 2024 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include "tt_reset/types/chip_state.hpp"
#include "tt_reset/types/device_id.hpp"

namespace tt::reset {

enum class ResetErrorCode {
    DRIVER_TOO_OLD,
    DRIVER_VERSION_UNPARSABLE,
    MALFORMED_CONFIG,
    CHIP_DEGRADED,
    CHIP_UNRECOVERABLE,
    TELEMETRY_UNAVAILABLE,
    REFCLK_REGRESSION,
    RESET_TIMEOUT,
    STALE_CHIP_HANDLE,
    HARDWARE_ACCESS_FAILED,
};

std::string reset_error_code_to_str(ResetErrorCode code);

/**
 * Base class of every error the reset flow reports on purpose. Internal invariant violations are reported
 * through TT_RESET_ASSERT/TT_RESET_THROW as std::runtime_error instead.
 */
class ResetError : public std::runtime_error {
public:
    ResetError(ResetErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {}

    ResetErrorCode code() const { return code_; }

private:
    ResetErrorCode code_;
};

class DriverTooOldError : public ResetError {
public:
    explicit DriverTooOldError(const std::string& message) : ResetError(ResetErrorCode::DRIVER_TOO_OLD, message) {}
};

class DriverVersionUnparsableError : public ResetError {
public:
    explicit DriverVersionUnparsableError(const std::string& message) :
        ResetError(ResetErrorCode::DRIVER_VERSION_UNPARSABLE, message) {}
};

/**
 * The reset config file exists but does not hold a valid config. Never replaced by defaults.
 */
class MalformedConfigError : public ResetError {
public:
    explicit MalformedConfigError(const std::string& message) :
        ResetError(ResetErrorCode::MALFORMED_CONFIG, message) {}
};

class TelemetryUnavailableError : public ResetError {
public:
    explicit TelemetryUnavailableError(const std::string& message) :
        ResetError(ResetErrorCode::TELEMETRY_UNAVAILABLE, message) {}
};

class ResetTimeoutError : public ResetError {
public:
    explicit ResetTimeoutError(const std::string& message) : ResetError(ResetErrorCode::RESET_TIMEOUT, message) {}
};

/**
 * A ChipHandle was used after the chip it refers to went through a reset.
 */
class StaleChipHandleError : public ResetError {
public:
    explicit StaleChipHandleError(const std::string& message) :
        ResetError(ResetErrorCode::STALE_CHIP_HANDLE, message) {}
};

class HardwareAccessError : public ResetError {
public:
    explicit HardwareAccessError(const std::string& message) :
        ResetError(ResetErrorCode::HARDWARE_ACCESS_FAILED, message) {}
};

/**
 * Thrown by HardwareAccess::init when a chip is visible but did not initialize.
 */
class ChipInitError : public ResetError {
public:
    ChipInitError(const DeviceId& device_id, ChipInitResult result, const std::string& message) :
        ResetError(
            chip_state_from_init_result(result, message).health == Health::UNRECOVERABLE
                ? ResetErrorCode::CHIP_UNRECOVERABLE
                : ResetErrorCode::CHIP_DEGRADED,
            message),
        device_id_(device_id),
        result_(result) {}

    const DeviceId& device_id() const { return device_id_; }

    ChipInitResult result() const { return result_; }

private:
    DeviceId device_id_;
    ChipInitResult result_;
};

}  // namespace tt::reset
