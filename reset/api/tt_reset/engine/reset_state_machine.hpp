// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "tt_reset/types/device_id.hpp"
#include "tt_reset/types/reset_result.hpp"

namespace tt::reset {

enum class ResetState {
    IDLE,
    DRIVER_CHECKED,
    RESETTING,
    AWAITING_REINIT,
    VERIFYING,
    DONE,
};

std::string reset_state_to_str(ResetState state);

using TransitionObserver = std::function<void(const DeviceId&, ResetState from, ResetState to)>;

/**
 * Reset progress of one device:
 *
 *   IDLE -> DRIVER_CHECKED -> RESETTING -> AWAITING_REINIT -> VERIFYING -> DONE
 *
 * Any state past IDLE may also go straight to DONE when the device fails. Other transitions are
 * programming errors and throw.
 */
class ResetStateMachine {
public:
    explicit ResetStateMachine(DeviceId device_id, TransitionObserver observer = nullptr);

    void transition_to(ResetState next);

    // Moves to DONE and records the final result.
    void finish(ResetResult result);

    const DeviceId& device_id() const { return device_id_; }

    ResetState state() const { return state_; }

    bool is_done() const { return state_ == ResetState::DONE; }

    const std::vector<ResetState>& history() const { return history_; }

    // Set once the machine is DONE.
    const std::optional<ResetResult>& result() const { return result_; }

    static bool is_legal(ResetState from, ResetState to);

private:
    DeviceId device_id_;
    TransitionObserver observer_;
    ResetState state_ = ResetState::IDLE;
    std::vector<ResetState> history_;
    std::optional<ResetResult> result_;
};

}  // namespace tt::reset

namespace fmt {
template <>
struct formatter<tt::reset::ResetState> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::ResetState const& state, Context& ctx) const {
        return formatter<std::string>::format(tt::reset::reset_state_to_str(state), ctx);
    }
};
}  // namespace fmt
