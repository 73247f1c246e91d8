// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/engine/reset_state_machine.hpp"

#include "assert.hpp"
#include "logger.hpp"

namespace tt::reset {

std::string reset_state_to_str(ResetState state) {
    switch (state) {
        case ResetState::IDLE:
            return "Idle";
        case ResetState::DRIVER_CHECKED:
            return "DriverChecked";
        case ResetState::RESETTING:
            return "Resetting";
        case ResetState::AWAITING_REINIT:
            return "AwaitingReinit";
        case ResetState::VERIFYING:
            return "Verifying";
        case ResetState::DONE:
            return "Done";
    }
    return "Unknown";
}

ResetStateMachine::ResetStateMachine(DeviceId device_id, TransitionObserver observer) :
    device_id_(std::move(device_id)), observer_(std::move(observer)), history_{ResetState::IDLE} {}

bool ResetStateMachine::is_legal(ResetState from, ResetState to) {
    if (to == ResetState::DONE) {
        return from != ResetState::IDLE && from != ResetState::DONE;
    }
    switch (from) {
        case ResetState::IDLE:
            return to == ResetState::DRIVER_CHECKED;
        case ResetState::DRIVER_CHECKED:
            return to == ResetState::RESETTING;
        case ResetState::RESETTING:
            return to == ResetState::AWAITING_REINIT;
        case ResetState::AWAITING_REINIT:
            return to == ResetState::VERIFYING;
        default:
            return false;
    }
}

void ResetStateMachine::transition_to(ResetState next) {
    TT_RESET_ASSERT(
        is_legal(state_, next),
        "Illegal reset state transition for {}: {} -> {}",
        device_id_.str(),
        reset_state_to_str(state_),
        reset_state_to_str(next));

    ResetState previous = state_;
    state_ = next;
    history_.push_back(next);
    TT_RESET_TRACE("{}: {} -> {}", device_id_, previous, next);
    if (observer_) {
        observer_(device_id_, previous, next);
    }
}

void ResetStateMachine::finish(ResetResult result) {
    TT_RESET_ASSERT(
        result.device_id == device_id_, "Result for {} recorded on {}", result.device_id.str(), device_id_.str());
    transition_to(ResetState::DONE);
    result_ = std::move(result);
}

}  // namespace tt::reset
