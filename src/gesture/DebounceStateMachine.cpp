/**
 * @file DebounceStateMachine.cpp
 * @brief Implementation of gesture label debouncing
 */

#include "heartfield/gesture/DebounceStateMachine.hpp"
#include "heartfield/core/Logger.hpp"

namespace heartfield {
namespace gesture {

ConfirmedState to_confirmed_state(GestureLabel label) {
    switch (label) {
        case GestureLabel::OPEN: return ConfirmedState::OPEN;
        case GestureLabel::FIST: return ConfirmedState::FIST;
        default: return ConfirmedState::NONE;
    }
}

DebounceStateMachine::DebounceStateMachine(const GestureConfig& config)
    : classifier_(config)
    , threshold_(config.debounce_frames) {
}

std::optional<ConfirmedState> DebounceStateMachine::update(const HandLandmarks& landmarks) {
    return updateLabel(classifier_.classify(landmarks));
}

std::optional<ConfirmedState> DebounceStateMachine::updateLabel(GestureLabel label) {
    if (label == GestureLabel::UNKNOWN) {
        clearPending();
        return std::nullopt;
    }

    const ConfirmedState candidate = to_confirmed_state(label);
    if (candidate == confirmed_) {
        clearPending();
        return std::nullopt;
    }

    if (label != pending_) {
        pending_ = label;
        pendingCount_ = 1;
    } else {
        ++pendingCount_;
    }

    if (pendingCount_ < threshold_) {
        return std::nullopt;
    }

    LOG_DEBUG("DebounceStateMachine: " + confirmed_state_to_string(confirmed_) + " -> " +
              confirmed_state_to_string(candidate) + " after " + std::to_string(pendingCount_) + " frames");

    confirmed_ = candidate;
    clearPending();
    return confirmed_;
}

void DebounceStateMachine::reset() {
    confirmed_ = ConfirmedState::NONE;
    clearPending();
}

void DebounceStateMachine::clearPending() {
    pending_ = GestureLabel::UNKNOWN;
    pendingCount_ = 0;
}

} // namespace gesture
} // namespace heartfield
