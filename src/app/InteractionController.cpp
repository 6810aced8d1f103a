/**
 * @file InteractionController.cpp
 * @brief Gesture and pointer routing implementation
 */

#include "heartfield/app/InteractionController.hpp"
#include "heartfield/core/exception.h"
#include "heartfield/core/Logger.hpp"
#include <cmath>

namespace heartfield {
namespace app {

using gesture::ConfirmedState;
using particles::Mode;

InteractionController::InteractionController(particles::AnimationEngine& engine,
                                             std::shared_ptr<INotificationSink> notifications)
    : engine_(engine)
    , notifications_(std::move(notifications)) {
}

void InteractionController::onConfirmedState(ConfirmedState state) {
    if (state == last_state_ || state == ConfirmedState::NONE) {
        return;
    }

    LOG_INFO("Gesture state " + gesture::confirmed_state_to_string(last_state_) + " -> " +
             gesture::confirmed_state_to_string(state));
    last_state_ = state;

    if (state == ConfirmedState::FIST) {
        engine_.setMode(Mode::HEART);
        notify("fist: heart assembling");
    } else {
        engine_.setMode(Mode::STARFIELD);
        notify("open hand: starfield scattering");
    }
    ++mode_switches_;
}

void InteractionController::onHandPosition(float norm_x, float norm_y) {
    engine_.setTargetRotation(norm_x, norm_y);
}

void InteractionController::bind(gesture::HandTrackingSession& session) {
    session.setStateChangeCallback([this](ConfirmedState state) { onConfirmedState(state); });
    session.setHandPositionCallback([this](float x, float y) { onHandPosition(x, y); });
}

core::ResultCode InteractionController::startTracking(gesture::HandTrackingSession& session, cv::Size viewport) {
    bind(session);
    const core::ResultCode rc = session.start();
    if (rc != core::ResultCode::SUCCESS) {
        LOG_WARNING("Hand tracking failed to start (" + core::resultCodeToString(rc) + "), using pointer input");
        notify(session.lastError());
        enableFallback(viewport);
    }
    return rc;
}

void InteractionController::enableFallback(cv::Size viewport) {
    viewport_ = viewport;
    if (fallback_) {
        return;
    }
    fallback_ = true;
    LOG_INFO("Fallback interaction enabled (pointer/touch)");
    notify("click to switch mode, drag to rotate");
}

void InteractionController::pointerDown(float x, float y) {
    if (!fallback_) {
        return;
    }
    dragging_ = true;
    press_position_ = cv::Point2f(x, y);
    last_pointer_ = press_position_;
}

void InteractionController::pointerMove(float x, float y) {
    if (!fallback_ || !dragging_) {
        return;
    }
    dragTo(last_pointer_, x, y);
}

void InteractionController::pointerUp(float x, float y) {
    if (!fallback_ || !dragging_) {
        return;
    }
    dragging_ = false;
    if (std::abs(x - press_position_.x) <= CLICK_MOVE_TOLERANCE &&
        std::abs(y - press_position_.y) <= CLICK_MOVE_TOLERANCE) {
        toggleMode();
    }
}

void InteractionController::touchStart(float x, float y) {
    if (!fallback_) {
        return;
    }
    touching_ = true;
    touch_start_ = cv::Point2f(x, y);
    last_touch_ = touch_start_;
}

void InteractionController::touchMove(float x, float y) {
    if (!fallback_ || !touching_) {
        return;
    }
    dragTo(last_touch_, x, y);
}

void InteractionController::touchEnd(float x, float y) {
    if (!fallback_ || !touching_) {
        return;
    }
    touching_ = false;
    if (std::abs(x - touch_start_.x) < TAP_MOVE_TOLERANCE &&
        std::abs(y - touch_start_.y) < TAP_MOVE_TOLERANCE) {
        toggleMode();
    }
}

void InteractionController::toggleMode() {
    if (engine_.getMode() == Mode::HEART) {
        engine_.setMode(Mode::STARFIELD);
        notify("3D starfield mode");
    } else {
        engine_.setMode(Mode::HEART);
        notify("3D heart mode");
    }
    ++mode_switches_;
}

void InteractionController::dragTo(cv::Point2f& last, float x, float y) {
    if (viewport_.width <= 0 || viewport_.height <= 0) {
        LOG_WARNING("InteractionController: Drag ignored, viewport size not set");
        return;
    }
    const float norm_x = (x - last.x) / static_cast<float>(viewport_.width) * DRAG_GAIN;
    const float norm_y = (y - last.y) / static_cast<float>(viewport_.height) * DRAG_GAIN;
    engine_.setTargetRotation(norm_x, norm_y);
    last = cv::Point2f(x, y);
}

void InteractionController::notify(const std::string& message) {
    if (notifications_) {
        notifications_->notify(message);
    }
}

} // namespace app
} // namespace heartfield
