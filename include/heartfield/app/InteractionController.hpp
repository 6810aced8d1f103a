/**
 * @file InteractionController.hpp
 * @brief Routes confirmed gestures and pointer input to the animation engine
 *
 * Hand tracking path: FIST selects the heart, OPEN the starfield and the palm
 * position steers the rotation. When tracking cannot start, a pointer/touch
 * fallback takes over: a click or tap toggles the mode and a drag rotates the
 * cloud.
 */

#ifndef HEARTFIELD_APP_INTERACTION_CONTROLLER_HPP
#define HEARTFIELD_APP_INTERACTION_CONTROLLER_HPP

#include <memory>
#include <opencv2/core.hpp>
#include "heartfield/core/types.hpp"
#include "heartfield/gesture/HandTrackingSession.hpp"
#include "heartfield/particles/AnimationEngine.hpp"
#include "NotificationSink.hpp"

namespace heartfield {
namespace app {

/// Largest pointer travel (px, per axis) that still counts as a click
constexpr float CLICK_MOVE_TOLERANCE = 5.0f;

/// Touch travel (px, per axis) below which a touch end counts as a tap
constexpr float TAP_MOVE_TOLERANCE = 10.0f;

/// Drag delta to rotation input: delta / viewport * DRAG_GAIN
constexpr float DRAG_GAIN = 20.0f;

class InteractionController {
public:
    InteractionController(particles::AnimationEngine& engine,
                          std::shared_ptr<INotificationSink> notifications = nullptr);

    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    /**
     * @brief Apply a confirmed gesture; repeats of the last state are ignored
     */
    void onConfirmedState(gesture::ConfirmedState state);

    void onHandPosition(float norm_x, float norm_y);

    /**
     * @brief Register this controller's callbacks on a session
     *
     * The controller must outlive the session's use of the callbacks.
     */
    void bind(gesture::HandTrackingSession& session);

    /**
     * @brief Bind and start the session, enabling the fallback on failure
     */
    core::ResultCode startTracking(gesture::HandTrackingSession& session, cv::Size viewport);

    void enableFallback(cv::Size viewport);
    bool fallbackEnabled() const { return fallback_; }
    void setViewportSize(cv::Size viewport) { viewport_ = viewport; }

    // Pointer fallback (pixel coordinates)
    void pointerDown(float x, float y);
    void pointerMove(float x, float y);
    void pointerUp(float x, float y);

    // Touch fallback, single finger (pixel coordinates)
    void touchStart(float x, float y);
    void touchMove(float x, float y);
    void touchEnd(float x, float y);

    gesture::ConfirmedState lastState() const { return last_state_; }
    uint64_t modeSwitches() const { return mode_switches_; }

private:
    void toggleMode();
    void dragTo(cv::Point2f& last, float x, float y);
    void notify(const std::string& message);

    particles::AnimationEngine& engine_;
    std::shared_ptr<INotificationSink> notifications_;

    gesture::ConfirmedState last_state_ = gesture::ConfirmedState::NONE;
    uint64_t mode_switches_ = 0;

    bool fallback_ = false;
    cv::Size viewport_;

    bool dragging_ = false;
    cv::Point2f press_position_;
    cv::Point2f last_pointer_;

    bool touching_ = false;
    cv::Point2f touch_start_;
    cv::Point2f last_touch_;
};

} // namespace app
} // namespace heartfield

#endif // HEARTFIELD_APP_INTERACTION_CONTROLLER_HPP
