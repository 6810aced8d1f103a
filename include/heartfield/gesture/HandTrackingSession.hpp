/**
 * @file HandTrackingSession.hpp
 * @brief Drives a hand pose source through classification and debouncing
 *
 * Per detected frame:
 * 1. Classify the landmarks and feed the label to the debouncer
 * 2. Publish a confirmed state change (if any) to the state callback
 * 3. Publish the palm position mapped to [-1, 1] to the position callback
 *
 * Frames without a hand are counted but do not touch the debouncer, so a
 * brief dropout neither confirms nor cancels a transition.
 */

#ifndef HEARTFIELD_GESTURE_HAND_TRACKING_SESSION_HPP
#define HEARTFIELD_GESTURE_HAND_TRACKING_SESSION_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include "heartfield/core/types.hpp"
#include "DebounceStateMachine.hpp"
#include "HandPoseSource.hpp"

namespace heartfield {
namespace gesture {

class HandTrackingSession {
public:
    HandTrackingSession(std::shared_ptr<IHandPoseSource> source,
                        const GestureConfig& config = GestureConfig());

    ~HandTrackingSession();

    // Disable copy and move
    HandTrackingSession(const HandTrackingSession&) = delete;
    HandTrackingSession& operator=(const HandTrackingSession&) = delete;

    /**
     * @brief Open the source and begin accepting frames
     *
     * @return SUCCESS, ERROR_INVALID_PARAMETER without a source, or
     *         ERROR_CAMERA_NOT_FOUND when the source cannot be opened
     */
    core::ResultCode start();

    /**
     * @brief Close the source and clear debounce state (idempotent)
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Pull and process one frame from the source
     * @return true if a hand was detected in the frame
     */
    bool processFrame();

    /**
     * @brief Process externally supplied landmarks (std::nullopt = no hand)
     */
    bool processLandmarks(const std::optional<HandLandmarks>& landmarks);

    void setStateChangeCallback(StateChangeCallback callback) { state_callback_ = std::move(callback); }
    void setHandPositionCallback(HandPositionCallback callback) { position_callback_ = std::move(callback); }

    ConfirmedState currentState() const { return debouncer_.currentState(); }
    GestureLabel lastLabel() const { return last_label_; }
    const DebounceStateMachine& debouncer() const { return debouncer_; }

    uint64_t framesProcessed() const { return frames_processed_; }
    uint64_t framesWithHand() const { return frames_with_hand_; }
    /// Detections dropped for falling below min_detection_confidence
    uint64_t framesLowConfidence() const { return frames_low_confidence_; }

    std::string lastError() const { return last_error_; }

    /**
     * @brief 2D palm center (wrist + 4 MCPs) mapped from [0, 1] to [-1, 1]
     */
    static cv::Point2f normalizedPalmPosition(const HandLandmarks& landmarks);

private:
    std::shared_ptr<IHandPoseSource> source_;
    DebounceStateMachine debouncer_;

    StateChangeCallback state_callback_;
    HandPositionCallback position_callback_;

    bool running_ = false;
    GestureLabel last_label_ = GestureLabel::UNKNOWN;
    uint64_t frames_processed_ = 0;
    uint64_t frames_with_hand_ = 0;
    uint64_t frames_low_confidence_ = 0;
    std::string last_error_;
};

} // namespace gesture
} // namespace heartfield

#endif // HEARTFIELD_GESTURE_HAND_TRACKING_SESSION_HPP
