/**
 * @file HandTrackingSession.cpp
 * @brief Hand tracking session implementation
 */

#include "heartfield/gesture/HandTrackingSession.hpp"
#include "heartfield/core/Logger.hpp"
#include <stdexcept>

namespace heartfield {
namespace gesture {

HandTrackingSession::HandTrackingSession(std::shared_ptr<IHandPoseSource> source,
                                         const GestureConfig& config)
    : source_(std::move(source))
    , debouncer_(config) {
}

HandTrackingSession::~HandTrackingSession() {
    stop();
}

core::ResultCode HandTrackingSession::start() {
    if (running_) {
        return core::ResultCode::SUCCESS;
    }

    if (!source_) {
        last_error_ = "No hand pose source configured";
        HEARTFIELD_LOG(ERROR, "session") << last_error_;
        return core::ResultCode::ERROR_INVALID_PARAMETER;
    }

    if (!source_->open()) {
        last_error_ = "Hand tracking unavailable: failed to open source '" + source_->name() + "'";
        HEARTFIELD_LOG(ERROR, "session") << last_error_;
        return core::ResultCode::ERROR_CAMERA_NOT_FOUND;
    }

    debouncer_.reset();
    last_label_ = GestureLabel::UNKNOWN;
    running_ = true;
    last_error_.clear();
    HEARTFIELD_LOG(INFO, "session") << "Started (source=" << source_->name() << ")";
    return core::ResultCode::SUCCESS;
}

void HandTrackingSession::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (source_) {
        source_->close();
    }
    debouncer_.reset();
    HEARTFIELD_LOG(INFO, "session") << "Stopped after " << frames_processed_ << " frames ("
                                    << frames_with_hand_ << " with hand)";
}

bool HandTrackingSession::processFrame() {
    if (!running_) {
        return false;
    }

    std::optional<HandLandmarks> landmarks;
    try {
        landmarks = source_->nextFrame();
    } catch (const std::exception& e) {
        last_error_ = std::string("Hand detection error: ") + e.what();
        HEARTFIELD_LOG(ERROR, "session") << last_error_;
        ++frames_processed_;
        return false;
    }

    return processLandmarks(landmarks);
}

bool HandTrackingSession::processLandmarks(const std::optional<HandLandmarks>& landmarks) {
    if (!running_) {
        return false;
    }

    ++frames_processed_;
    if (!landmarks) {
        return false;
    }
    if (landmarks->confidence < debouncer_.classifier().config().min_detection_confidence) {
        ++frames_low_confidence_;
        return false;
    }
    ++frames_with_hand_;

    last_label_ = debouncer_.classifier().classify(*landmarks);
    const std::optional<ConfirmedState> confirmed = debouncer_.updateLabel(last_label_);
    if (confirmed && state_callback_) {
        state_callback_(*confirmed);
    }

    if (position_callback_) {
        const cv::Point2f position = normalizedPalmPosition(*landmarks);
        position_callback_(position.x, position.y);
    }

    return true;
}

cv::Point2f HandTrackingSession::normalizedPalmPosition(const HandLandmarks& landmarks) {
    const cv::Point3f palm = GestureClassifier::palmCenter(landmarks);
    return cv::Point2f((palm.x - 0.5f) * 2.0f, (palm.y - 0.5f) * 2.0f);
}

} // namespace gesture
} // namespace heartfield
