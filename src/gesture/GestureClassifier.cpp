/**
 * @file GestureClassifier.cpp
 * @brief Implementation of the open/fist classifier
 */

#include "heartfield/gesture/GestureClassifier.hpp"
#include "heartfield/core/exception.h"
#include <cmath>

namespace heartfield {
namespace gesture {

namespace {

float distance(const cv::Point3f& a, const cv::Point3f& b) {
    const cv::Point3f d = a - b;
    return std::sqrt(d.x * d.x + d.y * d.y + d.z * d.z);
}

bool allFinite(const HandLandmarks& landmarks) {
    for (const auto& p : landmarks.points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            return false;
        }
    }
    return true;
}

} // namespace

GestureClassifier::GestureClassifier(const GestureConfig& config)
    : config_(config) {
    if (!config_.is_valid()) {
        HEARTFIELD_THROW(core::InvalidParameterException, "Invalid gesture configuration");
    }
}

cv::Point3f GestureClassifier::palmCenter(const HandLandmarks& landmarks) {
    cv::Point3f sum = landmarks[landmark::WRIST];
    for (int idx : landmark::FINGER_MCPS) {
        sum += landmarks[idx];
    }
    const float count = static_cast<float>(landmark::FINGER_MCPS.size() + 1);
    return cv::Point3f(sum.x / count, sum.y / count, sum.z / count);
}

float GestureClassifier::handSize(const HandLandmarks& landmarks) {
    return distance(landmarks[landmark::WRIST], landmarks[landmark::MIDDLE_MCP]);
}

int GestureClassifier::countExtendedFingers(const HandLandmarks& landmarks) const {
    if (!allFinite(landmarks)) {
        return -1;
    }
    const float size = handSize(landmarks);
    if (!(size >= config_.min_hand_size) || size <= 0.0f) {
        return -1;
    }

    const cv::Point3f palm = palmCenter(landmarks);

    int extended = 0;
    for (int tip : landmark::FINGERTIPS) {
        if (distance(landmarks[tip], palm) / size > config_.extension_threshold) {
            ++extended;
        }
    }
    return extended;
}

GestureLabel GestureClassifier::classify(const HandLandmarks& landmarks) const {
    const int extended = countExtendedFingers(landmarks);
    if (extended < 0) {
        return GestureLabel::UNKNOWN;
    }

    if (extended >= config_.open_min_extended) {
        return GestureLabel::OPEN;
    }
    if (extended <= config_.fist_max_extended) {
        return GestureLabel::FIST;
    }
    return GestureLabel::UNKNOWN;
}

GestureLabel GestureClassifier::classify(const std::vector<cv::Point3f>& points) const {
    if (points.size() < static_cast<size_t>(landmark::COUNT)) {
        return GestureLabel::UNKNOWN;
    }

    HandLandmarks landmarks;
    for (int i = 0; i < landmark::COUNT; ++i) {
        landmarks[i] = points[i];
    }
    return classify(landmarks);
}

GestureLabel classify(const HandLandmarks& landmarks) {
    static const GestureClassifier classifier;
    return classifier.classify(landmarks);
}

} // namespace gesture
} // namespace heartfield
