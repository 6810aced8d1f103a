/**
 * @file GestureClassifier.hpp
 * @brief Open/fist classification from a single frame of hand landmarks
 *
 * Finger extension is measured as the distance from each fingertip to the
 * palm center, normalized by the wrist to middle-MCP distance so the result
 * does not depend on how far the hand is from the camera.
 */

#ifndef HEARTFIELD_GESTURE_CLASSIFIER_HPP
#define HEARTFIELD_GESTURE_CLASSIFIER_HPP

#include <vector>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace heartfield {
namespace gesture {

/**
 * @brief Stateless per-frame gesture classifier
 *
 * classify() is a pure function of the landmarks and the configuration
 * supplied at construction.
 */
class GestureClassifier {
public:
    explicit GestureClassifier(const GestureConfig& config = GestureConfig());

    /**
     * @brief Classify one frame
     *
     * @return OPEN if at least open_min_extended fingers are extended, FIST if
     *         at most fist_max_extended are, UNKNOWN otherwise or when the hand
     *         size is degenerate
     */
    GestureLabel classify(const HandLandmarks& landmarks) const;

    /**
     * @brief Classify a dynamically sized landmark list
     *
     * Lists with fewer than 21 points classify as UNKNOWN.
     */
    GestureLabel classify(const std::vector<cv::Point3f>& points) const;

    /**
     * @brief Number of extended fingers, or -1 for a degenerate hand
     */
    int countExtendedFingers(const HandLandmarks& landmarks) const;

    /**
     * @brief Mean of the wrist and the four finger MCP joints
     */
    static cv::Point3f palmCenter(const HandLandmarks& landmarks);

    /**
     * @brief Wrist to middle-MCP distance
     */
    static float handSize(const HandLandmarks& landmarks);

    const GestureConfig& config() const { return config_; }

private:
    GestureConfig config_;
};

/**
 * @brief Classify with the default configuration
 */
GestureLabel classify(const HandLandmarks& landmarks);

} // namespace gesture
} // namespace heartfield

#endif // HEARTFIELD_GESTURE_CLASSIFIER_HPP
