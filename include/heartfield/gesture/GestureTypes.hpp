/**
 * @file GestureTypes.hpp
 * @brief Core data types for hand gesture classification
 *
 * Defines the landmark layout, gesture labels, confirmed states and the
 * classifier configuration shared by the gesture module.
 */

#ifndef HEARTFIELD_GESTURE_TYPES_HPP
#define HEARTFIELD_GESTURE_TYPES_HPP

#include <array>
#include <string>
#include <functional>
#include <opencv2/core.hpp>

namespace heartfield {
namespace gesture {

/**
 * @brief Landmark indices (MediaPipe hand landmark convention)
 */
namespace landmark {
    constexpr int WRIST = 0;
    constexpr int THUMB_CMC = 1;
    constexpr int THUMB_MCP = 2;
    constexpr int THUMB_IP = 3;
    constexpr int THUMB_TIP = 4;
    constexpr int INDEX_MCP = 5;
    constexpr int INDEX_PIP = 6;
    constexpr int INDEX_DIP = 7;
    constexpr int INDEX_TIP = 8;
    constexpr int MIDDLE_MCP = 9;
    constexpr int MIDDLE_PIP = 10;
    constexpr int MIDDLE_DIP = 11;
    constexpr int MIDDLE_TIP = 12;
    constexpr int RING_MCP = 13;
    constexpr int RING_PIP = 14;
    constexpr int RING_DIP = 15;
    constexpr int RING_TIP = 16;
    constexpr int PINKY_MCP = 17;
    constexpr int PINKY_PIP = 18;
    constexpr int PINKY_DIP = 19;
    constexpr int PINKY_TIP = 20;

    constexpr int COUNT = 21;

    constexpr std::array<int, 5> FINGERTIPS = {THUMB_TIP, INDEX_TIP, MIDDLE_TIP, RING_TIP, PINKY_TIP};
    constexpr std::array<int, 4> FINGER_MCPS = {INDEX_MCP, MIDDLE_MCP, RING_MCP, PINKY_MCP};
} // namespace landmark

/**
 * @brief Hand landmark structure (21 points)
 *
 * Coordinates are normalized to [0, 1] relative to the image; z is the
 * relative depth reported by the pose model.
 */
struct HandLandmarks {
    /// 21 landmark points (x, y, z coordinates)
    std::array<cv::Point3f, landmark::COUNT> points;

    /// Detection confidence [0, 1] reported by the pose source
    float confidence = 1.0f;

    const cv::Point3f& operator[](int index) const { return points[index]; }
    cv::Point3f& operator[](int index) { return points[index]; }
};

/**
 * @brief Instantaneous per-frame gesture label
 */
enum class GestureLabel {
    UNKNOWN = 0,    ///< Degenerate detection or ambiguous finger count
    OPEN,           ///< Open palm
    FIST            ///< Closed fist
};

/**
 * @brief Debounced gesture state
 */
enum class ConfirmedState {
    NONE = 0,       ///< No gesture confirmed yet
    OPEN,
    FIST
};

/**
 * @brief Gesture classification and debounce configuration
 */
struct GestureConfig {
    /// Fingertip distance / hand size above which a finger counts as extended
    float extension_threshold = 1.3f;

    /// Wrist to middle-MCP distance below which the detection is degenerate
    float min_hand_size = 0.01f;

    /// Minimum extended fingers for OPEN
    int open_min_extended = 4;

    /// Maximum extended fingers for FIST
    int fist_max_extended = 1;

    /// Consecutive agreeing frames required to confirm a new state
    int debounce_frames = 5;

    /// Detections below this confidence are treated as "no hand"
    float min_detection_confidence = 0.5f;

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return extension_threshold > 0.0f &&
               min_hand_size >= 0.0f &&
               open_min_extended >= 0 && open_min_extended <= 5 &&
               fist_max_extended >= 0 && fist_max_extended < open_min_extended &&
               debounce_frames >= 1 &&
               min_detection_confidence >= 0.0f && min_detection_confidence <= 1.0f;
    }
};

/// Called once per confirmed state change
using StateChangeCallback = std::function<void(ConfirmedState state)>;

/// Called for every detected frame with the palm position mapped to [-1, 1]
using HandPositionCallback = std::function<void(float norm_x, float norm_y)>;

inline std::string gesture_label_to_string(GestureLabel label) {
    switch (label) {
        case GestureLabel::UNKNOWN: return "Unknown";
        case GestureLabel::OPEN: return "Open";
        case GestureLabel::FIST: return "Fist";
        default: return "Invalid";
    }
}

inline std::string confirmed_state_to_string(ConfirmedState state) {
    switch (state) {
        case ConfirmedState::NONE: return "None";
        case ConfirmedState::OPEN: return "Open";
        case ConfirmedState::FIST: return "Fist";
        default: return "Invalid";
    }
}

} // namespace gesture
} // namespace heartfield

#endif // HEARTFIELD_GESTURE_TYPES_HPP
