/**
 * @file HandPoseSource.hpp
 * @brief Interface of a per-frame hand landmark provider
 */

#ifndef HEARTFIELD_GESTURE_HAND_POSE_SOURCE_HPP
#define HEARTFIELD_GESTURE_HAND_POSE_SOURCE_HPP

#include <optional>
#include <string>
#include "GestureTypes.hpp"

namespace heartfield {
namespace gesture {

/**
 * @brief Delivers 21 landmarks per available frame, or nothing when no hand
 *        is detected
 *
 * Implementations wrap a camera plus a landmark model. Only the first hand is
 * reported.
 */
class IHandPoseSource {
public:
    virtual ~IHandPoseSource() = default;

    /**
     * @brief Acquire the underlying device/model
     * @return false if the source is unavailable
     */
    virtual bool open() = 0;

    /**
     * @brief Release the source (must be safe to call when not open)
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Next frame's landmarks, std::nullopt when no hand is detected
     */
    virtual std::optional<HandLandmarks> nextFrame() = 0;

    virtual std::string name() const = 0;
};

} // namespace gesture
} // namespace heartfield

#endif // HEARTFIELD_GESTURE_HAND_POSE_SOURCE_HPP
