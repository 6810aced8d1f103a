/**
 * @file SyntheticHandSource.hpp
 * @brief Scripted hand pose source producing synthetic landmark frames
 *
 * Builds anatomically plausible 21-point hands whose fingertip distances to
 * the palm center are an exact multiple of the hand size, and plays them back
 * from a script of segments. Used by the demo and the tests in place of a
 * camera and landmark model.
 */

#ifndef HEARTFIELD_GESTURE_SYNTHETIC_HAND_SOURCE_HPP
#define HEARTFIELD_GESTURE_SYNTHETIC_HAND_SOURCE_HPP

#include <array>
#include <vector>
#include <opencv2/core.hpp>
#include "HandPoseSource.hpp"

namespace heartfield {
namespace gesture {

/**
 * @brief One scripted stretch of frames
 *
 * The palm center moves linearly from palm_from to palm_to over the segment.
 * A segment with visible == false produces "no hand" frames.
 */
struct HandScriptSegment {
    float extension_ratio = 1.6f;         ///< Fingertip distance / hand size
    int frames = 30;
    cv::Point2f palm_from = cv::Point2f(0.5f, 0.5f);
    cv::Point2f palm_to = cv::Point2f(0.5f, 0.5f);
    float hand_size = 0.12f;              ///< Wrist to middle-MCP distance
    bool visible = true;
};

class SyntheticHandSource : public IHandPoseSource {
public:
    explicit SyntheticHandSource(std::vector<HandScriptSegment> script = {}, bool loop = false);

    bool open() override;
    void close() override;
    bool isOpen() const override { return open_; }
    std::optional<HandLandmarks> nextFrame() override;
    std::string name() const override { return "synthetic"; }

    /**
     * @brief Make open() fail, to exercise unavailable-source handling
     */
    void setAvailable(bool available) { available_ = available; }

    bool finished() const;

    /**
     * @brief Build a hand with every fingertip at ratio * hand size from the palm center
     */
    static HandLandmarks makeHand(float extension_ratio,
                                  cv::Point2f palm_center = cv::Point2f(0.5f, 0.5f),
                                  float hand_size = 0.12f);

    /**
     * @brief Build a hand with an individual ratio per fingertip
     *        (thumb, index, middle, ring, pinky)
     */
    static HandLandmarks makeHand(const std::array<float, 5>& extension_ratios,
                                  cv::Point2f palm_center = cv::Point2f(0.5f, 0.5f),
                                  float hand_size = 0.12f);

    /**
     * @brief Demo script: scatter, form the heart, open again, drift around
     */
    static std::vector<HandScriptSegment> demoScript();

private:
    std::vector<HandScriptSegment> script_;
    bool loop_;
    bool available_ = true;
    bool open_ = false;
    size_t segment_ = 0;
    int frame_in_segment_ = 0;
};

} // namespace gesture
} // namespace heartfield

#endif // HEARTFIELD_GESTURE_SYNTHETIC_HAND_SOURCE_HPP
