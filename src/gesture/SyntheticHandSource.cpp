/**
 * @file SyntheticHandSource.cpp
 * @brief Scripted synthetic landmark generation
 */

#include "heartfield/gesture/SyntheticHandSource.hpp"
#include "heartfield/core/Logger.hpp"
#include <cmath>

namespace heartfield {
namespace gesture {

namespace {

cv::Point3f lerp(const cv::Point3f& a, const cv::Point3f& b, float t) {
    return a + (b - a) * t;
}

cv::Point2f unit(float x, float y) {
    const float n = std::sqrt(x * x + y * y);
    return cv::Point2f(x / n, y / n);
}

} // namespace

SyntheticHandSource::SyntheticHandSource(std::vector<HandScriptSegment> script, bool loop)
    : script_(std::move(script))
    , loop_(loop) {
}

bool SyntheticHandSource::open() {
    if (!available_) {
        LOG_ERROR("SyntheticHandSource: Source unavailable");
        return false;
    }
    open_ = true;
    segment_ = 0;
    frame_in_segment_ = 0;
    return true;
}

void SyntheticHandSource::close() {
    open_ = false;
}

bool SyntheticHandSource::finished() const {
    return !loop_ && segment_ >= script_.size();
}

std::optional<HandLandmarks> SyntheticHandSource::nextFrame() {
    if (!open_ || script_.empty() || finished()) {
        return std::nullopt;
    }

    const HandScriptSegment& seg = script_[segment_];
    const float t = seg.frames > 1
        ? static_cast<float>(frame_in_segment_) / static_cast<float>(seg.frames - 1)
        : 0.0f;
    const cv::Point2f palm = seg.palm_from + (seg.palm_to - seg.palm_from) * t;

    if (++frame_in_segment_ >= seg.frames) {
        frame_in_segment_ = 0;
        ++segment_;
        if (loop_ && segment_ >= script_.size()) {
            segment_ = 0;
        }
    }

    if (!seg.visible) {
        return std::nullopt;
    }
    return makeHand(seg.extension_ratio, palm, seg.hand_size);
}

HandLandmarks SyntheticHandSource::makeHand(float extension_ratio, cv::Point2f palm_center, float hand_size) {
    return makeHand({extension_ratio, extension_ratio, extension_ratio, extension_ratio, extension_ratio},
                    palm_center, hand_size);
}

HandLandmarks SyntheticHandSource::makeHand(const std::array<float, 5>& extension_ratios,
                                            cv::Point2f palm_center, float hand_size) {
    const float s = hand_size;

    // Knuckle layout relative to an origin whose offsets average to (0.11s, -0.25s);
    // shifting by that average puts the palm center exactly at palm_center.
    const cv::Point3f origin(palm_center.x - 0.11f * s, palm_center.y + 0.25f * s, 0.0f);

    HandLandmarks hand;
    hand[landmark::WRIST] = origin + cv::Point3f(0.0f, 0.5f * s, 0.0f);
    hand[landmark::INDEX_MCP] = origin + cv::Point3f(-0.3f * s, -0.45f * s, 0.0f);
    hand[landmark::MIDDLE_MCP] = origin + cv::Point3f(0.0f, -0.5f * s, 0.0f);
    hand[landmark::RING_MCP] = origin + cv::Point3f(0.3f * s, -0.45f * s, 0.0f);
    hand[landmark::PINKY_MCP] = origin + cv::Point3f(0.55f * s, -0.35f * s, 0.0f);

    const cv::Point3f palm(palm_center.x, palm_center.y, 0.0f);
    const std::array<cv::Point2f, 5> directions = {
        unit(-0.8f, -0.3f),     // thumb
        unit(-0.25f, -1.0f),    // index
        unit(0.0f, -1.0f),      // middle
        unit(0.25f, -1.0f),     // ring
        unit(0.5f, -0.85f)      // pinky
    };

    for (size_t f = 0; f < landmark::FINGERTIPS.size(); ++f) {
        const float reach = extension_ratios[f] * s;
        hand[landmark::FINGERTIPS[f]] = palm + cv::Point3f(directions[f].x * reach, directions[f].y * reach, 0.0f);
    }

    // Thumb chain runs from the wrist, the other fingers from their MCP
    const cv::Point3f& thumb_tip = hand[landmark::THUMB_TIP];
    hand[landmark::THUMB_CMC] = lerp(hand[landmark::WRIST], thumb_tip, 0.25f);
    hand[landmark::THUMB_MCP] = lerp(hand[landmark::WRIST], thumb_tip, 0.5f);
    hand[landmark::THUMB_IP] = lerp(hand[landmark::WRIST], thumb_tip, 0.75f);

    for (int mcp : landmark::FINGER_MCPS) {
        const cv::Point3f base = hand[mcp];
        const cv::Point3f tip = hand[mcp + 3];
        hand[mcp + 1] = lerp(base, tip, 0.4f);
        hand[mcp + 2] = lerp(base, tip, 0.7f);
    }

    return hand;
}

std::vector<HandScriptSegment> SyntheticHandSource::demoScript() {
    std::vector<HandScriptSegment> script;

    HandScriptSegment open_center;
    open_center.extension_ratio = 1.7f;
    open_center.frames = 45;
    script.push_back(open_center);

    HandScriptSegment fist_sweep;
    fist_sweep.extension_ratio = 0.9f;
    fist_sweep.frames = 150;
    fist_sweep.palm_from = cv::Point2f(0.3f, 0.5f);
    fist_sweep.palm_to = cv::Point2f(0.7f, 0.45f);
    script.push_back(fist_sweep);

    HandScriptSegment lost;
    lost.visible = false;
    lost.frames = 20;
    script.push_back(lost);

    HandScriptSegment fist_tilt;
    fist_tilt.extension_ratio = 0.9f;
    fist_tilt.frames = 90;
    fist_tilt.palm_from = cv::Point2f(0.7f, 0.45f);
    fist_tilt.palm_to = cv::Point2f(0.5f, 0.3f);
    script.push_back(fist_tilt);

    HandScriptSegment open_drift;
    open_drift.extension_ratio = 1.7f;
    open_drift.frames = 120;
    open_drift.palm_from = cv::Point2f(0.5f, 0.3f);
    open_drift.palm_to = cv::Point2f(0.5f, 0.6f);
    script.push_back(open_drift);

    return script;
}

} // namespace gesture
} // namespace heartfield
