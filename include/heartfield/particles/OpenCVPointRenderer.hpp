/**
 * @file OpenCVPointRenderer.hpp
 * @brief Software point-sprite renderer drawing into a cv::Mat
 *
 * Perspective camera on the +Z axis looking at the origin, additive glow
 * blending, starfield twinkle. Intended for the demo and for debug snapshots.
 */

#ifndef HEARTFIELD_PARTICLES_OPENCV_POINT_RENDERER_HPP
#define HEARTFIELD_PARTICLES_OPENCV_POINT_RENDERER_HPP

#include <vector>
#include <opencv2/core.hpp>
#include "ParticleRenderer.hpp"

namespace heartfield {
namespace particles {

struct PointRendererConfig {
    cv::Size image_size = cv::Size(960, 720);
    float field_of_view_deg = 60.0f;
    float camera_distance = 10.0f;
    float pixel_ratio = 1.0f;
    cv::Vec3f background_rgb = cv::Vec3f(8.0f / 255.0f, 0.0f, 16.0f / 255.0f);

    bool is_valid() const {
        return image_size.width > 0 && image_size.height > 0 &&
               field_of_view_deg > 0.0f && field_of_view_deg < 180.0f &&
               camera_distance > 0.0f && pixel_ratio > 0.0f;
    }
};

class OpenCVPointRenderer : public IParticleRenderer {
public:
    explicit OpenCVPointRenderer(const PointRendererConfig& config = PointRendererConfig());

    void render(const RenderFrame& frame) override;

    /**
     * @brief Last rendered frame (BGR, CV_8UC3)
     */
    const cv::Mat& image() const { return image_; }

    /**
     * @brief Points that landed in front of the camera on the last frame
     */
    size_t pointsDrawn() const { return points_drawn_; }

    uint64_t framesRendered() const { return frames_rendered_; }

private:
    PointRendererConfig config_;
    cv::Mat accumulator_;           ///< CV_32FC3 linear RGB
    cv::Mat image_;
    std::vector<float> phases_;     ///< Per-point twinkle phase
    size_t points_drawn_ = 0;
    uint64_t frames_rendered_ = 0;
};

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_OPENCV_POINT_RENDERER_HPP
