/**
 * @file OpenCVPointRenderer.cpp
 * @brief Software renderer for the particle cloud
 */

#include "heartfield/particles/OpenCVPointRenderer.hpp"
#include "heartfield/core/exception.h"
#include <algorithm>
#include <cmath>
#include <random>

namespace heartfield {
namespace particles {

OpenCVPointRenderer::OpenCVPointRenderer(const PointRendererConfig& config)
    : config_(config) {
    if (!config_.is_valid()) {
        HEARTFIELD_THROW(core::InvalidParameterException, "Invalid point renderer configuration");
    }
    accumulator_ = cv::Mat(config_.image_size, CV_32FC3);
    image_ = cv::Mat(config_.image_size, CV_8UC3);
}

void OpenCVPointRenderer::render(const RenderFrame& frame) {
    const size_t count = frame.positions.size();

    if (phases_.size() != count) {
        std::mt19937 gen(1234u);
        std::uniform_real_distribution<float> phase(0.0f, 2.0f * static_cast<float>(M_PI));
        phases_.resize(count);
        for (float& p : phases_) {
            p = phase(gen);
        }
    }

    // Background in BGR order
    accumulator_.setTo(cv::Scalar(config_.background_rgb[2],
                                  config_.background_rgb[1],
                                  config_.background_rgb[0]));

    const float width = static_cast<float>(config_.image_size.width);
    const float height = static_cast<float>(config_.image_size.height);
    const float half_fov = config_.field_of_view_deg * 0.5f * static_cast<float>(M_PI) / 180.0f;
    const float focal = (height * 0.5f) / std::tan(half_fov);

    // Group rotation: pitch around X applied after yaw around Y
    const float cy = std::cos(frame.yaw), sy = std::sin(frame.yaw);
    const float cp = std::cos(frame.pitch), sp = std::sin(frame.pitch);

    const bool starfield = frame.mode == Mode::STARFIELD;
    points_drawn_ = 0;

    for (size_t i = 0; i < count; ++i) {
        const cv::Point3f& p = frame.positions[i];

        const float x1 = cy * p.x + sy * p.z;
        const float z1 = -sy * p.x + cy * p.z;
        const float y2 = cp * p.y - sp * z1;
        const float z2 = sp * p.y + cp * z1;

        const float depth = config_.camera_distance - z2;
        if (depth <= 0.1f) {
            continue;
        }

        const float u = width * 0.5f + focal * x1 / depth;
        const float v = height * 0.5f - focal * y2 / depth;
        if (u < 0.0f || v < 0.0f || u >= width || v >= height) {
            continue;
        }

        float twinkle = 1.0f;
        if (starfield) {
            twinkle = 0.7f + 0.3f * std::sin(frame.time * 2.0f + phases_[i]);
        }

        const float size = i < frame.sizes.size() ? frame.sizes[i] : 0.05f;
        const float point_px = size * config_.pixel_ratio * twinkle * (350.0f / depth);
        const int radius = std::max(1, static_cast<int>(std::lround(point_px * 0.5f)));

        cv::Vec3f rgb = i < frame.colors.size() ? frame.colors[i] : cv::Vec3f(1.0f, 1.0f, 1.0f);
        float alpha = 0.6f;
        if (starfield) {
            alpha *= 0.7f + 0.3f * std::sin(frame.time * 1.5f + phases_[i]);
        }

        // Additive disc with a soft falloff toward the rim
        const cv::Vec3f bgr(rgb[2] * alpha, rgb[1] * alpha, rgb[0] * alpha);
        const int cx = static_cast<int>(u);
        const int cyy = static_cast<int>(v);
        const float inv_radius = 1.0f / static_cast<float>(radius + 1);
        for (int dy = -radius; dy <= radius; ++dy) {
            const int row = cyy + dy;
            if (row < 0 || row >= accumulator_.rows) {
                continue;
            }
            cv::Vec3f* line = accumulator_.ptr<cv::Vec3f>(row);
            for (int dx = -radius; dx <= radius; ++dx) {
                const int col = cx + dx;
                const int dist2 = dx * dx + dy * dy;
                if (col < 0 || col >= accumulator_.cols || dist2 > radius * radius) {
                    continue;
                }
                const float falloff = 1.0f - std::sqrt(static_cast<float>(dist2)) * inv_radius;
                line[col] += bgr * falloff;
            }
        }

        ++points_drawn_;
    }

    accumulator_.convertTo(image_, CV_8UC3, 255.0);
    ++frames_rendered_;
}

} // namespace particles
} // namespace heartfield
