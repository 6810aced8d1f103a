/**
 * @file GeometryGenerator.cpp
 * @brief Heart solid and starfield point generation
 */

#include "heartfield/particles/GeometryGenerator.hpp"
#include "heartfield/core/exception.h"
#include <cmath>
#include <random>

namespace heartfield {
namespace particles {

namespace {

constexpr float TWO_PI = 2.0f * static_cast<float>(M_PI);

/**
 * @brief Classic heart curve, normalized so the outline spans roughly [-1, 1]
 *
 * x = 16 sin^3 u, y = 13 cos u - 5 cos 2u - 2 cos 3u - cos 4u
 */
cv::Point2f heartOutline(float u) {
    const float s = std::sin(u);
    const float x = 16.0f * s * s * s;
    const float y = 13.0f * std::cos(u) - 5.0f * std::cos(2.0f * u) -
                    2.0f * std::cos(3.0f * u) - std::cos(4.0f * u);
    return cv::Point2f(x / 16.0f, y / 17.0f);
}

uint32_t randomSeed() {
    std::random_device rd;
    return rd();
}

} // namespace

GeometryGenerator::GeometryGenerator(const HeartShapeConfig& heart)
    : heart_(heart) {
    if (!heart_.is_valid()) {
        HEARTFIELD_THROW(core::InvalidParameterException, "Invalid heart shape configuration");
    }
}

ParticleSet GeometryGenerator::generateHeart(size_t count) const {
    return generateHeart(count, randomSeed());
}

ParticleSet GeometryGenerator::generateHeart(size_t count, uint32_t seed) const {
    ParticleSet points;
    points.reserve(count);

    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    const size_t surfaceCount = static_cast<size_t>(static_cast<float>(count) * heart_.surface_ratio);
    const float voidRadius = heart_.center_void_radius;

    // Single loop for both phases: every accepted sample goes through the
    // center-void filter, including the last ones that complete the count.
    while (points.size() < count) {
        float x, y, z;

        if (points.size() < surfaceCount) {
            const float u = unit(gen) * TWO_PI;
            const float v = unit(gen) * static_cast<float>(M_PI);

            const cv::Point2f outline = heartOutline(u);
            const float radius = std::sqrt(outline.x * outline.x + outline.y * outline.y);

            // sin(v) shrinks the outline toward the front and back faces while
            // cos(v) sets the depth, so each depth slice stays heart-shaped
            const float xyFactor = 0.9f * std::sin(v) + 0.1f;
            x = outline.x * xyFactor;
            y = outline.y * xyFactor;
            z = std::cos(v) * radius * heart_.depth_factor;

            x += (unit(gen) - 0.5f) * heart_.surface_noise;
            y += (unit(gen) - 0.5f) * heart_.surface_noise;
            z += (unit(gen) - 0.5f) * heart_.surface_noise * 0.5f;
        } else {
            const float u = unit(gen) * TWO_PI;
            const float fill = std::pow(unit(gen), heart_.interior_fill_exponent) * heart_.interior_fill_max;

            const cv::Point2f outline = heartOutline(u) * fill;
            const float radius = std::sqrt(outline.x * outline.x + outline.y * outline.y);

            x = outline.x;
            y = outline.y;
            z = (unit(gen) - 0.5f) * radius * heart_.interior_depth_factor;
        }

        if (std::abs(x) < voidRadius && std::abs(z) < voidRadius) {
            if (unit(gen) >= heart_.center_void_leak_probability) {
                continue;
            }
        }

        points.emplace_back(x * heart_.scale_x * heart_.size,
                            y * heart_.scale_y * heart_.size,
                            z * heart_.scale_z * heart_.size);
    }

    return points;
}

ParticleSet GeometryGenerator::generateStarfield(size_t count, float radius) const {
    return generateStarfield(count, radius, randomSeed());
}

ParticleSet GeometryGenerator::generateStarfield(size_t count, float radius, uint32_t seed) const {
    if (!(radius > 0.0f)) {
        HEARTFIELD_THROW(core::InvalidParameterException,
                         "Starfield radius must be positive, got " + std::to_string(radius));
    }

    ParticleSet points;
    points.reserve(count);

    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    for (size_t i = 0; i < count; ++i) {
        const float theta = unit(gen) * TWO_PI;
        // acos of a uniform cosine avoids clustering at the poles
        const float phi = std::acos(2.0f * unit(gen) - 1.0f);
        // cube root gives uniform density per unit volume
        const float r = radius * std::cbrt(unit(gen));

        points.emplace_back(r * std::sin(phi) * std::cos(theta),
                            r * std::sin(phi) * std::sin(theta),
                            r * std::cos(phi));
    }

    return points;
}

bool GeometryGenerator::inCenterVoid(const cv::Point3f& point) const {
    const float x = point.x / (heart_.scale_x * heart_.size);
    const float z = point.z / (heart_.scale_z * heart_.size);
    return std::abs(x) < heart_.center_void_radius && std::abs(z) < heart_.center_void_radius;
}

ParticleSet generateHeart(size_t count) {
    static const GeometryGenerator generator;
    return generator.generateHeart(count);
}

ParticleSet generateStarfield(size_t count, float radius) {
    static const GeometryGenerator generator;
    return generator.generateStarfield(count, radius);
}

} // namespace particles
} // namespace heartfield
