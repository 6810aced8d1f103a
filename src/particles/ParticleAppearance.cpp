#include "heartfield/particles/ParticleAppearance.hpp"
#include <cmath>
#include <random>

namespace heartfield {
namespace particles {

namespace {

float hueToChannel(float p, float q, float t) {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 0.5f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
    return p;
}

} // namespace

cv::Vec3f hslToRgb(float h, float s, float l) {
    if (s == 0.0f) {
        return cv::Vec3f(l, l, l);
    }

    const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
    const float p = 2.0f * l - q;
    return cv::Vec3f(hueToChannel(p, q, h + 1.0f / 3.0f),
                     hueToChannel(p, q, h),
                     hueToChannel(p, q, h - 1.0f / 3.0f));
}

ParticleAppearance generateAppearance(size_t count, float outer_layer_ratio, uint32_t seed) {
    ParticleAppearance appearance;
    appearance.colors.reserve(count);
    appearance.sizes.reserve(count);

    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    const size_t edgeCount = static_cast<size_t>(static_cast<float>(count) * outer_layer_ratio);

    for (size_t i = 0; i < count; ++i) {
        const bool inner = i >= edgeCount;
        float h, s, l;

        const float variant = unit(gen);
        if (inner) {
            if (variant < 0.5f) {
                // Bright pink
                h = 0.92f + unit(gen) * 0.08f;
                s = 0.6f + unit(gen) * 0.4f;
                l = 0.75f + unit(gen) * 0.2f;
            } else if (variant < 0.8f) {
                // Pale pink
                h = 0.95f;
                s = 0.2f + unit(gen) * 0.3f;
                l = 0.9f + unit(gen) * 0.1f;
            } else {
                // White
                h = 0.0f;
                s = 0.0f;
                l = 0.95f + unit(gen) * 0.05f;
            }
        } else {
            if (variant < 0.4f) {
                // Purple
                h = 0.75f + unit(gen) * 0.1f;
                s = 0.5f + unit(gen) * 0.3f;
                l = 0.5f + unit(gen) * 0.2f;
            } else if (variant < 0.7f) {
                // Pink
                h = 0.9f + unit(gen) * 0.08f;
                s = 0.4f + unit(gen) * 0.3f;
                l = 0.55f + unit(gen) * 0.15f;
            } else {
                // Violet
                h = 0.8f + unit(gen) * 0.05f;
                s = 0.3f + unit(gen) * 0.2f;
                l = 0.6f + unit(gen) * 0.15f;
            }
        }
        appearance.colors.push_back(hslToRgb(std::fmod(h, 1.0f), s, l));

        const float band = unit(gen);
        float size;
        if (inner) {
            if (band < 0.6f) {
                size = 0.04f + unit(gen) * 0.03f;
            } else if (band < 0.9f) {
                size = 0.06f + unit(gen) * 0.04f;
            } else {
                size = 0.1f + unit(gen) * 0.08f;
            }
        } else {
            if (band < 0.7f) {
                size = 0.02f + unit(gen) * 0.02f;
            } else if (band < 0.95f) {
                size = 0.03f + unit(gen) * 0.03f;
            } else {
                size = 0.05f + unit(gen) * 0.03f;
            }
        }
        appearance.sizes.push_back(size);
    }

    return appearance;
}

ParticleAppearance generateAppearance(size_t count, float outer_layer_ratio) {
    std::random_device rd;
    return generateAppearance(count, outer_layer_ratio, rd());
}

} // namespace particles
} // namespace heartfield
