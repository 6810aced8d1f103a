/**
 * @file ParticleAppearance.hpp
 * @brief Per-point colors and sizes for the particle cloud
 *
 * Indices below outer_layer_ratio * N form the outer layer (small, purple to
 * pink glow); the remaining indices form the inner layer (larger, bright pink
 * to white). Heart surface points come first in the target arrays, so the
 * outer layer maps onto the heart shell.
 */

#ifndef HEARTFIELD_PARTICLES_APPEARANCE_HPP
#define HEARTFIELD_PARTICLES_APPEARANCE_HPP

#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

namespace heartfield {
namespace particles {

struct ParticleAppearance {
    std::vector<cv::Vec3f> colors;  ///< RGB in [0, 1]
    std::vector<float> sizes;       ///< World-space point size
};

/**
 * @brief HSL to RGB, all components in [0, 1]
 */
cv::Vec3f hslToRgb(float h, float s, float l);

/**
 * @brief Generate colors and sizes for count particles
 * @param outer_layer_ratio Fraction of indices assigned to the outer layer
 */
ParticleAppearance generateAppearance(size_t count, float outer_layer_ratio, uint32_t seed);

ParticleAppearance generateAppearance(size_t count, float outer_layer_ratio = 0.6f);

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_APPEARANCE_HPP
