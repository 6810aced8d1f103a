/**
 * @file ParticleRenderer.hpp
 * @brief Rendering collaborator interface for the animation engine
 */

#ifndef HEARTFIELD_PARTICLES_RENDERER_HPP
#define HEARTFIELD_PARTICLES_RENDERER_HPP

#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>
#include "ParticleTypes.hpp"

namespace heartfield {
namespace particles {

/**
 * @brief Everything a renderer needs to draw one tick
 *
 * References point into engine-owned buffers and are only valid for the
 * duration of the render() call.
 */
struct RenderFrame {
    const ParticleSet& positions;
    const std::vector<cv::Vec3f>& colors;
    const std::vector<float>& sizes;
    float yaw;              ///< Group rotation around Y (radians)
    float pitch;            ///< Group rotation around X (radians)
    Mode mode;
    float time;
    uint64_t frame_index;
};

/**
 * @brief Receives the updated point buffer once per tick
 */
class IParticleRenderer {
public:
    virtual ~IParticleRenderer() = default;

    virtual void render(const RenderFrame& frame) = 0;
};

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_RENDERER_HPP
