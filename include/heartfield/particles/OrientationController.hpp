/**
 * @file OrientationController.hpp
 * @brief Maps normalized 2D input to target rotation angles
 */

#ifndef HEARTFIELD_PARTICLES_ORIENTATION_CONTROLLER_HPP
#define HEARTFIELD_PARTICLES_ORIENTATION_CONTROLLER_HPP

#include "ParticleTypes.hpp"

namespace heartfield {
namespace particles {

/**
 * @brief Writes target yaw/pitch into a RotationState
 *
 * Applies no easing: only the target fields change, so hand position,
 * pointer drag and touch input can all drive the same rotation while the
 * animation tick does the smoothing. The bound RotationState must outlive
 * the controller.
 */
class OrientationController {
public:
    OrientationController(RotationState& state, const OrientationConfig& config = OrientationConfig());

    /**
     * @brief Update the target rotation
     *
     * @param norm_x Horizontal input in [-1, 1]; mapped to yaw with inverted sign
     * @param norm_y Vertical input in [-1, 1]; mapped to pitch, clamped to
     *               +/- pitch_limit so the cloud never flips past vertical
     */
    void setTargetFromInput(float norm_x, float norm_y);

    const OrientationConfig& config() const { return config_; }

private:
    RotationState& state_;
    OrientationConfig config_;
};

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_ORIENTATION_CONTROLLER_HPP
