/**
 * @file ParticleTypes.hpp
 * @brief Data types shared by geometry generation and animation
 */

#ifndef HEARTFIELD_PARTICLES_TYPES_HPP
#define HEARTFIELD_PARTICLES_TYPES_HPP

#include <cmath>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace heartfield {
namespace particles {

/// Ordered collection of N 3D points
using ParticleSet = std::vector<cv::Point3f>;

/**
 * @brief Which target set the live particles ease toward
 */
enum class Mode {
    HEART,
    STARFIELD
};

std::string mode_to_string(Mode mode);

/**
 * @brief Parse "heart", "starfield" or "space"
 * @return false (and mode untouched) for any other name
 */
bool parse_mode(const std::string& name, Mode& mode);

/**
 * @brief Group rotation of the particle cloud in radians
 *
 * Targets are written by the orientation input, current values are eased
 * toward them by the animation tick.
 */
struct RotationState {
    float target_yaw = 0.0f;      ///< Rotation around Y, driven by horizontal input
    float target_pitch = 0.0f;    ///< Rotation around X, driven by vertical input
    float current_yaw = 0.0f;
    float current_pitch = 0.0f;
};

/**
 * @brief Rounded heart solid parameters
 *
 * The outline and the center-void filter work in unit scale; size and the
 * per-axis scales are applied to accepted samples only.
 */
struct HeartShapeConfig {
    float size = 3.0f;
    float scale_x = 1.3f;                       ///< Width
    float scale_y = 1.1f;                       ///< Height
    float scale_z = 0.9f;                       ///< Thickness

    float surface_ratio = 0.7f;                 ///< Share of points on the surface shell
    float surface_noise = 0.05f;                ///< Per-axis jitter amplitude (z uses half)
    float depth_factor = 0.7f;                  ///< Surface depth relative to local outline radius

    float interior_fill_max = 0.85f;            ///< Largest interior outline scale
    float interior_fill_exponent = 0.5f;        ///< < 1 pushes interior points toward the shell
    float interior_depth_factor = 1.2f;

    float center_void_radius = 0.15f;           ///< |x| and |z| bound of the suppressed column
    float center_void_leak_probability = 0.08f; ///< Chance a candidate inside the column is kept

    bool is_valid() const {
        return size > 0.0f && scale_x > 0.0f && scale_y > 0.0f && scale_z > 0.0f &&
               surface_ratio >= 0.0f && surface_ratio <= 1.0f &&
               surface_noise >= 0.0f &&
               depth_factor >= 0.0f &&
               interior_fill_max > 0.0f && interior_fill_max <= 1.0f &&
               interior_fill_exponent > 0.0f &&
               interior_depth_factor >= 0.0f &&
               center_void_radius >= 0.0f &&
               center_void_leak_probability >= 0.0f && center_void_leak_probability <= 1.0f &&
               (center_void_leak_probability > 0.0f || center_void_radius < 0.5f * reachable_width());
    }

    /**
     * Largest |x| (before scaling) that every sampling phase in use can reach.
     * The surface phase spans the full outline width of 1, the interior phase
     * only interior_fill_max. Without leakage the void radius must stay below
     * half of this so each phase keeps accepting candidates.
     */
    float reachable_width() const {
        return surface_ratio < 1.0f ? interior_fill_max : 1.0f;
    }
};

struct StarfieldConfig {
    float radius = 15.0f;

    bool is_valid() const { return radius > 0.0f; }
};

/**
 * @brief Per-tick animation constants
 */
struct AnimationConfig {
    size_t particle_count = 50000;
    float easing = 0.025f;              ///< Fraction of remaining distance covered per tick
    float rotation_easing = 0.08f;
    float heartbeat_amplitude = 0.05f;
    float heartbeat_speed = 1.2f;
    float time_step = 0.016f;           ///< Time advanced per tick
    Mode initial_mode = Mode::STARFIELD;

    bool is_valid() const {
        return particle_count > 0 &&
               easing > 0.0f && easing <= 1.0f &&
               rotation_easing > 0.0f && rotation_easing <= 1.0f &&
               heartbeat_amplitude >= 0.0f && heartbeat_amplitude < 1.0f &&
               time_step > 0.0f;
    }
};

struct OrientationConfig {
    float sensitivity = 1.5f;
    float pitch_limit = 0.4f * static_cast<float>(M_PI);

    bool is_valid() const {
        return sensitivity > 0.0f && pitch_limit > 0.0f &&
               pitch_limit < 0.5f * static_cast<float>(M_PI);
    }
};

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_TYPES_HPP
