/**
 * @file GeometryGenerator.hpp
 * @brief Procedural target geometries for the particle cloud
 *
 * Two point sets are produced:
 * - Heart: a rounded, lens-like 3D solid. 70% of the points lie on a shell
 *   made by extruding a closed heart outline into depth proportional to the
 *   local outline radius; the rest fill the interior, biased toward the shell.
 * - Starfield: points uniformly distributed in the volume of a ball.
 *
 * Naive parametrization of the heart piles points up along the vertical
 * symmetry axis (x = z = 0). Candidates falling in that column are rejected
 * and resampled, except for a small configurable leak probability.
 *
 * Every call draws from a fresh random engine, so results never depend on
 * previous calls. Performance: ~10-20 ms for 50k heart points.
 */

#ifndef HEARTFIELD_PARTICLES_GEOMETRY_GENERATOR_HPP
#define HEARTFIELD_PARTICLES_GEOMETRY_GENERATOR_HPP

#include <cstdint>
#include "ParticleTypes.hpp"

namespace heartfield {
namespace particles {

class GeometryGenerator {
public:
    explicit GeometryGenerator(const HeartShapeConfig& heart = HeartShapeConfig());

    /**
     * @brief Generate exactly count heart points (random seed)
     */
    ParticleSet generateHeart(size_t count) const;

    /**
     * @brief Generate exactly count heart points from a fixed seed
     */
    ParticleSet generateHeart(size_t count, uint32_t seed) const;

    /**
     * @brief Generate exactly count points uniformly inside a ball
     */
    ParticleSet generateStarfield(size_t count, float radius) const;

    ParticleSet generateStarfield(size_t count, float radius, uint32_t seed) const;

    /**
     * @brief True when a scaled heart point lies in the suppressed center column
     */
    bool inCenterVoid(const cv::Point3f& point) const;

    const HeartShapeConfig& heartConfig() const { return heart_; }

private:
    HeartShapeConfig heart_;
};

/**
 * @brief Heart with the default shape configuration
 */
ParticleSet generateHeart(size_t count);

/**
 * @brief Starfield of the given radius
 */
ParticleSet generateStarfield(size_t count, float radius);

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_GEOMETRY_GENERATOR_HPP
