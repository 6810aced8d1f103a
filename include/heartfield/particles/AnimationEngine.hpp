/**
 * @file AnimationEngine.hpp
 * @brief Eases a live particle cloud between the heart and starfield targets
 *
 * Each tick moves every live particle a fixed fraction of its remaining
 * distance toward the active target (exponential decay: no overshoot, no
 * teleport), applies a heartbeat pulse in heart mode, eases the group
 * rotation and hands the buffer to the renderer.
 *
 * Example usage:
 * @code
 * AnimationEngine engine(animation_config, heart_config, starfield_config);
 * engine.setRenderer(renderer);
 * engine.setMode(Mode::HEART);
 * while (engine.tick()) {
 *     // display refresh
 * }
 * @endcode
 *
 * Thread-safety: tick(), setMode() and setTargetRotation() are meant for one
 * thread (cooperative scheduling). regenerateTargets() and stop() may be
 * called from any thread; a tick always sees either the old or the new
 * target arrays, never a mix.
 */

#ifndef HEARTFIELD_PARTICLES_ANIMATION_ENGINE_HPP
#define HEARTFIELD_PARTICLES_ANIMATION_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "ParticleTypes.hpp"
#include "ParticleAppearance.hpp"
#include "ParticleRenderer.hpp"

namespace heartfield {
namespace particles {

class OrientationController;

/**
 * @brief Immutable pair of target arrays published as one unit
 */
struct TargetSnapshot {
    ParticleSet heart;
    ParticleSet starfield;
    uint64_t generation = 0;
};

/**
 * @brief Mutable per-instance animation state
 *
 * Owned by exactly one AnimationEngine.
 */
struct AnimationContext {
    Mode mode = Mode::STARFIELD;
    RotationState rotation;
    ParticleSet live;
    float time = 0.0f;
    uint64_t frame_count = 0;
};

class AnimationEngine {
public:
    /**
     * @brief Build targets and start with live particles on the starfield
     *
     * @throws core::InvalidParameterException for invalid configurations
     */
    AnimationEngine(const AnimationConfig& animation = AnimationConfig(),
                    const HeartShapeConfig& heart = HeartShapeConfig(),
                    const StarfieldConfig& starfield = StarfieldConfig(),
                    const OrientationConfig& orientation = OrientationConfig());

    ~AnimationEngine();

    // Disable copy and move
    AnimationEngine(const AnimationEngine&) = delete;
    AnimationEngine& operator=(const AnimationEngine&) = delete;
    AnimationEngine(AnimationEngine&&) = delete;
    AnimationEngine& operator=(AnimationEngine&&) = delete;

    void setRenderer(std::shared_ptr<IParticleRenderer> renderer);

    /**
     * @brief Select the target set; live positions are not touched
     */
    void setMode(Mode mode);

    /**
     * @brief Select the target set by name
     * @return false (with a warning, mode unchanged) for unknown names
     */
    bool setMode(const std::string& name);

    Mode getMode() const;

    /**
     * @brief Advance one animation step
     * @return false if the engine is stopped (nothing is modified)
     */
    bool tick();

    /**
     * @brief Forward normalized input to the orientation controller
     */
    void setTargetRotation(float norm_x, float norm_y);

    /**
     * @brief Replace both target arrays with freshly generated ones
     *
     * Live positions keep easing from wherever they are.
     */
    void regenerateTargets();
    void regenerateTargets(uint32_t seed);

    /**
     * @brief Resume ticking (no-op when already running)
     */
    void start();

    /**
     * @brief Stop ticking immediately (no-op when already stopped)
     */
    void stop();

    bool isRunning() const;

    size_t particleCount() const;

    const ParticleSet& livePositions() const;

    /**
     * @brief Current target arrays
     */
    std::shared_ptr<const TargetSnapshot> targets() const;

    RotationState rotation() const;

    float time() const;

    uint64_t frameCount() const;

    const ParticleAppearance& appearance() const;

    const AnimationConfig& config() const;

    OrientationController& orientation();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

} // namespace particles
} // namespace heartfield

#endif // HEARTFIELD_PARTICLES_ANIMATION_ENGINE_HPP
