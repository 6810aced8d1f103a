/**
 * @file AnimationEngine.cpp
 * @brief Implementation of the particle animation engine
 */

#include "heartfield/particles/AnimationEngine.hpp"
#include "heartfield/particles/GeometryGenerator.hpp"
#include "heartfield/particles/OrientationController.hpp"
#include "heartfield/core/Logger.hpp"
#include "heartfield/core/exception.h"
#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>
#include <random>

namespace heartfield {
namespace particles {

// PIMPL implementation
class AnimationEngine::Impl {
public:
    AnimationConfig config;
    StarfieldConfig starfield_config;
    GeometryGenerator generator;

    AnimationContext context;
    OrientationController orientation;
    ParticleAppearance appearance;

    std::shared_ptr<IParticleRenderer> renderer;
    std::atomic<bool> running{true};

    mutable std::mutex targets_mutex;
    std::shared_ptr<const TargetSnapshot> targets;

    Impl(const AnimationConfig& animation,
         const HeartShapeConfig& heart,
         const StarfieldConfig& starfield,
         const OrientationConfig& orientation_config)
        : config(animation)
        , starfield_config(starfield)
        , generator(heart)
        , orientation(context.rotation, orientation_config) {
    }

    std::shared_ptr<const TargetSnapshot> loadTargets() const {
        std::lock_guard<std::mutex> lock(targets_mutex);
        return targets;
    }

    void publishTargets(uint32_t seed) {
        auto start = std::chrono::steady_clock::now();

        std::seed_seq seq{seed};
        uint32_t seeds[2];
        seq.generate(seeds, seeds + 2);

        auto snapshot = std::make_shared<TargetSnapshot>();
        snapshot->heart = generator.generateHeart(config.particle_count, seeds[0]);
        snapshot->starfield = generator.generateStarfield(config.particle_count,
                                                          starfield_config.radius, seeds[1]);

        {
            std::lock_guard<std::mutex> lock(targets_mutex);
            snapshot->generation = targets ? targets->generation + 1 : 0;
            targets = std::move(snapshot);
        }

        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        HEARTFIELD_LOG(INFO, "engine") << "Generated " << config.particle_count
                                       << " heart/starfield targets in " << elapsed_ms << " ms";
    }
};

namespace {

uint32_t randomSeed() {
    std::random_device rd;
    return rd();
}

} // namespace

AnimationEngine::AnimationEngine(const AnimationConfig& animation,
                                 const HeartShapeConfig& heart,
                                 const StarfieldConfig& starfield,
                                 const OrientationConfig& orientation) {
    if (!animation.is_valid()) {
        HEARTFIELD_THROW(core::InvalidParameterException, "Invalid animation configuration");
    }
    if (!starfield.is_valid()) {
        HEARTFIELD_THROW(core::InvalidParameterException, "Invalid starfield configuration");
    }

    pImpl = std::make_unique<Impl>(animation, heart, starfield, orientation);
    pImpl->context.mode = animation.initial_mode;

    pImpl->publishTargets(randomSeed());
    pImpl->appearance = generateAppearance(animation.particle_count);

    // Start scattered on the starfield
    pImpl->context.live = pImpl->loadTargets()->starfield;

    HEARTFIELD_LOG(INFO, "engine") << "Initialized: " << animation.particle_count
                                   << " particles, mode=" << mode_to_string(pImpl->context.mode);
}

AnimationEngine::~AnimationEngine() {
    stop();
}

void AnimationEngine::setRenderer(std::shared_ptr<IParticleRenderer> renderer) {
    pImpl->renderer = std::move(renderer);
}

void AnimationEngine::setMode(Mode mode) {
    if (pImpl->context.mode == mode) {
        return;
    }
    pImpl->context.mode = mode;
    HEARTFIELD_LOG(INFO, "engine") << "Mode switched to " << mode_to_string(mode);
}

bool AnimationEngine::setMode(const std::string& name) {
    Mode mode;
    if (!parse_mode(name, mode)) {
        HEARTFIELD_LOG(WARNING, "engine") << "Invalid mode '" << name << "', keeping "
                                          << mode_to_string(pImpl->context.mode);
        return false;
    }
    setMode(mode);
    return true;
}

Mode AnimationEngine::getMode() const {
    return pImpl->context.mode;
}

bool AnimationEngine::tick() {
    if (!pImpl->running.load()) {
        return false;
    }

    // One snapshot per tick: regeneration during the pass cannot mix arrays
    const std::shared_ptr<const TargetSnapshot> targets = pImpl->loadTargets();

    AnimationContext& ctx = pImpl->context;
    const AnimationConfig& cfg = pImpl->config;

    ctx.time += cfg.time_step;

    const bool heart_mode = ctx.mode == Mode::HEART;
    const float heartbeat = heart_mode
        ? 1.0f + cfg.heartbeat_amplitude * std::sin(ctx.time * cfg.heartbeat_speed)
        : 1.0f;

    const ParticleSet& target = heart_mode ? targets->heart : targets->starfield;
    const float easing = cfg.easing;
    const size_t count = ctx.live.size();

    for (size_t i = 0; i < count; ++i) {
        cv::Point3f& p = ctx.live[i];
        const cv::Point3f goal = target[i] * heartbeat;
        p.x += (goal.x - p.x) * easing;
        p.y += (goal.y - p.y) * easing;
        p.z += (goal.z - p.z) * easing;
    }

    RotationState& rot = ctx.rotation;
    rot.current_pitch += (rot.target_pitch - rot.current_pitch) * cfg.rotation_easing;
    rot.current_yaw += (rot.target_yaw - rot.current_yaw) * cfg.rotation_easing;

    if (pImpl->renderer) {
        RenderFrame frame{ctx.live,
                          pImpl->appearance.colors,
                          pImpl->appearance.sizes,
                          rot.current_yaw,
                          rot.current_pitch,
                          ctx.mode,
                          ctx.time,
                          ctx.frame_count};
        pImpl->renderer->render(frame);
    }

    ++ctx.frame_count;
    return true;
}

void AnimationEngine::setTargetRotation(float norm_x, float norm_y) {
    pImpl->orientation.setTargetFromInput(norm_x, norm_y);
}

void AnimationEngine::regenerateTargets() {
    regenerateTargets(randomSeed());
}

void AnimationEngine::regenerateTargets(uint32_t seed) {
    pImpl->publishTargets(seed);
    HEARTFIELD_LOG(INFO, "engine") << "Targets regenerated";
}

void AnimationEngine::start() {
    if (!pImpl->running.exchange(true)) {
        HEARTFIELD_LOG(INFO, "engine") << "Animation started";
    }
}

void AnimationEngine::stop() {
    if (pImpl->running.exchange(false)) {
        HEARTFIELD_LOG(INFO, "engine") << "Animation stopped";
    }
}

bool AnimationEngine::isRunning() const {
    return pImpl->running.load();
}

size_t AnimationEngine::particleCount() const {
    return pImpl->config.particle_count;
}

const ParticleSet& AnimationEngine::livePositions() const {
    return pImpl->context.live;
}

std::shared_ptr<const TargetSnapshot> AnimationEngine::targets() const {
    return pImpl->loadTargets();
}

RotationState AnimationEngine::rotation() const {
    return pImpl->context.rotation;
}

float AnimationEngine::time() const {
    return pImpl->context.time;
}

uint64_t AnimationEngine::frameCount() const {
    return pImpl->context.frame_count;
}

const ParticleAppearance& AnimationEngine::appearance() const {
    return pImpl->appearance;
}

const AnimationConfig& AnimationEngine::config() const {
    return pImpl->config;
}

OrientationController& AnimationEngine::orientation() {
    return pImpl->orientation;
}

} // namespace particles
} // namespace heartfield
