#include "heartfield/particles/OrientationController.hpp"
#include "heartfield/core/exception.h"
#include <algorithm>
#include <cmath>

namespace heartfield {
namespace particles {

OrientationController::OrientationController(RotationState& state, const OrientationConfig& config)
    : state_(state)
    , config_(config) {
    if (!config_.is_valid()) {
        HEARTFIELD_THROW(core::InvalidParameterException, "Invalid orientation configuration");
    }
}

void OrientationController::setTargetFromInput(float norm_x, float norm_y) {
    const float pi = static_cast<float>(M_PI);

    state_.target_yaw = -norm_x * pi * config_.sensitivity;

    const float pitch = norm_y * pi * 0.5f * config_.sensitivity;
    state_.target_pitch = std::max(-config_.pitch_limit, std::min(config_.pitch_limit, pitch));
}

} // namespace particles
} // namespace heartfield
