/**
 * @file test_orientation_controller.cpp
 * @brief Unit tests for OrientationController
 */

#include <gtest/gtest.h>
#include <heartfield/particles/OrientationController.hpp>
#include <heartfield/core/exception.h>
#include <cmath>

using namespace heartfield::particles;

namespace {
const float PI = static_cast<float>(M_PI);
}

TEST(OrientationControllerTest, MapsInputToTargets) {
    RotationState state;
    OrientationController controller(state);

    controller.setTargetFromInput(0.2f, 0.1f);
    EXPECT_NEAR(state.target_yaw, -0.2f * PI * 1.5f, 1e-6f);
    EXPECT_NEAR(state.target_pitch, 0.1f * PI * 0.5f * 1.5f, 1e-6f);

    // Only targets are written
    EXPECT_FLOAT_EQ(state.current_yaw, 0.0f);
    EXPECT_FLOAT_EQ(state.current_pitch, 0.0f);
}

TEST(OrientationControllerTest, RightwardInputTurnsLeft) {
    RotationState state;
    OrientationController controller(state);
    controller.setTargetFromInput(0.5f, 0.0f);
    EXPECT_LT(state.target_yaw, 0.0f);
    controller.setTargetFromInput(-0.5f, 0.0f);
    EXPECT_GT(state.target_yaw, 0.0f);
    controller.setTargetFromInput(0.0f, 0.0f);
    EXPECT_FLOAT_EQ(state.target_yaw, 0.0f);
    EXPECT_FLOAT_EQ(state.target_pitch, 0.0f);
}

TEST(OrientationControllerTest, PitchIsClamped) {
    RotationState state;
    OrientationController controller(state);

    controller.setTargetFromInput(0.0f, 1.0f);
    EXPECT_FLOAT_EQ(state.target_pitch, 0.4f * PI);
    controller.setTargetFromInput(0.0f, -1.0f);
    EXPECT_FLOAT_EQ(state.target_pitch, -0.4f * PI);
    controller.setTargetFromInput(0.0f, 15.0f);
    EXPECT_FLOAT_EQ(state.target_pitch, 0.4f * PI);

    // Yaw is unbounded
    controller.setTargetFromInput(2.0f, 0.0f);
    EXPECT_NEAR(state.target_yaw, -2.0f * PI * 1.5f, 1e-5f);
}

TEST(OrientationControllerTest, CustomSensitivity) {
    RotationState state;
    OrientationConfig config;
    config.sensitivity = 1.0f;
    OrientationController controller(state, config);
    controller.setTargetFromInput(0.5f, 0.5f);
    EXPECT_NEAR(state.target_yaw, -0.5f * PI, 1e-6f);
    EXPECT_NEAR(state.target_pitch, 0.25f * PI, 1e-6f);
}

TEST(OrientationControllerTest, InvalidConfigurationThrows) {
    RotationState state;
    OrientationConfig config;
    config.pitch_limit = 0.6f * PI;
    EXPECT_THROW(OrientationController controller(state, config), heartfield::core::InvalidParameterException);

    config = OrientationConfig();
    config.sensitivity = 0.0f;
    EXPECT_THROW(OrientationController controller(state, config), heartfield::core::InvalidParameterException);
}
