/**
 * @file test_interaction_controller.cpp
 * @brief Unit tests for gesture/pointer routing into the animation engine
 */

#include <gtest/gtest.h>
#include <heartfield/app/InteractionController.hpp>
#include <heartfield/gesture/SyntheticHandSource.hpp>
#include <heartfield/core/Logger.hpp>
#include "fakes/ScriptedHandSource.hpp"
#include <cmath>

using namespace heartfield;
using gesture::ConfirmedState;
using particles::Mode;

class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::ERROR);

        particles::AnimationConfig config;
        config.particle_count = 200;
        engine_ = std::make_unique<particles::AnimationEngine>(config);
        notifications_ = std::make_shared<app::LogNotificationSink>();
        controller_ = std::make_unique<app::InteractionController>(*engine_, notifications_);
    }

    void enableFallback() {
        controller_->enableFallback(viewport_);
    }

    const cv::Size viewport_{960, 720};
    std::unique_ptr<particles::AnimationEngine> engine_;
    std::shared_ptr<app::LogNotificationSink> notifications_;
    std::unique_ptr<app::InteractionController> controller_;
};

TEST_F(InteractionControllerTest, FistAssemblesHeartOpenScatters) {
    controller_->onConfirmedState(ConfirmedState::FIST);
    EXPECT_EQ(engine_->getMode(), Mode::HEART);
    EXPECT_EQ(notifications_->lastMessage(), "fist: heart assembling");

    controller_->onConfirmedState(ConfirmedState::OPEN);
    EXPECT_EQ(engine_->getMode(), Mode::STARFIELD);
    EXPECT_EQ(notifications_->lastMessage(), "open hand: starfield scattering");
    EXPECT_EQ(controller_->modeSwitches(), 2u);
}

TEST_F(InteractionControllerTest, RepeatedStateIsIgnored) {
    controller_->onConfirmedState(ConfirmedState::FIST);
    controller_->onConfirmedState(ConfirmedState::FIST);
    controller_->onConfirmedState(ConfirmedState::NONE);
    EXPECT_EQ(controller_->modeSwitches(), 1u);
    EXPECT_EQ(notifications_->count(), 1u);
    EXPECT_EQ(controller_->lastState(), ConfirmedState::FIST);
    EXPECT_EQ(engine_->getMode(), Mode::HEART);
}

TEST_F(InteractionControllerTest, HandPositionSteersRotation) {
    controller_->onHandPosition(0.5f, -0.2f);
    const float pi = static_cast<float>(M_PI);
    EXPECT_NEAR(engine_->rotation().target_yaw, -0.5f * pi * 1.5f, 1e-5f);
    EXPECT_NEAR(engine_->rotation().target_pitch, -0.2f * pi * 0.75f, 1e-5f);
}

TEST_F(InteractionControllerTest, SessionDrivesEngine) {
    auto source = std::make_shared<fakes::ScriptedHandSource>();
    gesture::HandTrackingSession session(source);
    ASSERT_EQ(controller_->startTracking(session, viewport_), core::ResultCode::SUCCESS);
    EXPECT_FALSE(controller_->fallbackEnabled());

    source->push(gesture::SyntheticHandSource::makeHand(0.9f, cv::Point2f(0.75f, 0.5f)), 5);
    for (int i = 0; i < 5; ++i) {
        session.processFrame();
    }
    EXPECT_EQ(engine_->getMode(), Mode::HEART);
    EXPECT_NEAR(engine_->rotation().target_yaw, -0.5f * static_cast<float>(M_PI) * 1.5f, 1e-4f);
}

TEST_F(InteractionControllerTest, TrackingFailureEnablesFallback) {
    auto source = std::make_shared<fakes::ScriptedHandSource>();
    source->open_succeeds = false;
    gesture::HandTrackingSession session(source);

    EXPECT_EQ(controller_->startTracking(session, viewport_), core::ResultCode::ERROR_CAMERA_NOT_FOUND);
    EXPECT_TRUE(controller_->fallbackEnabled());
    EXPECT_EQ(notifications_->count(), 2u);
    EXPECT_EQ(notifications_->lastMessage(), "click to switch mode, drag to rotate");
}

TEST_F(InteractionControllerTest, PointerIgnoredWithoutFallback) {
    controller_->pointerDown(100.0f, 100.0f);
    controller_->pointerUp(100.0f, 100.0f);
    controller_->touchStart(100.0f, 100.0f);
    controller_->touchEnd(100.0f, 100.0f);
    EXPECT_EQ(engine_->getMode(), Mode::STARFIELD);
    EXPECT_EQ(controller_->modeSwitches(), 0u);
}

TEST_F(InteractionControllerTest, ClickTogglesMode) {
    enableFallback();
    controller_->pointerDown(100.0f, 100.0f);
    controller_->pointerUp(103.0f, 105.0f);
    EXPECT_EQ(engine_->getMode(), Mode::HEART);
    EXPECT_EQ(notifications_->lastMessage(), "3D heart mode");

    controller_->pointerDown(200.0f, 200.0f);
    controller_->pointerUp(200.0f, 200.0f);
    EXPECT_EQ(engine_->getMode(), Mode::STARFIELD);
    EXPECT_EQ(notifications_->lastMessage(), "3D starfield mode");
}

TEST_F(InteractionControllerTest, DragRotatesWithoutToggling) {
    enableFallback();
    controller_->pointerDown(100.0f, 100.0f);
    controller_->pointerMove(148.0f, 100.0f);

    // 48 px of 960 * 20 = 1.0 horizontal input
    const float pi = static_cast<float>(M_PI);
    EXPECT_NEAR(engine_->rotation().target_yaw, -1.0f * pi * 1.5f, 1e-4f);
    EXPECT_NEAR(engine_->rotation().target_pitch, 0.0f, 1e-6f);

    controller_->pointerMove(148.0f, 109.0f);
    // Deltas are per move: 9 px of 720 * 20 = 0.25 vertical, no horizontal
    EXPECT_NEAR(engine_->rotation().target_yaw, 0.0f, 1e-6f);
    EXPECT_NEAR(engine_->rotation().target_pitch, 0.25f * pi * 0.75f, 1e-4f);

    controller_->pointerUp(148.0f, 109.0f);
    EXPECT_EQ(engine_->getMode(), Mode::STARFIELD);
    EXPECT_EQ(controller_->modeSwitches(), 0u);

    // Move without a press does nothing
    controller_->pointerMove(500.0f, 500.0f);
    EXPECT_NEAR(engine_->rotation().target_pitch, 0.25f * pi * 0.75f, 1e-4f);
}

TEST_F(InteractionControllerTest, TapTolerance) {
    enableFallback();
    controller_->touchStart(300.0f, 300.0f);
    controller_->touchEnd(309.0f, 291.0f);
    EXPECT_EQ(engine_->getMode(), Mode::HEART);

    controller_->touchStart(300.0f, 300.0f);
    controller_->touchMove(310.0f, 300.0f);
    controller_->touchEnd(310.0f, 300.0f);
    EXPECT_EQ(engine_->getMode(), Mode::HEART);
    EXPECT_EQ(controller_->modeSwitches(), 1u);
}

TEST_F(InteractionControllerTest, WorksWithoutNotificationSink) {
    app::InteractionController silent(*engine_);
    silent.onConfirmedState(ConfirmedState::FIST);
    EXPECT_EQ(engine_->getMode(), Mode::HEART);
}
