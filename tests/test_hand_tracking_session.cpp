/**
 * @file test_hand_tracking_session.cpp
 * @brief Unit tests for HandTrackingSession and SyntheticHandSource
 */

#include <gtest/gtest.h>
#include <heartfield/gesture/HandTrackingSession.hpp>
#include <heartfield/gesture/SyntheticHandSource.hpp>
#include <heartfield/core/Logger.hpp>
#include "fakes/ScriptedHandSource.hpp"
#include <vector>

using namespace heartfield;
using namespace heartfield::gesture;
using heartfield::fakes::ScriptedHandSource;

class HandTrackingSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::ERROR);

        source_ = std::make_shared<ScriptedHandSource>();
        session_ = std::make_unique<HandTrackingSession>(source_);
        session_->setStateChangeCallback([this](ConfirmedState state) { states_.push_back(state); });
        session_->setHandPositionCallback([this](float x, float y) { positions_.emplace_back(x, y); });
    }

    /// Process every queued frame
    void drain() {
        while (!source_->frames.empty()) {
            session_->processFrame();
        }
    }

    std::shared_ptr<ScriptedHandSource> source_;
    std::unique_ptr<HandTrackingSession> session_;
    std::vector<ConfirmedState> states_;
    std::vector<cv::Point2f> positions_;
};

TEST_F(HandTrackingSessionTest, StartOpensSource) {
    EXPECT_EQ(session_->start(), core::ResultCode::SUCCESS);
    EXPECT_TRUE(session_->isRunning());
    EXPECT_TRUE(source_->isOpen());

    // Second start is a no-op
    EXPECT_EQ(session_->start(), core::ResultCode::SUCCESS);
    EXPECT_EQ(source_->open_calls, 1);
}

TEST_F(HandTrackingSessionTest, UnavailableSourceReportsError) {
    source_->open_succeeds = false;
    EXPECT_EQ(session_->start(), core::ResultCode::ERROR_CAMERA_NOT_FOUND);
    EXPECT_FALSE(session_->isRunning());
    EXPECT_FALSE(session_->lastError().empty());
    EXPECT_FALSE(session_->processFrame());
}

TEST_F(HandTrackingSessionTest, MissingSourceIsInvalidParameter) {
    HandTrackingSession session(nullptr);
    EXPECT_EQ(session.start(), core::ResultCode::ERROR_INVALID_PARAMETER);
    EXPECT_FALSE(session.isRunning());
}

TEST_F(HandTrackingSessionTest, ConfirmsAfterFiveAgreeingFrames) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    source_->push(SyntheticHandSource::makeHand(0.9f), 4);
    drain();
    EXPECT_TRUE(states_.empty());

    source_->push(SyntheticHandSource::makeHand(0.9f));
    drain();
    ASSERT_EQ(states_.size(), 1u);
    EXPECT_EQ(states_[0], ConfirmedState::FIST);
    EXPECT_EQ(session_->currentState(), ConfirmedState::FIST);
    EXPECT_EQ(session_->lastLabel(), GestureLabel::FIST);

    // Staying in a fist publishes nothing new
    source_->push(SyntheticHandSource::makeHand(0.9f), 10);
    drain();
    EXPECT_EQ(states_.size(), 1u);

    source_->push(SyntheticHandSource::makeHand(1.7f), 5);
    drain();
    ASSERT_EQ(states_.size(), 2u);
    EXPECT_EQ(states_[1], ConfirmedState::OPEN);
}

TEST_F(HandTrackingSessionTest, NoHandFramesDoNotTouchDebounce) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    source_->push(SyntheticHandSource::makeHand(0.9f), 3);
    source_->pushNoHand(4);
    source_->push(SyntheticHandSource::makeHand(0.9f), 2);
    drain();

    ASSERT_EQ(states_.size(), 1u);
    EXPECT_EQ(states_[0], ConfirmedState::FIST);
    EXPECT_EQ(session_->framesProcessed(), 9u);
    EXPECT_EQ(session_->framesWithHand(), 5u);
    EXPECT_EQ(positions_.size(), 5u);
}

TEST_F(HandTrackingSessionTest, LowConfidenceDetectionsCountAsNoHand) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    HandLandmarks weak = SyntheticHandSource::makeHand(0.9f);
    weak.confidence = 0.3f;
    HandLandmarks strong = SyntheticHandSource::makeHand(0.9f);
    strong.confidence = 0.8f;

    source_->push(strong, 3);
    source_->push(weak, 5);
    source_->push(strong, 1);
    drain();
    EXPECT_TRUE(states_.empty());
    EXPECT_EQ(session_->debouncer().pendingCount(), 4);
    EXPECT_EQ(session_->framesWithHand(), 4u);
    EXPECT_EQ(session_->framesLowConfidence(), 5u);
    EXPECT_EQ(positions_.size(), 4u);

    source_->push(strong);
    drain();
    ASSERT_EQ(states_.size(), 1u);
    EXPECT_EQ(states_[0], ConfirmedState::FIST);
}

TEST_F(HandTrackingSessionTest, AmbiguousFrameRestartsCount) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    source_->push(SyntheticHandSource::makeHand(0.9f), 4);
    source_->push(SyntheticHandSource::makeHand({1.7f, 1.7f, 1.7f, 0.9f, 0.9f}));
    source_->push(SyntheticHandSource::makeHand(0.9f), 4);
    drain();
    EXPECT_TRUE(states_.empty());
    EXPECT_EQ(session_->debouncer().pendingCount(), 4);
}

TEST_F(HandTrackingSessionTest, PalmPositionIsMappedToUnitRange) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    source_->push(SyntheticHandSource::makeHand(1.7f, cv::Point2f(0.75f, 0.25f)));
    source_->push(SyntheticHandSource::makeHand(1.7f, cv::Point2f(0.5f, 0.5f)));
    drain();

    ASSERT_EQ(positions_.size(), 2u);
    EXPECT_NEAR(positions_[0].x, 0.5f, 1e-5f);
    EXPECT_NEAR(positions_[0].y, -0.5f, 1e-5f);
    EXPECT_NEAR(positions_[1].x, 0.0f, 1e-5f);
    EXPECT_NEAR(positions_[1].y, 0.0f, 1e-5f);
}

TEST_F(HandTrackingSessionTest, SourceErrorIsReportedAndTrackingContinues) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    source_->throw_next = true;
    EXPECT_FALSE(session_->processFrame());
    EXPECT_NE(session_->lastError().find("landmark model failure"), std::string::npos);
    EXPECT_TRUE(session_->isRunning());

    source_->push(SyntheticHandSource::makeHand(1.7f));
    EXPECT_TRUE(session_->processFrame());
}

TEST_F(HandTrackingSessionTest, StopIsIdempotentAndClosesSource) {
    ASSERT_EQ(session_->start(), core::ResultCode::SUCCESS);
    source_->push(SyntheticHandSource::makeHand(0.9f), 5);
    drain();
    ASSERT_EQ(session_->currentState(), ConfirmedState::FIST);

    session_->stop();
    session_->stop();
    EXPECT_FALSE(session_->isRunning());
    EXPECT_FALSE(source_->isOpen());
    EXPECT_EQ(source_->close_calls, 1);
    EXPECT_EQ(session_->currentState(), ConfirmedState::NONE);

    source_->push(SyntheticHandSource::makeHand(0.9f));
    EXPECT_FALSE(session_->processFrame());
}

TEST(SyntheticHandSourceTest, PlaysScriptInOrder) {
    HandScriptSegment open;
    open.extension_ratio = 1.7f;
    open.frames = 2;
    HandScriptSegment hidden;
    hidden.visible = false;
    hidden.frames = 1;
    HandScriptSegment fist;
    fist.extension_ratio = 0.9f;
    fist.frames = 1;

    SyntheticHandSource source({open, hidden, fist});
    EXPECT_FALSE(source.nextFrame().has_value());  // not open yet
    ASSERT_TRUE(source.open());

    GestureClassifier classifier;
    auto f1 = source.nextFrame();
    auto f2 = source.nextFrame();
    auto f3 = source.nextFrame();
    auto f4 = source.nextFrame();
    ASSERT_TRUE(f1 && f2 && f4);
    EXPECT_FALSE(f3.has_value());
    EXPECT_EQ(classifier.classify(*f1), GestureLabel::OPEN);
    EXPECT_EQ(classifier.classify(*f2), GestureLabel::OPEN);
    EXPECT_EQ(classifier.classify(*f4), GestureLabel::FIST);

    EXPECT_TRUE(source.finished());
    EXPECT_FALSE(source.nextFrame().has_value());
}

TEST(SyntheticHandSourceTest, LoopsAndMovesPalm) {
    HandScriptSegment sweep;
    sweep.frames = 3;
    sweep.palm_from = cv::Point2f(0.2f, 0.5f);
    sweep.palm_to = cv::Point2f(0.8f, 0.5f);

    SyntheticHandSource source({sweep}, true);
    ASSERT_TRUE(source.open());

    std::vector<float> xs;
    for (int i = 0; i < 6; ++i) {
        auto frame = source.nextFrame();
        ASSERT_TRUE(frame.has_value());
        xs.push_back(GestureClassifier::palmCenter(*frame).x);
    }
    EXPECT_NEAR(xs[0], 0.2f, 1e-5f);
    EXPECT_NEAR(xs[1], 0.5f, 1e-5f);
    EXPECT_NEAR(xs[2], 0.8f, 1e-5f);
    EXPECT_NEAR(xs[3], 0.2f, 1e-5f);
    EXPECT_FALSE(source.finished());
}

TEST(SyntheticHandSourceTest, UnavailableSourceDoesNotOpen) {
    SyntheticHandSource source(SyntheticHandSource::demoScript());
    source.setAvailable(false);
    EXPECT_FALSE(source.open());
    EXPECT_FALSE(source.isOpen());
    EXPECT_FALSE(source.nextFrame().has_value());
}

TEST(SyntheticHandSourceTest, DemoScriptConfirmsFistThenOpen) {
    core::Logger::getInstance().setLevel(core::LogLevel::ERROR);

    auto source = std::make_shared<SyntheticHandSource>(SyntheticHandSource::demoScript());
    HandTrackingSession session(source);
    std::vector<ConfirmedState> states;
    session.setStateChangeCallback([&](ConfirmedState s) { states.push_back(s); });
    ASSERT_EQ(session.start(), core::ResultCode::SUCCESS);

    while (!source->finished()) {
        session.processFrame();
    }
    EXPECT_EQ(states, (std::vector<ConfirmedState>{ConfirmedState::OPEN, ConfirmedState::FIST, ConfirmedState::OPEN}));
}
