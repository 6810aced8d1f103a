/**
 * @file DebounceStateMachine.hpp
 * @brief Temporal debouncing of per-frame gesture labels
 *
 * A new state is confirmed only after debounce_frames consecutive frames agree
 * on it. UNKNOWN frames and frames matching the confirmed state clear the
 * pending run, so a single ambiguous frame restarts the count.
 *
 * Thread-safety: Not thread-safe. Drive from the tracking thread only.
 */

#ifndef HEARTFIELD_GESTURE_DEBOUNCE_STATE_MACHINE_HPP
#define HEARTFIELD_GESTURE_DEBOUNCE_STATE_MACHINE_HPP

#include <optional>
#include "GestureTypes.hpp"
#include "GestureClassifier.hpp"

namespace heartfield {
namespace gesture {

class DebounceStateMachine {
public:
    /**
     * @param config Classifier thresholds and debounce_frames (must be >= 1)
     */
    explicit DebounceStateMachine(const GestureConfig& config = GestureConfig());

    /**
     * @brief Classify a frame and feed the label through the debouncer
     *
     * @return The newly confirmed state on the frame that confirms it,
     *         std::nullopt on every other frame
     */
    std::optional<ConfirmedState> update(const HandLandmarks& landmarks);

    /**
     * @brief Feed a pre-classified label
     */
    std::optional<ConfirmedState> updateLabel(GestureLabel label);

    ConfirmedState currentState() const { return confirmed_; }

    /**
     * @brief Label currently accumulating agreement (UNKNOWN when none)
     */
    GestureLabel pendingLabel() const { return pending_; }

    int pendingCount() const { return pendingCount_; }

    int threshold() const { return threshold_; }

    const GestureClassifier& classifier() const { return classifier_; }

    /**
     * @brief Back to Confirmed(NONE) with no pending run
     */
    void reset();

private:
    void clearPending();

    GestureClassifier classifier_;
    int threshold_;

    ConfirmedState confirmed_ = ConfirmedState::NONE;
    GestureLabel pending_ = GestureLabel::UNKNOWN;
    int pendingCount_ = 0;
};

/**
 * @brief Map a non-UNKNOWN label to its confirmed state (UNKNOWN -> NONE)
 */
ConfirmedState to_confirmed_state(GestureLabel label);

} // namespace gesture
} // namespace heartfield

#endif // HEARTFIELD_GESTURE_DEBOUNCE_STATE_MACHINE_HPP
