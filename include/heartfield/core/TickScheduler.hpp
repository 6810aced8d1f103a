#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include "heartfield/core/types.hpp"

namespace heartfield {
namespace core {

/**
 * @brief Fixed-rate loop driving the display tick
 *
 * run() calls the step function about target_fps times per second until the
 * step returns false, max_frames is reached or stop() is called. stop() may
 * be called from the step itself or from another thread.
 */
class TickScheduler {
public:
    /**
     * @param target_fps Tick rate; 0 runs the steps back to back
     * @throws InvalidParameterException if target_fps is negative
     */
    explicit TickScheduler(double target_fps = 60.0);

    /**
     * @brief Run the loop on the calling thread
     * @param max_frames 0 = unlimited
     * @return Number of completed steps
     */
    uint64_t run(const std::function<bool()>& step, uint64_t max_frames = 0);

    void stop();

    bool isRunning() const { return running_.load(); }

    double targetFps() const { return target_fps_; }

    /**
     * @brief Average duration of the step function in the last run (ms)
     */
    double averageStepMs() const { return average_step_ms_; }

private:
    double target_fps_;
    std::atomic<bool> running_{false};
    double average_step_ms_ = 0.0;
};

} // namespace core
} // namespace heartfield
