#include "heartfield/core/TickScheduler.hpp"
#include "heartfield/core/exception.h"
#include "heartfield/core/Logger.hpp"
#include <chrono>
#include <thread>

namespace heartfield {
namespace core {

namespace {

// Clears the running flag however run() leaves, including a throwing step
class RunningFlagGuard {
public:
    explicit RunningFlagGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningFlagGuard() { flag_.store(false); }

    RunningFlagGuard(const RunningFlagGuard&) = delete;
    RunningFlagGuard& operator=(const RunningFlagGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

TickScheduler::TickScheduler(double target_fps)
    : target_fps_(target_fps) {
    if (target_fps < 0.0) {
        HEARTFIELD_THROW(InvalidParameterException, "target_fps must not be negative");
    }
}

uint64_t TickScheduler::run(const std::function<bool()>& step, uint64_t max_frames) {
    if (running_.exchange(true)) {
        LOG_WARNING("TickScheduler: run() called while already running");
        return 0;
    }
    RunningFlagGuard guard(running_);

    const auto period = target_fps_ > 0.0
        ? std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / target_fps_))
        : Clock::duration::zero();

    uint64_t frames = 0;
    double total_ms = 0.0;
    Timestamp next = Clock::now();

    while (running_.load() && (max_frames == 0 || frames < max_frames)) {
        const Timestamp begin = Clock::now();
        const bool keep_going = step();
        total_ms += std::chrono::duration<double, std::milli>(Clock::now() - begin).count();
        ++frames;
        if (!keep_going) {
            break;
        }

        next += period;
        const Timestamp now = Clock::now();
        if (next > now) {
            std::this_thread::sleep_until(next);
        } else {
            // Fell behind, do not try to catch up with a burst of ticks
            next = now;
        }
    }

    average_step_ms_ = frames > 0 ? total_ms / static_cast<double>(frames) : 0.0;
    LOG_DEBUG("TickScheduler: Ran " + std::to_string(frames) + " frames, avg step " +
              std::to_string(average_step_ms_) + " ms");
    return frames;
}

void TickScheduler::stop() {
    running_.store(false);
}

} // namespace core
} // namespace heartfield
