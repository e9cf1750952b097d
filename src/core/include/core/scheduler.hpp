#pragma once
#include <cstdint>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>

#include "core/clock.hpp"

namespace mrc::core {

using TimerId = uint64_t;

/**
 * @brief Host scheduling capability
 *
 * The core never owns a thread or a timer. Hosts hand it this interface and
 * call back from their per-frame and post-frame hooks.
 */
class Scheduler {
public:
    using Task = std::function<void()>;
    // Receives the milliseconds the current frame has already consumed.
    using IdleCallback = std::function<void(double frame_elapsed_ms)>;

    virtual ~Scheduler() = default;

    /**
     * @brief Run a task once after a delay
     * @return Handle usable with cancel(); never 0
     */
    virtual TimerId schedule_once(double delay_ms, Task fn) = 0;

    /**
     * @brief Cancel a pending one-shot task
     * @return true if the task was still pending
     */
    virtual bool cancel(TimerId id) = 0;

    /**
     * @brief Run a callback in the next idle (post-frame) slot
     */
    virtual void schedule_idle(IdleCallback fn) = 0;
};

// Scheduler pumped from the host's frame loop. advance() belongs in the
// per-frame hook, run_idle() after the frame has been submitted.
class FrameDrivenScheduler final : public Scheduler {
public:
    explicit FrameDrivenScheduler(const Clock& clock) : clock_(clock) {}

    TimerId schedule_once(double delay_ms, Task fn) override;
    bool cancel(TimerId id) override;
    void schedule_idle(IdleCallback fn) override;

    // Fires timers due at clock.now_ms(), earliest first, ties in scheduling
    // order. Timers added while firing wait for the next call.
    size_t advance();

    // Runs idle callbacks queued before this call.
    size_t run_idle(double frame_elapsed_ms);

    size_t pending_timers() const { return timers_.size(); }
    size_t pending_idle() const { return idle_.size(); }

private:
    struct Timer { double due_ms = 0.0; Task fn; };

    const Clock& clock_;
    std::map<TimerId, Timer> timers_;
    std::deque<IdleCallback> idle_;
    TimerId next_id_ = 1;
};

} // namespace mrc::core
