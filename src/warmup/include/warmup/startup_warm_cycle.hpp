#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "cache/entity_types.hpp"

namespace mrc::scheduling { class IdleTaskScheduler; }

namespace mrc::warmup {

struct WarmContext {
    cache::GeoPoint center;
    double zoom = 0.0;
};

struct WarmStep {
    std::string name;
    std::function<void(const WarmContext&)> fn;
};

enum class WarmState : uint8_t { Idle, Running, Completed, Cancelled };

const char* to_string(WarmState s) noexcept;

/**
 * @brief Runs startup pre-work as a chain of idle tasks
 *
 * Each step is queued at High idle priority only after the previous one
 * finished, so warm-up interleaves with real frames. cancel() takes effect
 * at once unless it is called from inside a step or its progress callback;
 * then that step completes and nothing after it starts. A cancelled cycle
 * never fires the completion callback and may be run again. A throwing step
 * is logged and counted and the chain moves on.
 */
class StartupWarmCycle {
public:
    using CompleteCallback = std::function<void()>;
    using ProgressCallback = std::function<void(size_t steps_done, size_t total)>;

    // Throws std::invalid_argument if a step has no function.
    StartupWarmCycle(scheduling::IdleTaskScheduler& idle, std::vector<WarmStep> steps);
    ~StartupWarmCycle();

    StartupWarmCycle(const StartupWarmCycle&) = delete;
    StartupWarmCycle& operator=(const StartupWarmCycle&) = delete;

    // Returns false (and does nothing) while a run is in progress.
    bool run(WarmContext ctx, CompleteCallback on_complete = {}, ProgressCallback on_progress = {});
    void cancel();

    WarmState state() const { return state_; }
    size_t total_steps() const { return steps_.size(); }
    size_t steps_run() const { return steps_run_; }
    size_t failed_steps() const { return failed_; }
    // Fraction of steps run, 0..1.
    double progress() const;

private:
    void schedule_step(size_t index);
    void run_step(size_t index, uint64_t generation);
    void finish();

    scheduling::IdleTaskScheduler& idle_;
    std::vector<WarmStep> steps_;
    WarmContext ctx_;
    CompleteCallback on_complete_;
    ProgressCallback on_progress_;
    WarmState state_ = WarmState::Idle;
    bool cancel_requested_ = false;
    bool in_step_ = false;
    uint64_t generation_ = 0;
    size_t steps_run_ = 0;
    size_t failed_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace mrc::warmup
