#include "warmup/startup_warm_cycle.hpp"
#include "core/log.hpp"
#include "scheduling/idle_task_scheduler.hpp"

#include <stdexcept>

namespace mrc::warmup {

const char* to_string(WarmState s) noexcept {
    switch(s) {
        case WarmState::Idle: return "idle";
        case WarmState::Running: return "running";
        case WarmState::Completed: return "completed";
        case WarmState::Cancelled: return "cancelled";
    }
    return "unknown";
}

StartupWarmCycle::StartupWarmCycle(scheduling::IdleTaskScheduler& idle, std::vector<WarmStep> steps)
    : idle_(idle), steps_(std::move(steps)) {
    for(const auto& s : steps_) {
        if(!s.fn) throw std::invalid_argument("StartupWarmCycle: step '" + s.name + "' has no function");
    }
}

StartupWarmCycle::~StartupWarmCycle() {
    *alive_ = false;
}

bool StartupWarmCycle::run(WarmContext ctx, CompleteCallback on_complete, ProgressCallback on_progress) {
    if(state_ == WarmState::Running) {
        log::warn("[Warmup] run() ignored: already running");
        return false;
    }
    ctx_ = ctx;
    on_complete_ = std::move(on_complete);
    on_progress_ = std::move(on_progress);
    state_ = WarmState::Running;
    cancel_requested_ = false;
    steps_run_ = 0;
    failed_ = 0;
    ++generation_;

    log::info("[Warmup] starting " + std::to_string(steps_.size()) + " steps");
    if(steps_.empty()) {
        finish();
        return true;
    }
    schedule_step(0);
    return true;
}

void StartupWarmCycle::cancel() {
    if(state_ != WarmState::Running) return;
    if(in_step_) {
        cancel_requested_ = true;
        log::info("[Warmup] cancel requested during step " + std::to_string(steps_run_ + 1) + "/" +
                  std::to_string(steps_.size()));
        return;
    }
    // Nothing is executing: the queued step becomes a no-op.
    state_ = WarmState::Cancelled;
    ++generation_;
    log::info("[Warmup] cancelled after " + std::to_string(steps_run_) + "/" + std::to_string(steps_.size()) +
              " steps");
}

void StartupWarmCycle::schedule_step(size_t index) {
    const uint64_t generation = generation_;
    std::weak_ptr<bool> alive = alive_;
    const uint64_t id = idle_.schedule_task(
        [this, alive, index, generation] {
            auto token = alive.lock();
            if(!token || !*token) return;
            run_step(index, generation);
        },
        scheduling::IdleTaskPriority::High, "warm:" + steps_[index].name);
    if(id == 0) {
        log::warn("[Warmup] idle scheduler unavailable, warm-up cancelled");
        state_ = WarmState::Cancelled;
    }
}

void StartupWarmCycle::run_step(size_t index, uint64_t generation) {
    if(generation != generation_ || state_ != WarmState::Running) return;
    if(cancel_requested_) {
        state_ = WarmState::Cancelled;
        log::info("[Warmup] cancelled before step " + steps_[index].name);
        return;
    }

    struct StepScope {
        bool& flag;
        explicit StepScope(bool& f) : flag(f) { flag = true; }
        ~StepScope() { flag = false; }
    };

    const WarmStep& step = steps_[index];
    StepScope scope(in_step_);
    try {
        step.fn(ctx_);
        log::debug("[Warmup] step " + std::to_string(index + 1) + "/" + std::to_string(steps_.size()) + " " +
                   step.name + " done");
    } catch(const std::exception& e) {
        ++failed_;
        log::error("[Warmup] step " + step.name + " failed: " + e.what());
    }
    ++steps_run_;
    if(on_progress_) on_progress_(steps_run_, steps_.size());
    scope.flag = false;

    // The step or the progress callback may have cancelled or restarted the cycle.
    if(generation != generation_) return;
    if(cancel_requested_) {
        state_ = WarmState::Cancelled;
        log::info("[Warmup] cancelled after " + std::to_string(steps_run_) + "/" + std::to_string(steps_.size()) +
                  " steps");
        return;
    }
    if(index + 1 < steps_.size()) schedule_step(index + 1);
    else finish();
}

void StartupWarmCycle::finish() {
    state_ = WarmState::Completed;
    log::info("[Warmup] completed " + std::to_string(steps_run_) + " steps (" + std::to_string(failed_) + " failed)");
    if(on_complete_) on_complete_();
}

double StartupWarmCycle::progress() const {
    if(steps_.empty()) return state_ == WarmState::Completed ? 1.0 : 0.0;
    return double(steps_run_) / double(steps_.size());
}

} // namespace mrc::warmup
