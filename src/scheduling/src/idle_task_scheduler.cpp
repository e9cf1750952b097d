#include "scheduling/idle_task_scheduler.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace mrc::scheduling {

namespace {

std::string ms_str(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fms", ms);
    return buf;
}

} // namespace

const char* to_string(IdleTaskPriority p) noexcept {
    switch(p) {
        case IdleTaskPriority::Low: return "low";
        case IdleTaskPriority::Medium: return "medium";
        case IdleTaskPriority::High: return "high";
        case IdleTaskPriority::Critical: return "critical";
    }
    return "unknown";
}

IdleTaskScheduler::IdleTaskScheduler(core::Scheduler& host, const core::Clock& clock, IdleSchedulerConfig config)
    : host_(host), clock_(clock), config_(config) {
    if(!(config_.frame_budget_ms > 0.0)) {
        log::warn("[IdleTask] frame_budget_ms must be positive, using 16");
        config_.frame_budget_ms = 16.0;
    }
    if(!(config_.min_task_budget_ms >= 0.0)) {
        log::warn("[IdleTask] min_task_budget_ms invalid, using 0");
        config_.min_task_budget_ms = 0.0;
    }
    if(!(config_.gc_hint_cooldown_ms >= 0.0)) {
        log::warn("[IdleTask] gc_hint_cooldown_ms invalid, using 0");
        config_.gc_hint_cooldown_ms = 0.0;
    }
}

IdleTaskScheduler::~IdleTaskScheduler() {
    *alive_ = false;
    shutdown();
}

uint64_t IdleTaskScheduler::schedule_task(Action action, IdleTaskPriority priority, std::string name) {
    if(!action) throw std::invalid_argument("IdleTaskScheduler::schedule_task requires an action");
    if(shut_down_) {
        log::warn("[IdleTask] rejected '" + name + "': scheduler shut down");
        return 0;
    }
    const uint64_t seq = next_seq_++;
    if(name.empty()) name = "task#" + std::to_string(seq);
    if(config_.enable_diagnostics) log::debug("[IdleTask] queued " + name + " (" + to_string(priority) + ")");

    queues_[static_cast<size_t>(priority)].push_back(IdleTask{std::move(action), std::move(name), priority, clock_.now_ms(), seq});
    ++scheduled_;
    request_slot();
    return seq;
}

void IdleTaskScheduler::request_slot() {
    if(slot_pending_ || shut_down_) return;
    slot_pending_ = true;
    std::weak_ptr<bool> alive = alive_;
    host_.schedule_idle([this, alive](double frame_elapsed_ms) {
        auto token = alive.lock();
        if(!token || !*token) return;
        run_slot(frame_elapsed_ms);
    });
}

std::deque<IdleTaskScheduler::IdleTask>* IdleTaskScheduler::next_queue(uint64_t seq_limit) {
    for(auto it = queues_.rbegin(); it != queues_.rend(); ++it) {
        if(!it->empty() && it->front().seq < seq_limit) return &*it;
    }
    return nullptr;
}

void IdleTaskScheduler::run_slot(double frame_elapsed_ms) {
    slot_pending_ = false;
    if(shut_down_) return;
    ++slots_;

    if(!(frame_elapsed_ms >= 0.0)) frame_elapsed_ms = 0.0;
    const double slot_start = clock_.now_ms();
    // Tasks queued from inside this slot belong to the next one.
    const uint64_t seq_limit = next_seq_;

    while(auto* queue = next_queue(seq_limit)) {
        const double now = clock_.now_ms();
        const double remaining = config_.frame_budget_ms - (frame_elapsed_ms + (now - slot_start));
        if(remaining < config_.min_task_budget_ms) {
            ++deferred_;
            if(config_.enable_diagnostics) {
                log::debug("[IdleTask] deferred " + std::to_string(queued()) + " tasks, " + ms_str(remaining) + " left in frame");
            }
            break;
        }

        IdleTask task = std::move(queue->front());
        queue->pop_front();
        max_wait_ms_ = std::max(max_wait_ms_, now - task.enqueued_at_ms);

        try {
            task.action();
            ++completed_;
        } catch(const std::exception& e) {
            ++failed_;
            log::error("[IdleTask] " + task.name + " failed: " + e.what());
        }

        const double end = clock_.now_ms();
        if(frame_elapsed_ms + (end - slot_start) > config_.frame_budget_ms) {
            ++overruns_;
            log::debug("[IdleTask] " + task.name + " overran frame budget (" + ms_str(end - now) + " run, " +
                       ms_str(config_.frame_budget_ms) + " budget)");
        } else if(config_.enable_diagnostics) {
            log::debug("[IdleTask] completed " + task.name + " (" + ms_str(end - now) + ")");
        }
        if(shut_down_) return;
    }

    if(queued() > 0) request_slot();
}

bool IdleTaskScheduler::maybe_gc_hint(const std::string& reason) {
    const double now = clock_.now_ms();
    if(gc_hinted_ && (now - last_gc_hint_ms_) < config_.gc_hint_cooldown_ms) return false;
    gc_hinted_ = true;
    last_gc_hint_ms_ = now;
    ++gc_hints_;
    log::debug("[GCHint] hint #" + std::to_string(gc_hints_) + (reason.empty() ? std::string() : " (" + reason + ")"));
    if(gc_sink_) gc_sink_(reason);
    return true;
}

void IdleTaskScheduler::shutdown() {
    size_t n = queued();
    for(auto& q : queues_) q.clear();
    dropped_ += n;
    if(!shut_down_ && n > 0) log::debug("[IdleTask] shutdown dropped " + std::to_string(n) + " tasks");
    shut_down_ = true;
}

size_t IdleTaskScheduler::queued() const {
    size_t n = 0;
    for(const auto& q : queues_) n += q.size();
    return n;
}

IdleTaskStats IdleTaskScheduler::stats() const {
    IdleTaskStats st;
    st.queued = queued();
    st.scheduled = scheduled_;
    st.completed = completed_;
    st.failed = failed_;
    st.deferred = deferred_;
    st.overruns = overruns_;
    st.dropped = dropped_;
    st.slots = slots_;
    st.gc_hints = gc_hints_;
    st.max_wait_ms = max_wait_ms_;
    return st;
}

} // namespace mrc::scheduling
