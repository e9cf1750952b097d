#include "core/scheduler.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mrc::core {

TimerId FrameDrivenScheduler::schedule_once(double delay_ms, Task fn) {
    if(!fn) throw std::invalid_argument("schedule_once requires a task");
    if(!(delay_ms > 0.0)) delay_ms = 0.0; // NaN and negative delays run on the next advance
    TimerId id = next_id_++;
    timers_.emplace(id, Timer{clock_.now_ms() + delay_ms, std::move(fn)});
    return id;
}

bool FrameDrivenScheduler::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

void FrameDrivenScheduler::schedule_idle(IdleCallback fn) {
    if(!fn) throw std::invalid_argument("schedule_idle requires a callback");
    idle_.push_back(std::move(fn));
}

size_t FrameDrivenScheduler::advance() {
    const double now = clock_.now_ms();
    std::vector<std::pair<double, TimerId>> due;
    for(const auto& [id, timer] : timers_) {
        if(timer.due_ms <= now) due.emplace_back(timer.due_ms, id);
    }
    std::sort(due.begin(), due.end());

    size_t fired = 0;
    for(const auto& entry : due) {
        auto it = timers_.find(entry.second);
        if(it == timers_.end()) continue; // cancelled by an earlier timer
        Task fn = std::move(it->second.fn);
        timers_.erase(it);
        ++fired;
        try {
            fn();
        } catch(const std::exception& e) {
            log::error(std::string("[FrameScheduler] timer ") + std::to_string(entry.second) + " threw: " + e.what());
        }
    }
    return fired;
}

size_t FrameDrivenScheduler::run_idle(double frame_elapsed_ms) {
    std::deque<IdleCallback> batch;
    batch.swap(idle_);
    for(auto& cb : batch) {
        try {
            cb(frame_elapsed_ms);
        } catch(const std::exception& e) {
            log::error(std::string("[FrameScheduler] idle callback threw: ") + e.what());
        }
    }
    return batch.size();
}

} // namespace mrc::core
