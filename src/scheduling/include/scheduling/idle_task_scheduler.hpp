#pragma once
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "core/clock.hpp"
#include "core/scheduler.hpp"

namespace mrc::scheduling {

enum class IdleTaskPriority : uint8_t { Low = 0, Medium = 1, High = 2, Critical = 3 };

const char* to_string(IdleTaskPriority p) noexcept;

struct IdleSchedulerConfig {
    double frame_budget_ms = 16.0;
    // A task only starts if at least this much of the frame budget is left.
    double min_task_budget_ms = 4.0;
    double gc_hint_cooldown_ms = 2.0 * 60.0 * 1000.0;
    bool enable_diagnostics = false;
};

struct IdleTaskStats {
    size_t queued = 0;
    uint64_t scheduled = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t deferred = 0;    // slots that stopped early for lack of budget
    uint64_t overruns = 0;    // tasks that finished past the frame budget
    uint64_t dropped = 0;     // discarded by shutdown()
    uint64_t slots = 0;
    uint64_t gc_hints = 0;
    double max_wait_ms = 0.0; // longest enqueue-to-start delay observed
    double overrun_rate() const {
        const uint64_t ran = completed + failed;
        return ran ? double(overruns) / double(ran) : 0.0;
    }
};

/**
 * @brief Runs short maintenance tasks inside spare frame time
 *
 * Tasks are ordered Critical > High > Medium > Low, FIFO within a priority,
 * and are never preempted: long work has to be split into several tasks by
 * the caller. Budget overruns are measured after a task returns.
 */
class IdleTaskScheduler {
public:
    using Action = std::function<void()>;
    using GcHintSink = std::function<void(const std::string& reason)>;

    IdleTaskScheduler(core::Scheduler& host, const core::Clock& clock, IdleSchedulerConfig config = {});
    ~IdleTaskScheduler();

    IdleTaskScheduler(const IdleTaskScheduler&) = delete;
    IdleTaskScheduler& operator=(const IdleTaskScheduler&) = delete;

    /**
     * @brief Queue a task for the next idle slot
     * @return Task id, or 0 if the scheduler was shut down
     * @throws std::invalid_argument if the action is empty
     */
    uint64_t schedule_task(Action action, IdleTaskPriority priority = IdleTaskPriority::Medium, std::string name = {});

    // Advisory; at most one hint per cooldown. Returns true if a hint was emitted.
    bool maybe_gc_hint(const std::string& reason = {});
    void set_gc_hint_sink(GcHintSink sink) { gc_sink_ = std::move(sink); }

    // Drops every queued task without running it and refuses new ones.
    void shutdown();
    bool is_shut_down() const { return shut_down_; }

    size_t queued() const;
    IdleTaskStats stats() const;
    const IdleSchedulerConfig& config() const { return config_; }

private:
    struct IdleTask {
        Action action;
        std::string name;
        IdleTaskPriority priority = IdleTaskPriority::Medium;
        double enqueued_at_ms = 0.0;
        uint64_t seq = 0;
    };

    void request_slot();
    void run_slot(double frame_elapsed_ms);
    // Highest-priority queue whose head was enqueued before the slot began.
    std::deque<IdleTask>* next_queue(uint64_t seq_limit);

    core::Scheduler& host_;
    const core::Clock& clock_;
    IdleSchedulerConfig config_;
    std::array<std::deque<IdleTask>, 4> queues_; // indexed by priority
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    bool slot_pending_ = false;
    bool shut_down_ = false;
    uint64_t next_seq_ = 1;

    uint64_t scheduled_ = 0;
    uint64_t completed_ = 0;
    uint64_t failed_ = 0;
    uint64_t deferred_ = 0;
    uint64_t overruns_ = 0;
    uint64_t dropped_ = 0;
    uint64_t slots_ = 0;
    double max_wait_ms_ = 0.0;

    GcHintSink gc_sink_;
    bool gc_hinted_ = false;
    double last_gc_hint_ms_ = 0.0;
    uint64_t gc_hints_ = 0;
};

} // namespace mrc::scheduling
