#pragma once
#include <cstdint>
#include <functional>

#include "core/scheduler.hpp"

namespace mrc::cache { class ResourcePoolManager; }

namespace mrc::scheduling {

class IdleTaskScheduler;

struct MaintenancePolicy {
    double cleanup_interval_ms = 5.0 * 60.0 * 1000.0;
    double diagnostics_interval_ms = 2.0 * 60.0 * 1000.0;
    bool enable_cleanup = true;
    bool enable_diagnostics = false;
};

/**
 * @brief Periodic pool trimming and diagnostics on one-shot timers
 *
 * Each cleanup cycle queues one Medium idle trim per registered pool and then
 * a Low task that emits a GC hint if the cycle evicted anything.
 */
class MemoryMaintenance {
public:
    using DiagnosticsCallback = std::function<void()>;

    MemoryMaintenance(core::Scheduler& scheduler, IdleTaskScheduler& idle, cache::ResourcePoolManager& pools,
                      MaintenancePolicy policy = {});
    ~MemoryMaintenance();

    MemoryMaintenance(const MemoryMaintenance&) = delete;
    MemoryMaintenance& operator=(const MemoryMaintenance&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    void set_diagnostics_callback(DiagnosticsCallback cb) { on_diagnostics_ = std::move(cb); }

    // Queues one cleanup cycle now, outside the timer cadence.
    void run_cleanup();

    uint64_t cleanup_count() const { return cleanups_; }
    uint64_t diagnostics_count() const { return diagnostics_runs_; }
    // Entries evicted by maintenance trims since construction.
    uint64_t evicted_total() const { return evicted_total_; }
    const MaintenancePolicy& policy() const { return policy_; }

private:
    void arm_cleanup();
    void arm_diagnostics();

    core::Scheduler& scheduler_;
    IdleTaskScheduler& idle_;
    cache::ResourcePoolManager& pools_;
    MaintenancePolicy policy_;
    DiagnosticsCallback on_diagnostics_;
    bool running_ = false;
    core::TimerId cleanup_timer_ = 0;
    core::TimerId diagnostics_timer_ = 0;
    uint64_t cleanups_ = 0;
    uint64_t diagnostics_runs_ = 0;
    uint64_t evicted_total_ = 0;
    uint64_t evicted_this_cycle_ = 0;
};

} // namespace mrc::scheduling
