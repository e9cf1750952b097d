#include "scheduling/memory_maintenance.hpp"
#include "cache/resource_pool_manager.hpp"
#include "core/log.hpp"
#include "scheduling/idle_task_scheduler.hpp"

namespace mrc::scheduling {

MemoryMaintenance::MemoryMaintenance(core::Scheduler& scheduler, IdleTaskScheduler& idle,
                                     cache::ResourcePoolManager& pools, MaintenancePolicy policy)
    : scheduler_(scheduler), idle_(idle), pools_(pools), policy_(policy) {
    if(!(policy_.cleanup_interval_ms > 0.0)) {
        log::warn("[Maintenance] cleanup_interval_ms must be positive, cleanup disabled");
        policy_.enable_cleanup = false;
    }
    if(!(policy_.diagnostics_interval_ms > 0.0)) {
        log::warn("[Maintenance] diagnostics_interval_ms must be positive, diagnostics disabled");
        policy_.enable_diagnostics = false;
    }
}

MemoryMaintenance::~MemoryMaintenance() {
    stop();
}

void MemoryMaintenance::start() {
    if(running_) return;
    running_ = true;
    if(policy_.enable_cleanup) arm_cleanup();
    if(policy_.enable_diagnostics) arm_diagnostics();
    log::debug("[Maintenance] started");
}

void MemoryMaintenance::stop() {
    if(!running_) return;
    running_ = false;
    if(cleanup_timer_) scheduler_.cancel(cleanup_timer_);
    if(diagnostics_timer_) scheduler_.cancel(diagnostics_timer_);
    cleanup_timer_ = 0;
    diagnostics_timer_ = 0;
    log::debug("[Maintenance] stopped");
}

void MemoryMaintenance::arm_cleanup() {
    cleanup_timer_ = scheduler_.schedule_once(policy_.cleanup_interval_ms, [this] {
        cleanup_timer_ = 0;
        if(!running_) return;
        run_cleanup();
        arm_cleanup();
    });
}

void MemoryMaintenance::arm_diagnostics() {
    diagnostics_timer_ = scheduler_.schedule_once(policy_.diagnostics_interval_ms, [this] {
        diagnostics_timer_ = 0;
        if(!running_) return;
        ++diagnostics_runs_;
        if(on_diagnostics_) on_diagnostics_();
        arm_diagnostics();
    });
}

void MemoryMaintenance::run_cleanup() {
    ++cleanups_;
    evicted_this_cycle_ = 0;
    const auto pools = pools_.pools();
    for(auto* pool : pools) {
        const std::string name = pool->name();
        idle_.schedule_task(
            [this, name] {
                if(auto* p = pools_.find(name)) {
                    const size_t n = p->trim();
                    evicted_this_cycle_ += n;
                    evicted_total_ += n;
                }
            },
            IdleTaskPriority::Medium, "maintenance:" + name);
    }
    idle_.schedule_task(
        [this] {
            if(evicted_this_cycle_ > 0) idle_.maybe_gc_hint("idle_maintenance");
        },
        IdleTaskPriority::Low, "maintenance:gc_hint");
    log::debug("[Maintenance] cleanup #" + std::to_string(cleanups_) + " queued for " + std::to_string(pools.size()) +
               " pools");
}

} // namespace mrc::scheduling
