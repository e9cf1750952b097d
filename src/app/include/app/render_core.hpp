#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "cache/entity_render_cache.hpp"
#include "cache/resource_pool_manager.hpp"
#include "core/clock.hpp"
#include "core/scheduler.hpp"
#include "monitoring/frame_time_monitor.hpp"
#include "quality/adaptive_lod_controller.hpp"
#include "scheduling/idle_task_scheduler.hpp"
#include "scheduling/memory_maintenance.hpp"
#include "scheduling/update_throttle.hpp"
#include "warmup/startup_warm_cycle.hpp"
#include "warmup/warm_steps.hpp"

namespace mrc::app {

struct RenderCoreConfig {
    monitoring::FrameMonitorConfig monitor;
    quality::LodProfile profile = quality::LodProfile::standard();
    cache::EntityCacheConfig entity_cache;
    scheduling::IdleSchedulerConfig idle;
    scheduling::MaintenancePolicy maintenance;
    // Turns on the per-component diagnostic logging.
    bool enable_diagnostics = false;

    static RenderCoreConfig standard();
    static RenderCoreConfig low_end();
    static RenderCoreConfig high_end();
};

struct Viewport {
    cache::GeoPoint center;
    double zoom = 0.0;
};

struct DiagnosticsSnapshot {
    double fps = 0.0;
    quality::LodMode mode = quality::LodMode::High;
    uint64_t mode_changes = 0;
    monitoring::FrameStats frames;
    double cache_hit_rate = 0.0;
    cache::EntityCacheStats entities;
    std::vector<cache::PoolStats> pools;
    std::vector<scheduling::ThrottleStats> throttles;
    scheduling::IdleTaskStats idle;
    warmup::WarmState warm = warmup::WarmState::Idle;
    double warm_progress = 0.0;

    // Single line for logs and debug overlays.
    std::string to_string() const;
};

/**
 * @brief Composition root wiring every component for one map view
 *
 * The host owns the clock and scheduler and pumps the scheduler from its
 * frame loop; RenderCore only reacts. Frame durations drive the monitor, the
 * monitor drives the LOD controller, and the controller reconfigures the
 * pools, throttles and entity cache.
 */
class RenderCore {
public:
    using ViewportCallback = std::function<void(const Viewport&)>;

    RenderCore(const core::Clock& clock, core::Scheduler& scheduler, cache::IVisualFactory& factory,
               RenderCoreConfig config = {});
    ~RenderCore();

    RenderCore(const RenderCore&) = delete;
    RenderCore& operator=(const RenderCore&) = delete;

    // Starts frame monitoring and periodic maintenance.
    void start();
    void stop();
    bool is_running() const { return running_; }

    void on_frame(double duration_ms);

    // Diffs unconditionally.
    cache::DiffResult apply_batch(const std::vector<cache::EntityUpdate>& updates,
                                  const std::unordered_set<std::string>& selected_ids = {},
                                  const cache::DiffFilter& filter = {});
    // Diffs only if the "entities" throttle accepts; std::nullopt when dropped.
    std::optional<cache::DiffResult> offer_batch(const std::vector<cache::EntityUpdate>& updates,
                                                 const std::unordered_set<std::string>& selected_ids = {},
                                                 const cache::DiffFilter& filter = {});

    // Forwards to the viewport callback if the "viewport" throttle accepts.
    bool on_viewport_changed(const Viewport& viewport);
    void set_viewport_callback(ViewportCallback cb) { on_viewport_ = std::move(cb); }

    // Standard four-step warm-up around the viewport. Rejected while one runs.
    bool start_warmup(warmup::IAssetWarmer& warmer, const Viewport& viewport,
                      warmup::StartupWarmCycle::CompleteCallback on_complete = {},
                      warmup::StartupWarmCycle::ProgressCallback on_progress = {});
    bool start_warmup(std::vector<warmup::WarmStep> steps, const Viewport& viewport,
                      warmup::StartupWarmCycle::CompleteCallback on_complete = {},
                      warmup::StartupWarmCycle::ProgressCallback on_progress = {});
    void cancel_warmup();

    DiagnosticsSnapshot diagnostics() const;

    monitoring::FrameTimeMonitor& monitor() { return monitor_; }
    quality::AdaptiveLodController& controller() { return controller_; }
    cache::ResourcePoolManager& pools() { return pools_; }
    cache::EntityRenderCache& entities() { return entities_; }
    scheduling::IdleTaskScheduler& idle() { return idle_; }
    scheduling::UpdateThrottle& entity_throttle() { return entity_throttle_; }
    scheduling::UpdateThrottle& viewport_throttle() { return viewport_throttle_; }
    scheduling::MemoryMaintenance& maintenance() { return maintenance_; }
    const warmup::StartupWarmCycle* warm_cycle() const { return warm_.get(); }

private:
    static scheduling::UpdateThrottle::Intervals intervals_from(const quality::LodProfile& profile);

    RenderCoreConfig config_;

    // Destroyed bottom-up: the idle scheduler and controller go before the
    // consumers they reference.
    cache::ResourcePoolManager pools_;
    cache::EntityRenderCache entities_;
    scheduling::IdleTaskScheduler idle_;
    scheduling::UpdateThrottle entity_throttle_;
    scheduling::UpdateThrottle viewport_throttle_;
    quality::AdaptiveLodController controller_;
    monitoring::FrameTimeMonitor monitor_;
    scheduling::MemoryMaintenance maintenance_;
    std::unique_ptr<warmup::StartupWarmCycle> warm_;

    ViewportCallback on_viewport_;
    bool running_ = false;
};

} // namespace mrc::app
