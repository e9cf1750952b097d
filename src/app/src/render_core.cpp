#include "app/render_core.hpp"
#include "core/log.hpp"

#include <cstdio>

namespace mrc::app {

namespace {

RenderCoreConfig with_diagnostics(RenderCoreConfig c) {
    if(c.enable_diagnostics) {
        c.entity_cache.enable_diagnostics = true;
        c.idle.enable_diagnostics = true;
    }
    return c;
}

} // namespace

RenderCoreConfig RenderCoreConfig::standard() {
    return RenderCoreConfig{};
}

RenderCoreConfig RenderCoreConfig::low_end() {
    RenderCoreConfig c;
    c.profile = quality::LodProfile::low_end();
    c.idle.min_task_budget_ms = 6.0;
    c.maintenance.cleanup_interval_ms = 3.0 * 60.0 * 1000.0;
    return c;
}

RenderCoreConfig RenderCoreConfig::high_end() {
    RenderCoreConfig c;
    c.profile = quality::LodProfile::high_end();
    c.idle.min_task_budget_ms = 3.0;
    c.entity_cache.removal_grace_batches = 2;
    return c;
}

std::string DiagnosticsSnapshot::to_string() const {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "fps %.1f (p95 %.1fms, dropped %.1f%%) | lod %s (%llu changes) | entities %zu eff %.1f%% | "
                  "pools %zu hit %.1f%% | idle q %zu overrun %.2f%% | warm %s %.0f%%",
                  fps, frames.p95_ms, frames.dropped_ratio() * 100.0, quality::to_string(mode),
                  static_cast<unsigned long long>(mode_changes), entities.size, entities.efficiency * 100.0,
                  pools.size(), cache_hit_rate * 100.0, idle.queued, idle.overrun_rate() * 100.0,
                  warmup::to_string(warm), warm_progress * 100.0);
    return buf;
}

scheduling::UpdateThrottle::Intervals RenderCore::intervals_from(const quality::LodProfile& profile) {
    scheduling::UpdateThrottle::Intervals out{};
    for(auto m : quality::kAllLodModes) out[quality::lod_index(m)] = profile.config(m).update_throttle_ms;
    return out;
}

RenderCore::RenderCore(const core::Clock& clock, core::Scheduler& scheduler, cache::IVisualFactory& factory,
                       RenderCoreConfig config)
    : config_(with_diagnostics(std::move(config))),
      entities_(factory, config_.entity_cache),
      idle_(scheduler, clock, config_.idle),
      entity_throttle_("entities", clock, intervals_from(config_.profile)),
      viewport_throttle_("viewport", clock, intervals_from(config_.profile)),
      controller_(clock, config_.profile, config_.enable_diagnostics),
      monitor_(clock, config_.monitor),
      maintenance_(scheduler, idle_, pools_, config_.maintenance) {
    pools_.attach_idle_scheduler(&idle_);
    controller_.add_consumer(pools_);
    controller_.add_consumer(entities_);
    controller_.add_consumer(entity_throttle_);
    controller_.add_consumer(viewport_throttle_);
    monitor_.set_callback([this](double fps) { controller_.update_by_fps(fps); });
    maintenance_.set_diagnostics_callback([this] { log::info("[RenderCore] " + diagnostics().to_string()); });
}

RenderCore::~RenderCore() {
    stop();
}

void RenderCore::start() {
    if(running_) return;
    running_ = true;
    monitor_.start();
    maintenance_.start();
    log::info(std::string("[RenderCore] started at ") + quality::to_string(controller_.mode()) + " quality");
}

void RenderCore::stop() {
    if(!running_) return;
    running_ = false;
    cancel_warmup();
    maintenance_.stop();
    monitor_.stop();
    log::info("[RenderCore] stopped");
}

void RenderCore::on_frame(double duration_ms) {
    monitor_.on_sample(duration_ms);
}

cache::DiffResult RenderCore::apply_batch(const std::vector<cache::EntityUpdate>& updates,
                                          const std::unordered_set<std::string>& selected_ids,
                                          const cache::DiffFilter& filter) {
    return entities_.diff(updates, selected_ids, filter);
}

std::optional<cache::DiffResult> RenderCore::offer_batch(const std::vector<cache::EntityUpdate>& updates,
                                                         const std::unordered_set<std::string>& selected_ids,
                                                         const cache::DiffFilter& filter) {
    if(!entity_throttle_.try_accept()) return std::nullopt;
    return entities_.diff(updates, selected_ids, filter);
}

bool RenderCore::on_viewport_changed(const Viewport& viewport) {
    if(!viewport_throttle_.try_accept()) return false;
    if(on_viewport_) on_viewport_(viewport);
    return true;
}

bool RenderCore::start_warmup(warmup::IAssetWarmer& warmer, const Viewport& viewport,
                              warmup::StartupWarmCycle::CompleteCallback on_complete,
                              warmup::StartupWarmCycle::ProgressCallback on_progress) {
    return start_warmup(warmup::standard_warm_steps(warmer, controller_, pools_), viewport, std::move(on_complete),
                        std::move(on_progress));
}

bool RenderCore::start_warmup(std::vector<warmup::WarmStep> steps, const Viewport& viewport,
                              warmup::StartupWarmCycle::CompleteCallback on_complete,
                              warmup::StartupWarmCycle::ProgressCallback on_progress) {
    if(warm_ && warm_->state() == warmup::WarmState::Running) {
        log::warn("[RenderCore] warm-up already running");
        return false;
    }
    warm_ = std::make_unique<warmup::StartupWarmCycle>(idle_, std::move(steps));
    return warm_->run(warmup::WarmContext{viewport.center, viewport.zoom}, std::move(on_complete),
                      std::move(on_progress));
}

void RenderCore::cancel_warmup() {
    if(warm_) warm_->cancel();
}

DiagnosticsSnapshot RenderCore::diagnostics() const {
    DiagnosticsSnapshot d;
    d.fps = monitor_.fps();
    d.mode = controller_.mode();
    d.mode_changes = controller_.mode_change_count();
    d.frames = monitor_.stats();
    d.cache_hit_rate = pools_.hit_rate();
    d.entities = entities_.stats();
    d.pools = pools_.stats();
    d.throttles = {entity_throttle_.stats(), viewport_throttle_.stats()};
    d.idle = idle_.stats();
    if(warm_) {
        d.warm = warm_->state();
        d.warm_progress = warm_->progress();
    }
    return d;
}

} // namespace mrc::app
