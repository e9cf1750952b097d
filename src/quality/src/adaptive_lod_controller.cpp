#include "quality/adaptive_lod_controller.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace mrc::quality {

namespace {

LodMode cheaper(LodMode m) {
    return m == LodMode::High ? LodMode::Medium : LodMode::Low;
}

LodMode richer(LodMode m) {
    return m == LodMode::Low ? LodMode::Medium : LodMode::High;
}

std::string fps_str(double fps) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", fps);
    return buf;
}

} // namespace

AdaptiveLodController::AdaptiveLodController(const core::Clock& clock, LodProfile profile, bool enable_diagnostics)
    : clock_(clock), profile_(std::move(profile)), diagnostics_(enable_diagnostics) {
    sanitize(profile_);
    last_transition_ms_ = clock_.now_ms();
}

bool AdaptiveLodController::update_by_fps(double fps) {
    if(!std::isfinite(fps) || fps < 0.0) {
        ++ignored_samples_;
        return false;
    }

    const auto& th = profile_.thresholds;
    const double now = clock_.now_ms();
    const bool grace_elapsed = (now - last_transition_ms_) >= th.grace_period_ms;

    if(mode_ != LodMode::Low && fps < th.drop_threshold(mode_)) {
        if(!grace_elapsed) {
            if(diagnostics_) log::debug("[AdaptiveLOD] drop pending at " + fps_str(fps) + " fps, grace period active");
            return false;
        }
        transition(cheaper(mode_), fps, "fps below drop threshold");
        return true;
    }
    if(mode_ != LodMode::High && fps > th.raise_threshold(mode_)) {
        if(!grace_elapsed) {
            if(diagnostics_) log::debug("[AdaptiveLOD] raise pending at " + fps_str(fps) + " fps, grace period active");
            return false;
        }
        transition(richer(mode_), fps, "fps above raise threshold");
        return true;
    }
    return false;
}

void AdaptiveLodController::force_mode(LodMode m) {
    if(m == mode_) return;
    transition(m, -1.0, "forced");
}

void AdaptiveLodController::transition(LodMode to, double fps, const char* reason) {
    const LodMode from = mode_;
    mode_ = to;
    last_transition_ms_ = clock_.now_ms();
    ++mode_changes_;

    std::string msg = std::string("[AdaptiveLOD] mode ") + to_string(from) + " -> " + to_string(to) + " (" + reason;
    if(fps >= 0.0) msg += ", fps " + fps_str(fps);
    msg += ")";
    log::info(msg);

    configure_pools();
    if(on_transition_) on_transition_(from, to, fps);
}

void AdaptiveLodController::configure_pools() {
    const LodConfig& cfg = config();
    for(ILodConsumer* c : consumers_) c->apply_lod(mode_, cfg);
    if(diagnostics_) {
        log::debug(std::string("[AdaptiveLOD] configured ") + std::to_string(consumers_.size()) + " consumers for " +
                   to_string(mode_) + ": pool " + std::to_string(cfg.pool_capacity_entries) + " entries / " +
                   std::to_string(cfg.pool_capacity_bytes / 1024) + " KiB, throttle " +
                   std::to_string(static_cast<int>(cfg.update_throttle_ms)) + "ms");
    }
}

void AdaptiveLodController::add_consumer(ILodConsumer& consumer) {
    if(std::find(consumers_.begin(), consumers_.end(), &consumer) != consumers_.end()) return;
    consumers_.push_back(&consumer);
    consumer.apply_lod(mode_, config());
}

bool AdaptiveLodController::remove_consumer(ILodConsumer& consumer) {
    auto it = std::find(consumers_.begin(), consumers_.end(), &consumer);
    if(it == consumers_.end()) return false;
    consumers_.erase(it);
    return true;
}

} // namespace mrc::quality
