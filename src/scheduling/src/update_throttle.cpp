#include "scheduling/update_throttle.hpp"
#include "core/log.hpp"

namespace mrc::scheduling {

UpdateThrottle::UpdateThrottle(std::string channel, const core::Clock& clock, Intervals intervals)
    : channel_(std::move(channel)), clock_(clock) {
    for(auto m : quality::kAllLodModes) set_interval(m, intervals[quality::lod_index(m)]);
}

bool UpdateThrottle::should_update(quality::LodMode mode) const {
    if(!has_accepted_) return true;
    return (clock_.now_ms() - last_accepted_ms_) >= interval(mode);
}

void UpdateThrottle::record_update() {
    record_update(interval(mode_));
}

void UpdateThrottle::record_update(double interval_ms) {
    const double now = clock_.now_ms();
    // Advance along the schedule so frame jitter does not stretch the period;
    // re-anchor on now after a gap of two intervals or more.
    if(has_accepted_ && interval_ms > 0.0 && now - last_accepted_ms_ < 2.0 * interval_ms) {
        last_accepted_ms_ += interval_ms;
    } else {
        last_accepted_ms_ = now;
    }
    has_accepted_ = true;
    ++accepted_;
}

bool UpdateThrottle::try_accept(quality::LodMode mode) {
    if(should_update(mode)) {
        record_update(interval(mode));
        return true;
    }
    record_skip();
    return false;
}

void UpdateThrottle::apply_lod(quality::LodMode mode, const quality::LodConfig& config) {
    mode_ = mode;
    set_interval(mode, config.update_throttle_ms);
}

void UpdateThrottle::set_interval(quality::LodMode mode, double interval_ms) {
    if(!(interval_ms >= 0.0)) {
        log::warn("[Throttle] " + channel_ + " interval " + std::to_string(interval_ms) + "ms for " +
                  quality::to_string(mode) + " clamped to 0");
        interval_ms = 0.0;
    }
    intervals_[quality::lod_index(mode)] = interval_ms;
}

ThrottleStats UpdateThrottle::stats() const {
    return ThrottleStats{channel_, accepted_, skipped_, interval(mode_), last_accepted_ms_};
}

void UpdateThrottle::reset() {
    has_accepted_ = false;
    last_accepted_ms_ = 0.0;
    accepted_ = 0;
    skipped_ = 0;
}

} // namespace mrc::scheduling
