#pragma once
#include <array>
#include <cstdint>
#include <string>

#include "core/clock.hpp"
#include "quality/lod_types.hpp"

namespace mrc::scheduling {

struct ThrottleStats {
    std::string channel;
    uint64_t accepted = 0;
    uint64_t skipped = 0;
    double interval_ms = 0.0;
    double last_accepted_ms = 0.0;
};

/**
 * @brief Per-channel rate limiter keyed by quality tier
 *
 * Excess triggers are dropped, never queued. A trigger is accepted when none
 * was accepted yet or the tier's interval elapsed since the last scheduled
 * slot. Slots advance by whole intervals, so triggers arriving on a frame
 * grid that does not divide the interval still average one per interval.
 */
class UpdateThrottle final : public quality::ILodConsumer {
public:
    // Intervals indexed by LodMode. Negative values are clamped to 0.
    using Intervals = std::array<double, quality::kLodModeCount>;

    UpdateThrottle(std::string channel, const core::Clock& clock, Intervals intervals = {0.0, 30.0, 150.0});

    bool should_update(quality::LodMode mode) const;
    // Uses the tier most recently applied through apply_lod().
    bool should_update() const { return should_update(mode_); }

    // Advances the schedule by the current tier's interval.
    void record_update();
    void record_skip() { ++skipped_; }

    // should_update() followed by record_update() or record_skip().
    bool try_accept(quality::LodMode mode);
    bool try_accept() { return try_accept(mode_); }

    // Tracks the tier and takes its update_throttle_ms as that tier's interval.
    void apply_lod(quality::LodMode mode, const quality::LodConfig& config) override;

    void set_interval(quality::LodMode mode, double interval_ms);
    double interval(quality::LodMode mode) const { return intervals_[quality::lod_index(mode)]; }

    const std::string& channel() const { return channel_; }
    quality::LodMode mode() const { return mode_; }
    ThrottleStats stats() const;
    void reset();

private:
    void record_update(double interval_ms);

    std::string channel_;
    const core::Clock& clock_;
    Intervals intervals_{};
    quality::LodMode mode_ = quality::LodMode::High;
    bool has_accepted_ = false;
    double last_accepted_ms_ = 0.0;
    uint64_t accepted_ = 0;
    uint64_t skipped_ = 0;
};

} // namespace mrc::scheduling
