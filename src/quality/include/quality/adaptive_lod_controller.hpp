#pragma once
#include <cstdint>
#include <functional>
#include <vector>

#include "core/clock.hpp"
#include "quality/lod_profile.hpp"
#include "quality/lod_types.hpp"

namespace mrc::quality {

/**
 * @brief FPS driven quality-tier state machine
 *
 * Starts at High. A transition moves exactly one tier and is only taken once
 * the grace period since the previous transition (or construction) elapsed.
 * Drop and raise thresholds form a dead-zone so a tier does not flap on
 * transient spikes.
 */
class AdaptiveLodController {
public:
    using TransitionCallback = std::function<void(LodMode from, LodMode to, double fps)>;

    explicit AdaptiveLodController(const core::Clock& clock, LodProfile profile = LodProfile::standard(),
                                   bool enable_diagnostics = false);

    LodMode mode() const { return mode_; }
    const LodConfig& config() const { return profile_.config(mode_); }
    const LodConfig& config_for(LodMode m) const { return profile_.config(m); }
    const LodProfile& profile() const { return profile_; }

    /**
     * @brief Evaluate one smoothed FPS value
     * @return true if the tier changed
     *
     * NaN, infinite and negative values are ignored.
     */
    bool update_by_fps(double fps);

    // Pushes the current tier's config to every registered consumer.
    void configure_pools();

    // Registers a dependent and immediately applies the current config to it.
    void add_consumer(ILodConsumer& consumer);
    bool remove_consumer(ILodConsumer& consumer);

    // Debug override: bypasses thresholds and grace, restarts the grace timer.
    void force_mode(LodMode m);
    void reset() { force_mode(LodMode::High); }

    void set_transition_callback(TransitionCallback cb) { on_transition_ = std::move(cb); }

    uint64_t mode_change_count() const { return mode_changes_; }
    uint64_t ignored_samples() const { return ignored_samples_; }
    double last_transition_ms() const { return last_transition_ms_; }
    bool is_performance_mode() const { return mode_ != LodMode::High; }
    bool is_aggressive_mode() const { return mode_ == LodMode::Low; }

private:
    void transition(LodMode to, double fps, const char* reason);

    const core::Clock& clock_;
    LodProfile profile_;
    bool diagnostics_;
    LodMode mode_ = LodMode::High;
    double last_transition_ms_ = 0.0;
    uint64_t mode_changes_ = 0;
    uint64_t ignored_samples_ = 0;
    std::vector<ILodConsumer*> consumers_; // non-owning
    TransitionCallback on_transition_;
};

} // namespace mrc::quality
