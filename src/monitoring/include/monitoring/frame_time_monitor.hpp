#pragma once
#include <cstdint>
#include <deque>
#include <functional>

#include "core/clock.hpp"

namespace mrc::monitoring {

struct FrameMonitorConfig {
    double window_ms = 2000.0;          // rolling window used for smoothing
    double max_fps = 120.0;             // smoothed FPS is capped here
    double min_report_delta = 0.0;      // callback fires when FPS moved at least this much
    double frame_budget_ms = 1000.0 / 60.0; // frames slower than this count as dropped
};

struct FrameSample { double duration_ms = 0.0; double timestamp_ms = 0.0; };

struct FrameStats {
    uint64_t total_frames = 0;
    uint64_t dropped_frames = 0;
    uint64_t rejected_samples = 0;
    size_t window_samples = 0;
    double avg_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double max_ms = 0.0;
    double fps = 0.0;
    double dropped_ratio() const { return total_frames ? double(dropped_frames) / double(total_frames) : 0.0; }
};

// Rolling-window frame timer. Feed one on_sample() per rendered frame.
class FrameTimeMonitor {
public:
    using FpsCallback = std::function<void(double fps)>;

    explicit FrameTimeMonitor(const core::Clock& clock, FrameMonitorConfig config = {}, FpsCallback callback = {});
    ~FrameTimeMonitor();

    FrameTimeMonitor(const FrameTimeMonitor&) = delete;
    FrameTimeMonitor& operator=(const FrameTimeMonitor&) = delete;

    void start();
    void stop();
    bool is_active() const { return active_; }

    // Returns false when the sample was ignored (stopped, NaN or negative).
    bool on_sample(double duration_ms);

    void set_callback(FpsCallback callback) { callback_ = std::move(callback); }

    // Last smoothed value; 0 until the first sample arrives.
    double fps() const { return fps_; }
    // No frame inside the window: the host is not rendering.
    bool is_idle() const;

    FrameStats stats() const;
    void reset();

    const FrameMonitorConfig& config() const { return config_; }

private:
    void prune(double now_ms);

    const core::Clock& clock_;
    FrameMonitorConfig config_;
    FpsCallback callback_;
    bool active_ = false;

    std::deque<FrameSample> window_;
    double window_sum_ms_ = 0.0;
    double fps_ = 0.0;
    double last_reported_fps_ = 0.0;
    bool reported_once_ = false;

    uint64_t total_frames_ = 0;
    uint64_t dropped_frames_ = 0;
    uint64_t rejected_samples_ = 0;
};

} // namespace mrc::monitoring
