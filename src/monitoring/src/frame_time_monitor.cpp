#include "monitoring/frame_time_monitor.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace mrc::monitoring {

FrameTimeMonitor::FrameTimeMonitor(const core::Clock& clock, FrameMonitorConfig config, FpsCallback callback)
    : clock_(clock), config_(config), callback_(std::move(callback)) {
    if(!(config_.window_ms > 0.0)) {
        log::warn("[FrameMonitor] window_ms must be positive, using 2000");
        config_.window_ms = 2000.0;
    }
    if(!(config_.max_fps > 0.0)) {
        log::warn("[FrameMonitor] max_fps must be positive, using 120");
        config_.max_fps = 120.0;
    }
    if(!(config_.min_report_delta >= 0.0)) config_.min_report_delta = 0.0;
}

FrameTimeMonitor::~FrameTimeMonitor() { stop(); }

void FrameTimeMonitor::start() {
    if(active_) return;
    active_ = true;
    log::debug("[FrameMonitor] started (window " + std::to_string(static_cast<int>(config_.window_ms)) + "ms)");
}

void FrameTimeMonitor::stop() {
    if(!active_) return;
    active_ = false;
    window_.clear();
    window_sum_ms_ = 0.0;
    log::debug("[FrameMonitor] stopped after " + std::to_string(total_frames_) + " frames");
}

bool FrameTimeMonitor::on_sample(double duration_ms) {
    if(!active_) return false;
    if(!std::isfinite(duration_ms) || duration_ms < 0.0) {
        ++rejected_samples_;
        return false;
    }

    const double now = clock_.now_ms();
    window_.push_back(FrameSample{duration_ms, now});
    window_sum_ms_ += duration_ms;
    prune(now);

    ++total_frames_;
    if(duration_ms > config_.frame_budget_ms) ++dropped_frames_;

    const double avg = window_.empty() ? 0.0 : window_sum_ms_ / double(window_.size());
    fps_ = avg <= 0.0 ? config_.max_fps : std::min(config_.max_fps, 1000.0 / avg);

    if(callback_ && (!reported_once_ || std::fabs(fps_ - last_reported_fps_) >= config_.min_report_delta)) {
        reported_once_ = true;
        last_reported_fps_ = fps_;
        callback_(fps_);
    }
    return true;
}

void FrameTimeMonitor::prune(double now_ms) {
    const double cutoff = now_ms - config_.window_ms;
    while(!window_.empty() && window_.front().timestamp_ms < cutoff) {
        window_sum_ms_ -= window_.front().duration_ms;
        window_.pop_front();
    }
    if(window_.empty()) window_sum_ms_ = 0.0;
}

bool FrameTimeMonitor::is_idle() const {
    if(window_.empty()) return true;
    return clock_.now_ms() - window_.back().timestamp_ms > config_.window_ms;
}

FrameStats FrameTimeMonitor::stats() const {
    FrameStats st;
    st.total_frames = total_frames_;
    st.dropped_frames = dropped_frames_;
    st.rejected_samples = rejected_samples_;
    st.window_samples = window_.size();
    st.fps = fps_;
    if(window_.empty()) return st;

    std::vector<double> sorted;
    sorted.reserve(window_.size());
    for(const auto& s : window_) sorted.push_back(s.duration_ms);
    std::sort(sorted.begin(), sorted.end());

    const size_t n = sorted.size();
    st.avg_ms = window_sum_ms_ / double(n);
    st.max_ms = sorted.back();
    size_t idx50 = (n > 1) ? static_cast<size_t>(0.5 * double(n - 1)) : 0;
    size_t idx95 = (n > 1) ? static_cast<size_t>(0.95 * double(n - 1)) : 0;
    st.p50_ms = sorted[std::min(idx50, n - 1)];
    st.p95_ms = sorted[std::min(idx95, n - 1)];
    return st;
}

void FrameTimeMonitor::reset() {
    window_.clear();
    window_sum_ms_ = 0.0;
    fps_ = 0.0;
    last_reported_fps_ = 0.0;
    reported_once_ = false;
    total_frames_ = dropped_frames_ = rejected_samples_ = 0;
}

} // namespace mrc::monitoring
