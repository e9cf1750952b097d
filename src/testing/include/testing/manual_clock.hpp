#pragma once
#include "core/clock.hpp"

namespace mrc::testing {

// Clock that only moves when told to. Shared by the unit tests and the
// lod_sim tool, which replays synthetic frame timings faster than real time.
class ManualClock final : public core::Clock {
public:
    explicit ManualClock(double start_ms = 0.0) : now_(start_ms) {}
    double now_ms() const override { return now_; }
    void advance(double ms) { now_ += ms; }
    void set(double ms) { now_ = ms; }
private:
    double now_;
};

} // namespace mrc::testing
