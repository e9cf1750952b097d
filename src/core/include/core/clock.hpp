#pragma once
#include <chrono>

namespace mrc::core {

// Millisecond time source. Components never read wall time directly so tests
// can drive them with a manual clock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now_ms() const = 0;
};

class SteadyClock final : public Clock {
public:
    SteadyClock() : origin_(std::chrono::steady_clock::now()) {}
    double now_ms() const override;
private:
    std::chrono::steady_clock::time_point origin_;
};

} // namespace mrc::core
