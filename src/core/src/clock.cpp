#include "core/clock.hpp"

namespace mrc::core {

double SteadyClock::now_ms() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - origin_).count();
}

} // namespace mrc::core
