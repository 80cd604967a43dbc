#include "agentfleet/utils/clock.hpp"

namespace agentfleet {
namespace utils {

Clock::TimePoint SystemClock::now() const {
    auto current = std::chrono::system_clock::now().time_since_epoch().count();
    auto previous = last_.load(std::memory_order_relaxed);
    while (current > previous) {
        if (last_.compare_exchange_weak(previous, current, std::memory_order_relaxed)) {
            return TimePoint(Duration(current));
        }
    }
    // Wall time stepped backwards or another caller raced ahead.
    return TimePoint(Duration(previous));
}

} // namespace utils
} // namespace agentfleet
