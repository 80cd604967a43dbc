#pragma once

#include <atomic>
#include <chrono>
#include <mutex>

namespace agentfleet {
namespace utils {

/**
 * @brief Source of the current time, injected wherever liveness or ordering depends on it.
 */
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Duration = std::chrono::system_clock::duration;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

/**
 * @brief Wall clock that never returns a value earlier than one it already returned.
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override;

private:
    mutable std::atomic<Duration::rep> last_{0};
};

/**
 * @brief Manually driven clock for tests.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{}) : now_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(TimePoint t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace utils
} // namespace agentfleet
