/**
 * @file monotonic_clock.h
 * @brief Strictly increasing millisecond stamps for request timestamps and action nonces.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace tradegate::auth {

class MonotonicClock {
public:
    using TimeSource = std::function<std::uint64_t()>;

    MonotonicClock() : source_(&MonotonicClock::wall_ms), last_ms_(0) {}
    explicit MonotonicClock(TimeSource source) : source_(std::move(source)), last_ms_(0) {}

    // Returns max(now, last + 1); never repeats a value, even when the wall clock stalls or steps back.
    std::uint64_t next() {
        const std::uint64_t now = source_();
        std::uint64_t prev = last_ms_.load(std::memory_order_relaxed);
        std::uint64_t candidate = (now > prev) ? now : (prev + 1);
        while (!last_ms_.compare_exchange_weak(prev, candidate,
                                               std::memory_order_acq_rel,
                                               std::memory_order_relaxed)) {
            candidate = (now > prev) ? now : (prev + 1);
        }
        return candidate;
    }

    std::uint64_t last() const { return last_ms_.load(std::memory_order_acquire); }

    static std::uint64_t wall_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

private:
    TimeSource source_;
    std::atomic<std::uint64_t> last_ms_;
};

} // namespace tradegate::auth
