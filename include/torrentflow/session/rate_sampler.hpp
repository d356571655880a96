#pragma once

#include <chrono>
#include <cstdint>

namespace torrentflow::session {

using Clock = std::chrono::steady_clock;

struct RateTracker {
    uint64_t last_bytes = 0;
    Clock::time_point last_sample_time;
    uint64_t current_rate = 0;      // bytes per second

    RateTracker() = default;
    explicit RateTracker(Clock::time_point start, uint64_t initial_bytes = 0)
        : last_bytes(initial_bytes), last_sample_time(start) {}
};

class RateSampler {
public:
    // Folds a new cumulative byte count into the tracker. Leaves the tracker
    // untouched when `now` is not after the previous sample. A counter that
    // went backwards yields a zero rate for this interval.
    // Returns true if the tracker was updated.
    static bool sample(RateTracker& tracker, uint64_t observed_bytes, Clock::time_point now);

    // Rate the tracker would report, without modifying it.
    static uint64_t peek(const RateTracker& tracker, uint64_t observed_bytes, Clock::time_point now);
};

} // namespace torrentflow::session
