#include "torrentflow/session/rate_sampler.hpp"
#include <cmath>

namespace torrentflow::session {

namespace {

uint64_t compute_rate(uint64_t previous, uint64_t observed, std::chrono::duration<double> elapsed) {
    if (observed <= previous) {
        return 0;
    }
    double rate = static_cast<double>(observed - previous) / elapsed.count();
    return static_cast<uint64_t>(std::llround(rate));
}

}

bool RateSampler::sample(RateTracker& tracker, uint64_t observed_bytes, Clock::time_point now) {
    std::chrono::duration<double> elapsed = now - tracker.last_sample_time;
    if (elapsed.count() <= 0.0) {
        return false;
    }

    tracker.current_rate = compute_rate(tracker.last_bytes, observed_bytes, elapsed);
    tracker.last_bytes = observed_bytes;
    tracker.last_sample_time = now;
    return true;
}

uint64_t RateSampler::peek(const RateTracker& tracker, uint64_t observed_bytes, Clock::time_point now) {
    std::chrono::duration<double> elapsed = now - tracker.last_sample_time;
    if (elapsed.count() <= 0.0) {
        return tracker.current_rate;
    }
    return compute_rate(tracker.last_bytes, observed_bytes, elapsed);
}

} // namespace torrentflow::session
