#ifndef COMPETIX_TIMING_HPP
#define COMPETIX_TIMING_HPP

#include <chrono>

namespace competix {

// Wall-clock milliseconds spent in each pipeline stage.
struct StageTimings {
    double normalize_ms = 0.0;
    double embed_ms = 0.0;
    double graph_ms = 0.0;
    double cluster_ms = 0.0;
    double validate_ms = 0.0;

    double total_ms() const {
        return normalize_ms + embed_ms + graph_ms + cluster_ms + validate_ms;
    }
};

/**
 * Splits a run into back-to-back stages on the steady clock. Each lap()
 * closes the current stage and opens the next.
 */
class StageClock {
public:
    using clock = std::chrono::steady_clock;

    StageClock() : lap_start_(clock::now()) {}

    double lap() {
        auto now = clock::now();
        double ms = std::chrono::duration<double, std::milli>(now - lap_start_).count();
        lap_start_ = now;
        return ms;
    }

private:
    clock::time_point lap_start_;
};

}  // namespace competix

#endif  // COMPETIX_TIMING_HPP
