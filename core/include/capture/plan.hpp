#pragma once

#include <capture/types.hpp>

namespace fc {
    // Candidates start + k*step (k = 0, 1, ...) up to and including
    // start + range, normalized to 6 decimals and clipped to [0, duration].
    // Throws std::invalid_argument unless range > 0, step > 0, duration >= 0.
    CapturePlan plan_timestamps(double start, double range, double step, double duration);

    // Round to the planner's fixed precision (1e-6 s).
    double normalize_timestamp(double seconds);
}
