#include <capture/plan.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace fc {
    static constexpr double kPrecision = 1e6;

    double normalize_timestamp(double seconds) {
        return std::round(seconds * kPrecision) / kPrecision;
    }

    CapturePlan plan_timestamps(double start, double range, double step, double duration) {
        if (!std::isfinite(start) || !std::isfinite(range) ||
            !std::isfinite(step) || !std::isfinite(duration)) {
            throw std::invalid_argument("[Plan] arguments must be finite");
        }
        if (range <= 0.0) throw std::invalid_argument("[Plan] range must be > 0");
        if (step <= 0.0) throw std::invalid_argument("[Plan] step must be > 0");
        if (duration < 0.0) throw std::invalid_argument("[Plan] duration must be >= 0");

        // one extra candidate so a boundary tie that lands just past
        // range/step after rounding is still considered
        const double steps = std::floor(range / step) + 1.0;
        if (steps >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("[Plan] range/step too large: " + std::to_string(steps));
        }
        const int64_t last_k = static_cast<int64_t>(steps);
        const double end = normalize_timestamp(start + range);

        CapturePlan out;
        for (int64_t k = 0; k <= last_k; ++k) {
            const double t = normalize_timestamp(start + static_cast<double>(k) * step);
            if (t > end) break;
            if (t < 0.0 || t > duration) continue;
            if (!out.empty() && t <= out.back()) continue;
            out.push_back(t);
        }
        return out;
    }
}
