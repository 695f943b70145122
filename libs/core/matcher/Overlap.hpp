#pragma once
#include <algorithm>
#include <chrono>
#include "util/TimeUtils.hpp"

struct DateRange {
    TimePoint startTime;
    TimePoint endTime;
};

/**
 * Fraction of the shorter range covered by the intersection of both ranges.
 * A short range fully inside a longer one scores 1.0; disjoint or touching
 * ranges score 0; a zero-length range always scores 0.
 */
inline double calculateOverlapPercent(const DateRange& a, const DateRange& b) {
    using Ms = std::chrono::duration<double, std::milli>;
    const auto overlapStart = std::max(a.startTime, b.startTime);
    const auto overlapEnd   = std::min(a.endTime, b.endTime);
    const double overlapMs  = std::max(0.0, Ms(overlapEnd - overlapStart).count());

    const double durationA = Ms(a.endTime - a.startTime).count();
    const double durationB = Ms(b.endTime - b.startTime).count();
    if (durationA == 0.0 || durationB == 0.0) {
        return 0.0;
    }
    return overlapMs / std::min(durationA, durationB);
}
