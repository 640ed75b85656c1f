#include "sfm-cnc/envelope.h"

namespace sfm {
namespace cnc {

Quantity resolveSpindleSpeed(const Quantity& idealSpeed, const SpindleRange& range) {
    if (!range.isStepped()) {
        if (idealSpeed > range.getMaxSpeed()) {
            return range.getMaxSpeed();
        }
        return idealSpeed;
    }

    const auto& speeds = range.getSpeeds();
    size_t best = 0;
    double bestDistance = abs(speeds[0] - idealSpeed).siValue();

    // Strict comparison keeps the earliest step on ties
    for (size_t i = 1; i < speeds.size(); i++) {
        double distance = abs(speeds[i] - idealSpeed).siValue();
        if (distance < bestDistance) {
            best = i;
            bestDistance = distance;
        }
    }

    return speeds[best];
}

} // namespace cnc
} // namespace sfm
