#pragma once

#include "../Telemetry.hpp"
#include <vector>

namespace tripseg::domain {

struct DistanceResult {
    double distanceMeters = 0.0;
    DistanceMethod method = DistanceMethod::Geodesic;
};

struct DistanceConfig {
    // Hops longer than this between consecutive fixes are GPS jumps, not travel
    double maxJumpMeters = 10000.0;
};

/**
 * @brief Trip length from odometer delta, falling back to haversine summation
 *
 * The odometer delta is taken between the first and last samples of the trip
 * that carry a positive odometer reading. A rollback (negative delta) or a
 * single reading in a multi-sample trip falls back to the geodesic sum.
 */
class DistanceAccumulator {
public:
    explicit DistanceAccumulator(DistanceConfig config = {});

    DistanceResult compute(const std::vector<NormalizedPosition>& samples,
                           std::vector<SegmentationAnomaly>* anomalies = nullptr) const;
    
    double geodesicMeters(const std::vector<NormalizedPosition>& samples,
                          std::vector<SegmentationAnomaly>* anomalies = nullptr) const;

private:
    DistanceConfig config_;
};

} // namespace tripseg::domain
