#include "DistanceAccumulator.hpp"
#include "../Geo.hpp"
#include <iostream>

namespace tripseg::domain {

DistanceAccumulator::DistanceAccumulator(DistanceConfig config)
    : config_(config) {
}

DistanceResult DistanceAccumulator::compute(const std::vector<NormalizedPosition>& samples,
                                            std::vector<SegmentationAnomaly>* anomalies) const {
    DistanceResult result;
    if (samples.empty()) {
        return result;
    }
    
    const NormalizedPosition* first = nullptr;
    const NormalizedPosition* last = nullptr;
    for (const auto& sample : samples) {
        if (sample.odometerTotal && *sample.odometerTotal > 0.0) {
            if (!first) first = &sample;
            last = &sample;
        }
    }
    
    bool usableEndpoints = first && (first != last || samples.size() == 1);
    if (usableEndpoints) {
        double delta = *last->odometerTotal - *first->odometerTotal;
        if (delta >= 0.0) {
            result.distanceMeters = delta;
            result.method = DistanceMethod::Odometer;
            return result;
        }
        
        SegmentationAnomaly anomaly{AnomalyKind::OdometerRollback, last->deviceId, last->timestampUtc,
                                    "odometer went from " + std::to_string(*first->odometerTotal) +
                                    " to " + std::to_string(*last->odometerTotal)};
        std::cerr << "[Distance] Warning: " << anomaly.detail << " on " << anomaly.deviceId
                  << ", falling back to geodesic" << std::endl;
        if (anomalies) anomalies->push_back(std::move(anomaly));
    }
    
    result.distanceMeters = geodesicMeters(samples, anomalies);
    result.method = DistanceMethod::Geodesic;
    return result;
}

double DistanceAccumulator::geodesicMeters(const std::vector<NormalizedPosition>& samples,
                                           std::vector<SegmentationAnomaly>* anomalies) const {
    double total = 0.0;
    
    for (size_t i = 1; i < samples.size(); ++i) {
        double hop = Geo::distanceMeters(samples[i - 1].position(), samples[i].position());
        if (hop > config_.maxJumpMeters) {
            SegmentationAnomaly anomaly{AnomalyKind::GpsJump, samples[i].deviceId, samples[i].timestampUtc,
                                        "skipped " + std::to_string(static_cast<long long>(hop)) + " m hop"};
            std::cerr << "[Distance] Warning: " << anomaly.detail << " on " << anomaly.deviceId
                      << " at " << formatIso8601(anomaly.timestamp) << std::endl;
            if (anomalies) anomalies->push_back(std::move(anomaly));
            continue;
        }
        total += hop;
    }
    
    return total;
}

} // namespace tripseg::domain
