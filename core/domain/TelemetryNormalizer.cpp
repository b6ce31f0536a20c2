#include "TelemetryNormalizer.hpp"
#include "../Geo.hpp"
#include "../ProviderTime.hpp"
#include <iostream>

namespace tripseg::domain {

TelemetryNormalizer::TelemetryNormalizer(std::shared_ptr<IClock> clock,
                                         std::shared_ptr<const IgnitionResolver> resolver,
                                         NormalizerConfig config)
    : clock_(clock), resolver_(resolver), config_(config) {
}

std::optional<Timestamp> TelemetryNormalizer::resolveTimestamp(const RawTelemetryRecord& record) const {
    std::optional<Timestamp> parsed;
    
    if (record.timestampEpoch) {
        parsed = ProviderTime::fromEpochNumber(*record.timestampEpoch);
    } else if (!record.timestampText.empty()) {
        parsed = ProviderTime::parseDateTime(record.timestampText, config_.providerUtcOffset);
    }
    
    if (!parsed || !ProviderTime::isPlausible(*parsed, clock_->now(), config_.futureTolerance)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<NormalizedPosition> TelemetryNormalizer::normalize(const RawTelemetryRecord& record,
                                                                 std::vector<SegmentationAnomaly>* anomalies) const {
    auto timestamp = resolveTimestamp(record);
    if (!timestamp) {
        std::string raw = record.timestampEpoch ? std::to_string(*record.timestampEpoch) : record.timestampText;
        report(anomalies, {AnomalyKind::InvalidTimestamp, record.deviceId, clock_->now(),
                           "unusable timestamp '" + raw + "'"});
        return std::nullopt;
    }
    
    if (!Geo::isValidCoordinate(record.latitude, record.longitude)) {
        report(anomalies, {AnomalyKind::InvalidCoordinates, record.deviceId, *timestamp,
                           "coordinates (" + std::to_string(record.latitude) + ", " +
                           std::to_string(record.longitude) + ") rejected"});
        return std::nullopt;
    }
    
    NormalizedPosition position;
    position.deviceId = record.deviceId;
    position.timestampUtc = *timestamp;
    position.latitude = record.latitude;
    position.longitude = record.longitude;
    position.speedKmh = normalizeSpeedKmh(record.speed);
    
    auto ignition = resolver_->resolve(record);
    position.ignitionOn = ignition.ignitionOn;
    position.ignitionConfidence = ignition.confidence;
    position.ignitionMethod = ignition.method;
    
    if (record.odometerTotal && *record.odometerTotal > 0.0) {
        position.odometerTotal = record.odometerTotal;
    }
    
    if (position.isLowConfidence() && position.ignitionMethod != IgnitionMethod::Unknown) {
        std::cout << "[Normalizer] Low-confidence ignition for " << position.deviceId
                  << " at " << formatIso8601(position.timestampUtc) << ": "
                  << (position.ignitionOn ? "on" : "off") << " via "
                  << ignitionMethodToString(position.ignitionMethod)
                  << " (" << position.ignitionConfidence << ")" << std::endl;
    }
    
    return position;
}

void TelemetryNormalizer::report(std::vector<SegmentationAnomaly>* anomalies, SegmentationAnomaly anomaly) const {
    std::cerr << "[Normalizer] Warning: " << anomalyKindToString(anomaly.kind)
              << " for " << anomaly.deviceId << ": " << anomaly.detail << std::endl;
    if (anomalies) {
        anomalies->push_back(std::move(anomaly));
    }
}

} // namespace tripseg::domain
