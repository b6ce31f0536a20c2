#pragma once

#include "IgnitionResolver.hpp"
#include "../IClock.hpp"
#include "../Telemetry.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace tripseg::domain {

struct NormalizerConfig {
    std::chrono::minutes providerUtcOffset{8 * 60};
    std::chrono::seconds futureTolerance{300};
};

class TelemetryNormalizer {
public:
    TelemetryNormalizer(std::shared_ptr<IClock> clock,
                        std::shared_ptr<const IgnitionResolver> resolver,
                        NormalizerConfig config = {});

    // Returns nullopt when the record has an unusable timestamp or position.
    std::optional<NormalizedPosition> normalize(const RawTelemetryRecord& record,
                                                std::vector<SegmentationAnomaly>* anomalies = nullptr) const;
    
    std::optional<Timestamp> resolveTimestamp(const RawTelemetryRecord& record) const;

private:
    void report(std::vector<SegmentationAnomaly>* anomalies, SegmentationAnomaly anomaly) const;

    std::shared_ptr<IClock> clock_;
    std::shared_ptr<const IgnitionResolver> resolver_;
    NormalizerConfig config_;
};

} // namespace tripseg::domain
