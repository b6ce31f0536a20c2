#pragma once

#include "ProviderClient.hpp"
#include "../core/ports/ITelemetrySource.hpp"
#include <chrono>
#include <memory>

namespace tripseg::provider {

// Fetches a device's track through the provider's querytrack action.
class ProviderTelemetrySource : public ports::ITelemetrySource {
public:
    explicit ProviderTelemetrySource(std::shared_ptr<ProviderClient> client,
                                     std::chrono::minutes providerUtcOffset = std::chrono::minutes(8 * 60));

    std::vector<RawTelemetryRecord> fetchTrack(const std::string& deviceId,
                                               Timestamp from,
                                               Timestamp to,
                                               Timestamp deadline) override;

private:
    std::shared_ptr<ProviderClient> client_;
    std::chrono::minutes providerUtcOffset_;
};

} // namespace tripseg::provider
