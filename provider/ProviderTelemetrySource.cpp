#include "ProviderTelemetrySource.hpp"
#include "../core/JsonCodec.hpp"
#include "../core/ProviderTime.hpp"
#include <iostream>

namespace tripseg::provider {

ProviderTelemetrySource::ProviderTelemetrySource(std::shared_ptr<ProviderClient> client,
                                                 std::chrono::minutes providerUtcOffset)
    : client_(client), providerUtcOffset_(providerUtcOffset) {
}

std::vector<RawTelemetryRecord> ProviderTelemetrySource::fetchTrack(const std::string& deviceId,
                                                                    Timestamp from,
                                                                    Timestamp to,
                                                                    Timestamp deadline) {
    nlohmann::json params = {
        {"deviceid", deviceId},
        {"starttime", ProviderTime::formatDateTime(from, providerUtcOffset_)},
        {"endtime", ProviderTime::formatDateTime(to, providerUtcOffset_)},
        {"coordsys", "wgs84"}
    };
    
    auto response = client_->call("querytrack", params, deadline);
    auto records = JsonCodec::extractRecords(response.body);
    
    for (auto& record : records) {
        if (record.deviceId.empty()) {
            record.deviceId = deviceId;
        }
    }
    
    std::cout << "[ProviderClient] querytrack " << deviceId << " returned " << records.size()
              << " records" << std::endl;
    return records;
}

} // namespace tripseg::provider
