#pragma once

#include "../Telemetry.hpp"
#include <string>
#include <vector>

namespace tripseg::ports {

class ITelemetrySource {
public:
    virtual ~ITelemetrySource() = default;
    
    virtual std::vector<RawTelemetryRecord> fetchTrack(const std::string& deviceId,
                                                       Timestamp from,
                                                       Timestamp to,
                                                       Timestamp deadline) = 0;
};

} // namespace tripseg::ports
