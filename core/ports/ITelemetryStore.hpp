#pragma once

#include "../Telemetry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tripseg::ports {

class ITelemetryStore {
public:
    virtual ~ITelemetryStore() = default;
    
    // Positions are unique on (deviceId, timestampUtc). Returns false for a duplicate.
    virtual bool insertPosition(const NormalizedPosition& position) = 0;
    virtual std::optional<NormalizedPosition> latestPosition(const std::string& deviceId) = 0;
    virtual std::vector<NormalizedPosition> positionsInRange(const std::string& deviceId,
                                                             Timestamp from, Timestamp to) = 0;
    
    // Trips are keyed on (deviceId, sequenceNumber).
    virtual void upsertTrip(const Trip& trip) = 0;
    virtual std::optional<Trip> openTrip(const std::string& deviceId) = 0;
    virtual std::optional<Trip> latestTrip(const std::string& deviceId) = 0;
    virtual std::vector<Trip> tripsInRange(const std::string& deviceId, Timestamp from, Timestamp to) = 0;
    
    virtual void saveSyncStatus(const SyncStatus& status) = 0;
    virtual std::optional<SyncStatus> loadSyncStatus(const std::string& deviceId) = 0;
};

} // namespace tripseg::ports
