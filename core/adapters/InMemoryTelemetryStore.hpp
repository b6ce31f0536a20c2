#pragma once

#include "../ports/IProviderStateStore.hpp"
#include "../ports/ITelemetryStore.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tripseg::adapters {

// Process-local store. Used by tests and when no database is configured.
class InMemoryTelemetryStore : public ports::ITelemetryStore, public ports::IProviderStateStore {
public:
    InMemoryTelemetryStore() = default;
    ~InMemoryTelemetryStore() override = default;

    // ITelemetryStore interface
    bool insertPosition(const NormalizedPosition& position) override;
    std::optional<NormalizedPosition> latestPosition(const std::string& deviceId) override;
    std::vector<NormalizedPosition> positionsInRange(const std::string& deviceId,
                                                     Timestamp from, Timestamp to) override;
    
    void upsertTrip(const Trip& trip) override;
    std::optional<Trip> openTrip(const std::string& deviceId) override;
    std::optional<Trip> latestTrip(const std::string& deviceId) override;
    std::vector<Trip> tripsInRange(const std::string& deviceId, Timestamp from, Timestamp to) override;
    
    void saveSyncStatus(const SyncStatus& status) override;
    std::optional<SyncStatus> loadSyncStatus(const std::string& deviceId) override;

    // IProviderStateStore interface
    std::optional<ports::ProviderSession> loadSession() override;
    void saveSession(const ports::ProviderSession& session) override;
    void clearSession() override;
    std::optional<Timestamp> loadBackoffUntil() override;
    void saveBackoffUntil(Timestamp until) override;

    // Inspection helpers for tests
    size_t positionCount(const std::string& deviceId) const;
    std::vector<Trip> allTrips(const std::string& deviceId) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<Timestamp, NormalizedPosition>> positions_;
    std::unordered_map<std::string, std::map<int64_t, Trip>> trips_;
    std::unordered_map<std::string, SyncStatus> syncStatus_;
    std::optional<ports::ProviderSession> session_;
    std::optional<Timestamp> backoffUntil_;
};

} // namespace tripseg::adapters
