#pragma once

#include "../core/ports/IProviderStateStore.hpp"
#include "../core/ports/ITelemetryStore.hpp"
#include <mysql/mysql.h>
#include <mutex>
#include <string>

namespace tripseg::storage {

// Durable store on MySQL (see sql/schema.sql). Writes use prepared statements.
// One connection guarded by a mutex; callers may share the store across threads.
class MySQLTelemetryStore : public ports::ITelemetryStore, public ports::IProviderStateStore {
public:
    MySQLTelemetryStore(const std::string& uri, const std::string& user,
                        const std::string& pass, const std::string& schema);
    ~MySQLTelemetryStore() override;
    
    MySQLTelemetryStore(const MySQLTelemetryStore&) = delete;
    MySQLTelemetryStore& operator=(const MySQLTelemetryStore&) = delete;

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

    std::optional<ports::ProviderSession> loadSession() override;
    void saveSession(const ports::ProviderSession& session) override;
    void clearSession() override;
    std::optional<Timestamp> loadBackoffUntil() override;
    void saveBackoffUntil(Timestamp until) override;

private:
    std::string escape(const std::string& value);
    std::vector<NormalizedPosition> queryPositions(const std::string& sql);
    std::vector<Trip> queryTrips(const std::string& sql);
    std::optional<std::string> loadState(const std::string& key);
    void saveState(const std::string& key, const std::string& value);
    void deleteState(const std::string& key);

    MYSQL* conn_ = nullptr;
    std::mutex mutex_;
};

} // namespace tripseg::storage
