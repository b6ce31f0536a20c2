#include "InMemoryTelemetryStore.hpp"

namespace tripseg::adapters {

bool InMemoryTelemetryStore::insertPosition(const NormalizedPosition& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& devicePositions = positions_[position.deviceId];
    return devicePositions.emplace(position.timestampUtc, position).second;
}

std::optional<NormalizedPosition> InMemoryTelemetryStore::latestPosition(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(deviceId);
    if (it == positions_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.rbegin()->second;
}

std::vector<NormalizedPosition> InMemoryTelemetryStore::positionsInRange(const std::string& deviceId,
                                                                         Timestamp from, Timestamp to) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NormalizedPosition> result;
    
    auto it = positions_.find(deviceId);
    if (it == positions_.end()) {
        return result;
    }
    
    for (auto pos = it->second.lower_bound(from); pos != it->second.end() && pos->first <= to; ++pos) {
        result.push_back(pos->second);
    }
    return result;
}

void InMemoryTelemetryStore::upsertTrip(const Trip& trip) {
    std::lock_guard<std::mutex> lock(mutex_);
    trips_[trip.deviceId][trip.sequenceNumber] = trip;
}

std::optional<Trip> InMemoryTelemetryStore::openTrip(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trips_.find(deviceId);
    if (it == trips_.end()) {
        return std::nullopt;
    }
    
    for (auto trip = it->second.rbegin(); trip != it->second.rend(); ++trip) {
        if (trip->second.isOpen()) {
            return trip->second;
        }
    }
    return std::nullopt;
}

std::optional<Trip> InMemoryTelemetryStore::latestTrip(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trips_.find(deviceId);
    if (it == trips_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.rbegin()->second;
}

std::vector<Trip> InMemoryTelemetryStore::tripsInRange(const std::string& deviceId, Timestamp from, Timestamp to) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trip> result;
    
    auto it = trips_.find(deviceId);
    if (it == trips_.end()) {
        return result;
    }
    
    for (const auto& [sequence, trip] : it->second) {
        bool startsBeforeEnd = trip.startTime <= to;
        bool endsAfterStart = trip.isOpen() || *trip.endTime >= from;
        if (startsBeforeEnd && endsAfterStart) {
            result.push_back(trip);
        }
    }
    return result;
}

void InMemoryTelemetryStore::saveSyncStatus(const SyncStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    syncStatus_[status.deviceId] = status;
}

std::optional<SyncStatus> InMemoryTelemetryStore::loadSyncStatus(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = syncStatus_.find(deviceId);
    if (it == syncStatus_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ports::ProviderSession> InMemoryTelemetryStore::loadSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void InMemoryTelemetryStore::saveSession(const ports::ProviderSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
}

void InMemoryTelemetryStore::clearSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
}

std::optional<Timestamp> InMemoryTelemetryStore::loadBackoffUntil() {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoffUntil_;
}

void InMemoryTelemetryStore::saveBackoffUntil(Timestamp until) {
    std::lock_guard<std::mutex> lock(mutex_);
    backoffUntil_ = until;
}

size_t InMemoryTelemetryStore::positionCount(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(deviceId);
    return it == positions_.end() ? 0 : it->second.size();
}

std::vector<Trip> InMemoryTelemetryStore::allTrips(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trip> result;
    auto it = trips_.find(deviceId);
    if (it != trips_.end()) {
        for (const auto& [sequence, trip] : it->second) {
            result.push_back(trip);
        }
    }
    return result;
}

} // namespace tripseg::adapters
