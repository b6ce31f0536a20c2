// MySQLTelemetryStore persists positions, trips, sync status and provider state.

#include "MySQLTelemetryStore.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace tripseg::storage {

namespace {

using StatementPtr = std::unique_ptr<MYSQL_STMT, decltype(&mysql_stmt_close)>;
using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

const char* kSessionKey = "provider_session";
const char* kBackoffKey = "provider_backoff_until";

// Owns the MYSQL_BIND array and the storage its buffers point into
class ParamBinder {
public:
    explicit ParamBinder(size_t count)
        : binds_(count), lengths_(count), longs_(count), doubles_(count) {
        std::memset(binds_.data(), 0, sizeof(MYSQL_BIND) * count);
    }

    void bindString(size_t i, const std::string& value) {
        lengths_[i] = value.size();
        binds_[i].buffer_type = MYSQL_TYPE_STRING;
        binds_[i].buffer = const_cast<char*>(value.data());
        binds_[i].buffer_length = value.size();
        binds_[i].length = &lengths_[i];
    }

    void bindLongLong(size_t i, long long value) {
        longs_[i] = value;
        binds_[i].buffer_type = MYSQL_TYPE_LONGLONG;
        binds_[i].buffer = &longs_[i];
    }

    void bindDouble(size_t i, double value) {
        doubles_[i] = value;
        binds_[i].buffer_type = MYSQL_TYPE_DOUBLE;
        binds_[i].buffer = &doubles_[i];
    }

    void bindNull(size_t i) {
        binds_[i].buffer_type = MYSQL_TYPE_NULL;
    }

    MYSQL_BIND* data() { return binds_.data(); }

private:
    std::vector<MYSQL_BIND> binds_;
    std::vector<unsigned long> lengths_;
    std::vector<long long> longs_;
    std::vector<double> doubles_;
};

// Prepare, bind and run one statement; returns affected rows
unsigned long long execute(MYSQL* conn, const char* sql, ParamBinder& binder) {
    StatementPtr stmt(mysql_stmt_init(conn), &mysql_stmt_close);
    if (!stmt)
        throw std::runtime_error("mysql_stmt_init failed");

    if (mysql_stmt_prepare(stmt.get(), sql, std::strlen(sql)))
        throw std::runtime_error(mysql_stmt_error(stmt.get()));

    if (mysql_stmt_bind_param(stmt.get(), binder.data()))
        throw std::runtime_error(mysql_stmt_error(stmt.get()));

    if (mysql_stmt_execute(stmt.get()))
        throw std::runtime_error(mysql_stmt_error(stmt.get()));

    return mysql_stmt_affected_rows(stmt.get());
}

ResultPtr query(MYSQL* conn, const std::string& sql) {
    if (mysql_query(conn, sql.c_str()))
        throw std::runtime_error(mysql_error(conn));

    ResultPtr result(mysql_store_result(conn), &mysql_free_result);
    if (!result)
        throw std::runtime_error(mysql_error(conn));
    return result;
}

long long toLong(const char* field) { return field ? std::strtoll(field, nullptr, 10) : 0; }
double toDouble(const char* field) { return field ? std::strtod(field, nullptr) : 0.0; }
std::string toString(const char* field) { return field ? std::string(field) : std::string(); }

const char* kPositionColumns =
    "SELECT device_id, timestamp_ms, latitude, longitude, speed_kmh, ignition_on, "
    "ignition_confidence, ignition_method, odometer_total FROM positions ";

const char* kTripColumns =
    "SELECT device_id, trip_sequence_number, start_ms, end_ms, start_lat, start_lon, end_lat, end_lon, "
    "distance_m, distance_method, avg_speed_kmh, max_speed_kmh, sample_count, close_reason FROM trips ";

} // namespace

// Establish connection using URI "tcp://host:port" and credentials
MySQLTelemetryStore::MySQLTelemetryStore(const std::string& uri, const std::string& user,
                                         const std::string& pass, const std::string& schema) {
    conn_ = mysql_init(nullptr);
    if (!conn_)
        throw std::runtime_error("mysql_init failed");

    std::string host = uri, port = "3306";
    if (auto pos = uri.find("://"); pos != std::string::npos) {
        host = uri.substr(pos + 3);
    }
    if (auto p = host.find(':'); p != std::string::npos) {
        port = host.substr(p + 1);
        host = host.substr(0, p);
    }
    if (!mysql_real_connect(conn_, host.c_str(), user.c_str(), pass.c_str(),
                            schema.c_str(), std::stoi(port), nullptr, 0)) {
        std::string err = mysql_error(conn_);
        mysql_close(conn_);
        throw std::runtime_error("connect failed: " + err);
    }
    mysql_set_character_set(conn_, "utf8mb4");

    std::cout << "[MySQLStore] Connected to " << host << ":" << port << "/" << schema << std::endl;
}

MySQLTelemetryStore::~MySQLTelemetryStore() { mysql_close(conn_); }

bool MySQLTelemetryStore::insertPosition(const NormalizedPosition& position) {
    // The no-op update leaves affected rows at 0 for an existing key
    static const char* SQL = R"SQL(
        INSERT INTO positions
          (device_id, timestamp_ms, latitude, longitude, speed_kmh, ignition_on,
           ignition_confidence, ignition_method, odometer_total)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON DUPLICATE KEY UPDATE device_id = device_id
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string method = ignitionMethodToString(position.ignitionMethod);
    ParamBinder b(9);
    b.bindString(0, position.deviceId);
    b.bindLongLong(1, toEpochMillis(position.timestampUtc));
    b.bindDouble(2, position.latitude);
    b.bindDouble(3, position.longitude);
    b.bindDouble(4, position.speedKmh);
    b.bindLongLong(5, position.ignitionOn ? 1 : 0);
    b.bindDouble(6, position.ignitionConfidence);
    b.bindString(7, method);
    if (position.odometerTotal) {
        b.bindDouble(8, *position.odometerTotal);
    } else {
        b.bindNull(8);
    }

    return execute(conn_, SQL, b) > 0;
}

std::optional<NormalizedPosition> MySQLTelemetryStore::latestPosition(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = queryPositions(std::string(kPositionColumns) + "WHERE device_id = '" + escape(deviceId) +
                               "' ORDER BY timestamp_ms DESC LIMIT 1");
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<NormalizedPosition> MySQLTelemetryStore::positionsInRange(const std::string& deviceId,
                                                                      Timestamp from, Timestamp to) {
    std::lock_guard<std::mutex> lock(mutex_);
    return queryPositions(std::string(kPositionColumns) + "WHERE device_id = '" + escape(deviceId) +
                          "' AND timestamp_ms BETWEEN " + std::to_string(toEpochMillis(from)) +
                          " AND " + std::to_string(toEpochMillis(to)) + " ORDER BY timestamp_ms");
}

void MySQLTelemetryStore::upsertTrip(const Trip& trip) {
    static const char* SQL = R"SQL(
        INSERT INTO trips
          (device_id, trip_sequence_number, start_ms, end_ms, start_lat, start_lon, end_lat, end_lon,
           distance_m, distance_method, avg_speed_kmh, max_speed_kmh, sample_count, close_reason)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON DUPLICATE KEY UPDATE
          end_ms = VALUES(end_ms),
          end_lat = VALUES(end_lat),
          end_lon = VALUES(end_lon),
          distance_m = VALUES(distance_m),
          distance_method = VALUES(distance_method),
          avg_speed_kmh = VALUES(avg_speed_kmh),
          max_speed_kmh = VALUES(max_speed_kmh),
          sample_count = VALUES(sample_count),
          close_reason = VALUES(close_reason)
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string method = distanceMethodToString(trip.distanceMethod);
    std::string reason = trip.closeReason ? closeReasonToString(*trip.closeReason) : "";
    
    ParamBinder b(14);
    b.bindString(0, trip.deviceId);
    b.bindLongLong(1, trip.sequenceNumber);
    b.bindLongLong(2, toEpochMillis(trip.startTime));
    if (trip.endTime) {
        b.bindLongLong(3, toEpochMillis(*trip.endTime));
    } else {
        b.bindNull(3);
    }
    b.bindDouble(4, trip.startPosition.latitude);
    b.bindDouble(5, trip.startPosition.longitude);
    b.bindDouble(6, trip.endPosition.latitude);
    b.bindDouble(7, trip.endPosition.longitude);
    b.bindDouble(8, trip.distanceMeters);
    b.bindString(9, method);
    b.bindDouble(10, trip.avgSpeedKmh);
    b.bindDouble(11, trip.maxSpeedKmh);
    b.bindLongLong(12, trip.sampleCount);
    if (trip.closeReason) {
        b.bindString(13, reason);
    } else {
        b.bindNull(13);
    }

    execute(conn_, SQL, b);
}

std::optional<Trip> MySQLTelemetryStore::openTrip(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto trips = queryTrips(std::string(kTripColumns) + "WHERE device_id = '" + escape(deviceId) +
                            "' AND end_ms IS NULL ORDER BY trip_sequence_number DESC LIMIT 1");
    if (trips.empty()) return std::nullopt;
    return trips.front();
}

std::optional<Trip> MySQLTelemetryStore::latestTrip(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto trips = queryTrips(std::string(kTripColumns) + "WHERE device_id = '" + escape(deviceId) +
                            "' ORDER BY trip_sequence_number DESC LIMIT 1");
    if (trips.empty()) return std::nullopt;
    return trips.front();
}

std::vector<Trip> MySQLTelemetryStore::tripsInRange(const std::string& deviceId, Timestamp from, Timestamp to) {
    std::lock_guard<std::mutex> lock(mutex_);
    return queryTrips(std::string(kTripColumns) + "WHERE device_id = '" + escape(deviceId) +
                      "' AND start_ms <= " + std::to_string(toEpochMillis(to)) +
                      " AND (end_ms IS NULL OR end_ms >= " + std::to_string(toEpochMillis(from)) +
                      ") ORDER BY trip_sequence_number");
}

void MySQLTelemetryStore::saveSyncStatus(const SyncStatus& status) {
    static const char* SQL = R"SQL(
        INSERT INTO device_sync_status
          (device_id, last_success_ms, last_position_ms, error_count, last_error)
        VALUES (?, ?, ?, ?, ?)
        ON DUPLICATE KEY UPDATE
          last_success_ms = VALUES(last_success_ms),
          last_position_ms = VALUES(last_position_ms),
          error_count = VALUES(error_count),
          last_error = VALUES(last_error)
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    
    ParamBinder b(5);
    b.bindString(0, status.deviceId);
    if (status.lastSuccessAt) {
        b.bindLongLong(1, toEpochMillis(*status.lastSuccessAt));
    } else {
        b.bindNull(1);
    }
    if (status.lastPositionAt) {
        b.bindLongLong(2, toEpochMillis(*status.lastPositionAt));
    } else {
        b.bindNull(2);
    }
    b.bindLongLong(3, status.errorCount);
    b.bindString(4, status.lastError);

    execute(conn_, SQL, b);
}

std::optional<SyncStatus> MySQLTelemetryStore::loadSyncStatus(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = query(conn_, "SELECT device_id, last_success_ms, last_position_ms, error_count, last_error "
                               "FROM device_sync_status WHERE device_id = '" + escape(deviceId) + "'");
    
    MYSQL_ROW row = mysql_fetch_row(result.get());
    if (!row) return std::nullopt;
    
    SyncStatus status;
    status.deviceId = toString(row[0]);
    if (row[1]) status.lastSuccessAt = fromEpochMillis(toLong(row[1]));
    if (row[2]) status.lastPositionAt = fromEpochMillis(toLong(row[2]));
    status.errorCount = static_cast<int>(toLong(row[3]));
    status.lastError = toString(row[4]);
    return status;
}

std::optional<ports::ProviderSession> MySQLTelemetryStore::loadSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = loadState(kSessionKey);
    if (!value) return std::nullopt;
    
    auto json = nlohmann::json::parse(*value, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        std::cerr << "[MySQLStore] Warning: ignoring unreadable provider session" << std::endl;
        return std::nullopt;
    }
    
    ports::ProviderSession session;
    session.token = json.value("token", "");
    session.serverId = json.value("serverId", "");
    session.expiresAt = fromEpochMillis(json.value("expiresAtMs", static_cast<int64_t>(0)));
    return session;
}

void MySQLTelemetryStore::saveSession(const ports::ProviderSession& session) {
    nlohmann::json json = {
        {"token", session.token},
        {"serverId", session.serverId},
        {"expiresAtMs", toEpochMillis(session.expiresAt)}
    };
    
    std::lock_guard<std::mutex> lock(mutex_);
    saveState(kSessionKey, json.dump());
}

void MySQLTelemetryStore::clearSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    deleteState(kSessionKey);
}

std::optional<Timestamp> MySQLTelemetryStore::loadBackoffUntil() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = loadState(kBackoffKey);
    if (!value) return std::nullopt;
    return fromEpochMillis(std::strtoll(value->c_str(), nullptr, 10));
}

void MySQLTelemetryStore::saveBackoffUntil(Timestamp until) {
    std::lock_guard<std::mutex> lock(mutex_);
    saveState(kBackoffKey, std::to_string(toEpochMillis(until)));
}

std::string MySQLTelemetryStore::escape(const std::string& value) {
    std::string escaped(value.size() * 2 + 1, '\0');
    unsigned long length = mysql_real_escape_string(conn_, &escaped[0], value.c_str(),
                                                    static_cast<unsigned long>(value.size()));
    escaped.resize(length);
    return escaped;
}

std::vector<NormalizedPosition> MySQLTelemetryStore::queryPositions(const std::string& sql) {
    std::vector<NormalizedPosition> positions;
    auto result = query(conn_, sql);
    
    while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
        NormalizedPosition p;
        p.deviceId = toString(row[0]);
        p.timestampUtc = fromEpochMillis(toLong(row[1]));
        p.latitude = toDouble(row[2]);
        p.longitude = toDouble(row[3]);
        p.speedKmh = toDouble(row[4]);
        p.ignitionOn = toLong(row[5]) != 0;
        p.ignitionConfidence = toDouble(row[6]);
        p.ignitionMethod = stringToIgnitionMethod(toString(row[7]));
        if (row[8]) p.odometerTotal = toDouble(row[8]);
        positions.push_back(std::move(p));
    }
    return positions;
}

std::vector<Trip> MySQLTelemetryStore::queryTrips(const std::string& sql) {
    std::vector<Trip> trips;
    auto result = query(conn_, sql);
    
    while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
        Trip t;
        t.deviceId = toString(row[0]);
        t.sequenceNumber = toLong(row[1]);
        t.startTime = fromEpochMillis(toLong(row[2]));
        if (row[3]) t.endTime = fromEpochMillis(toLong(row[3]));
        t.startPosition = GeoPoint{toDouble(row[4]), toDouble(row[5])};
        t.endPosition = GeoPoint{toDouble(row[6]), toDouble(row[7])};
        t.distanceMeters = toDouble(row[8]);
        t.distanceMethod = stringToDistanceMethod(toString(row[9]));
        t.avgSpeedKmh = toDouble(row[10]);
        t.maxSpeedKmh = toDouble(row[11]);
        t.sampleCount = static_cast<int>(toLong(row[12]));
        if (row[13]) t.closeReason = stringToCloseReason(toString(row[13]));
        trips.push_back(std::move(t));
    }
    return trips;
}

std::optional<std::string> MySQLTelemetryStore::loadState(const std::string& key) {
    auto result = query(conn_, "SELECT state_value FROM provider_state WHERE state_key = '" + escape(key) + "'");
    MYSQL_ROW row = mysql_fetch_row(result.get());
    if (!row || !row[0]) return std::nullopt;
    return std::string(row[0]);
}

void MySQLTelemetryStore::saveState(const std::string& key, const std::string& value) {
    static const char* SQL = R"SQL(
        INSERT INTO provider_state (state_key, state_value) VALUES (?, ?)
        ON DUPLICATE KEY UPDATE state_value = VALUES(state_value)
    )SQL";

    ParamBinder b(2);
    b.bindString(0, key);
    b.bindString(1, value);
    execute(conn_, SQL, b);
}

void MySQLTelemetryStore::deleteState(const std::string& key) {
    static const char* SQL = "DELETE FROM provider_state WHERE state_key = ?";

    ParamBinder b(1);
    b.bindString(0, key);
    execute(conn_, SQL, b);
}

} // namespace tripseg::storage
