#include "JsonCodec.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tripseg {

namespace {

bool isAllDigits(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<double> parseDouble(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) return std::nullopt;
    return value;
}

// Non-finite values and values outside the int64 range have no integer form
std::optional<int64_t> toInt64(double value) {
    if (!std::isfinite(value) || value < -9223372036854775808.0 || value >= 9223372036854775808.0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

} // namespace

const nlohmann::json* JsonCodec::firstPresent(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    if (!json.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = json.find(key);
        if (it != json.end() && !it->is_null()) {
            if (it->is_string() && it->get_ref<const std::string&>().empty()) {
                continue;
            }
            return &(*it);
        }
    }
    return nullptr;
}

std::optional<double> JsonCodec::numberField(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    const auto* value = firstPresent(json, keys);
    if (!value) return std::nullopt;
    if (value->is_number()) {
        double number = value->get<double>();
        if (!std::isfinite(number)) return std::nullopt;
        return number;
    }
    if (value->is_string()) return parseDouble(value->get<std::string>());
    return std::nullopt;
}

std::optional<int64_t> JsonCodec::integerField(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    const auto* value = firstPresent(json, keys);
    if (!value) return std::nullopt;
    
    if (value->is_number_unsigned()) {
        auto raw = value->get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            // Only the low 32 bits carry status flags
            return static_cast<int64_t>(raw & 0xFFFFFFFFULL);
        }
        return static_cast<int64_t>(raw);
    }
    if (value->is_number_integer()) return value->get<int64_t>();
    if (value->is_number_float()) return toInt64(value->get<double>());
    if (value->is_string()) {
        auto parsed = parseDouble(value->get<std::string>());
        if (parsed) return toInt64(*parsed);
    }
    return std::nullopt;
}

std::optional<std::string> JsonCodec::stringField(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    const auto* value = firstPresent(json, keys);
    if (!value) return std::nullopt;
    if (value->is_string()) return value->get<std::string>();
    if (value->is_number_integer()) return std::to_string(value->get<int64_t>());
    return value->dump();
}

RawTelemetryRecord JsonCodec::jsonToRawRecord(const nlohmann::json& json) {
    RawTelemetryRecord record;
    
    record.deviceId = stringField(json, {"deviceid", "deviceId"}).value_or("");
    
    if (const auto* time = firstPresent(json, {"gpstime", "devicetime", "updatetime", "time"})) {
        if (time->is_number_float()) {
            // An unrepresentable number is kept as text so it is reported as an invalid timestamp
            if (auto epoch = toInt64(time->get<double>())) {
                record.timestampEpoch = *epoch;
            } else {
                record.timestampText = time->dump();
            }
        } else if (time->is_number()) {
            record.timestampEpoch = time->get<int64_t>();
        } else if (time->is_string()) {
            const auto& text = time->get_ref<const std::string&>();
            if (isAllDigits(text) && text.size() <= 18) {
                record.timestampEpoch = std::stoll(text);
            } else {
                record.timestampText = text;
            }
        }
    }
    
    record.latitude = numberField(json, {"callat", "lat", "latitude"}).value_or(0.0);
    record.longitude = numberField(json, {"callon", "lon", "lng", "longitude"}).value_or(0.0);
    record.speed = numberField(json, {"speed"}).value_or(0.0);
    
    record.statusBitmask = integerField(json, {"status"});
    record.statusText = stringField(json, {"strstatus", "strstatusen"});
    record.odometerTotal = numberField(json, {"totaldistance"});
    
    if (auto moving = integerField(json, {"moving"})) {
        record.moving = static_cast<int>(*moving);
    }
    
    return record;
}

std::vector<RawTelemetryRecord> JsonCodec::extractRecords(const nlohmann::json& response) {
    std::vector<RawTelemetryRecord> records;
    
    const nlohmann::json* list = nullptr;
    if (response.contains("records") && response["records"].is_array()) {
        list = &response["records"];
    } else if (response.contains("data") && response["data"].is_object() &&
               response["data"].contains("records") && response["data"]["records"].is_array()) {
        list = &response["data"]["records"];
    }
    
    if (!list) return records;
    
    records.reserve(list->size());
    for (const auto& item : *list) {
        if (item.is_object()) {
            records.push_back(jsonToRawRecord(item));
        }
    }
    return records;
}

nlohmann::json JsonCodec::positionToJson(const NormalizedPosition& position) {
    nlohmann::json j;
    
    j["deviceId"] = position.deviceId;
    j["ts"] = formatIso8601(position.timestampUtc);
    j["lat"] = position.latitude;
    j["lon"] = position.longitude;
    j["speedKmh"] = position.speedKmh;
    j["ignition"] = {
        {"on", position.ignitionOn},
        {"confidence", position.ignitionConfidence},
        {"method", ignitionMethodToString(position.ignitionMethod)}
    };
    
    if (position.odometerTotal) {
        j["odometer"] = *position.odometerTotal;
    } else {
        j["odometer"] = nullptr;
    }
    
    return j;
}

nlohmann::json JsonCodec::tripToJson(const Trip& trip) {
    nlohmann::json j;
    
    j["deviceId"] = trip.deviceId;
    j["seq"] = trip.sequenceNumber;
    j["startTime"] = formatIso8601(trip.startTime);
    j["endTime"] = trip.endTime ? nlohmann::json(formatIso8601(*trip.endTime)) : nlohmann::json(nullptr);
    j["start"] = {{"lat", trip.startPosition.latitude}, {"lon", trip.startPosition.longitude}};
    j["end"] = {{"lat", trip.endPosition.latitude}, {"lon", trip.endPosition.longitude}};
    j["distanceMeters"] = trip.distanceMeters;
    j["distanceMethod"] = distanceMethodToString(trip.distanceMethod);
    j["approximate"] = trip.isApproximate();
    j["avgSpeedKmh"] = trip.avgSpeedKmh;
    j["maxSpeedKmh"] = trip.maxSpeedKmh;
    j["samples"] = trip.sampleCount;
    j["closeReason"] = trip.closeReason
        ? nlohmann::json(closeReasonToString(*trip.closeReason))
        : nlohmann::json(nullptr);
    
    return j;
}

nlohmann::json JsonCodec::syncStatusToJson(const SyncStatus& status) {
    nlohmann::json j;
    
    j["deviceId"] = status.deviceId;
    j["lastSuccessAt"] = status.lastSuccessAt
        ? nlohmann::json(formatIso8601(*status.lastSuccessAt)) : nlohmann::json(nullptr);
    j["lastPositionAt"] = status.lastPositionAt
        ? nlohmann::json(formatIso8601(*status.lastPositionAt)) : nlohmann::json(nullptr);
    j["errorCount"] = status.errorCount;
    j["lastError"] = status.lastError;
    
    return j;
}

std::string JsonCodec::serialize(const Trip& trip) {
    return tripToJson(trip).dump();
}

} // namespace tripseg
