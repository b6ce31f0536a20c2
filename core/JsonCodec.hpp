#pragma once

#include "Telemetry.hpp"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace tripseg {

class JsonCodec {
public:
    // Provider payloads
    static RawTelemetryRecord jsonToRawRecord(const nlohmann::json& json);
    static std::vector<RawTelemetryRecord> extractRecords(const nlohmann::json& response);
    
    static nlohmann::json positionToJson(const NormalizedPosition& position);
    static nlohmann::json tripToJson(const Trip& trip);
    static nlohmann::json syncStatusToJson(const SyncStatus& status);
    
    static std::string serialize(const Trip& trip);
    
    static std::optional<double> numberField(const nlohmann::json& json, std::initializer_list<const char*> keys);
    static std::optional<int64_t> integerField(const nlohmann::json& json, std::initializer_list<const char*> keys);
    static std::optional<std::string> stringField(const nlohmann::json& json, std::initializer_list<const char*> keys);

private:
    static const nlohmann::json* firstPresent(const nlohmann::json& json, std::initializer_list<const char*> keys);
};

} // namespace tripseg
