#include "Telemetry.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace tripseg {

namespace {
constexpr double METERS_PER_HOUR_THRESHOLD = 200.0;
constexpr double DRIFT_SPEED_KMH = 3.0;
constexpr double MAX_SPEED_KMH = 300.0;
}

double normalizeSpeedKmh(double providerSpeed) {
    if (!std::isfinite(providerSpeed) || providerSpeed <= 0.0) {
        return 0.0;
    }
    
    double kmh = providerSpeed > METERS_PER_HOUR_THRESHOLD ? providerSpeed / 1000.0 : providerSpeed;
    if (kmh < DRIFT_SPEED_KMH) {
        return 0.0;
    }
    
    kmh = std::min(kmh, MAX_SPEED_KMH);
    return std::round(kmh * 10.0) / 10.0;
}

std::string ignitionMethodToString(IgnitionMethod method) {
    static const std::unordered_map<IgnitionMethod, std::string> methodMap = {
        {IgnitionMethod::StatusBit, "status_bit"},
        {IgnitionMethod::StringParse, "string_parse"},
        {IgnitionMethod::MultiSignal, "multi_signal"},
        {IgnitionMethod::SpeedInference, "speed_inference"},
        {IgnitionMethod::Unknown, "unknown"}
    };
    
    auto it = methodMap.find(method);
    return (it != methodMap.end()) ? it->second : "unknown";
}

IgnitionMethod stringToIgnitionMethod(const std::string& str) {
    static const std::unordered_map<std::string, IgnitionMethod> stringMap = {
        {"status_bit", IgnitionMethod::StatusBit},
        {"string_parse", IgnitionMethod::StringParse},
        {"multi_signal", IgnitionMethod::MultiSignal},
        {"speed_inference", IgnitionMethod::SpeedInference},
        {"unknown", IgnitionMethod::Unknown}
    };
    
    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : IgnitionMethod::Unknown;
}

std::string distanceMethodToString(DistanceMethod method) {
    return method == DistanceMethod::Odometer ? "odometer" : "geodesic";
}

DistanceMethod stringToDistanceMethod(const std::string& str) {
    return str == "odometer" ? DistanceMethod::Odometer : DistanceMethod::Geodesic;
}

std::string closeReasonToString(TripCloseReason reason) {
    switch (reason) {
        case TripCloseReason::IgnitionOff: return "ignition_off";
        case TripCloseReason::IdleTimeout: return "idle_timeout";
        case TripCloseReason::TimeGap: return "time_gap";
    }
    return "ignition_off";
}

std::optional<TripCloseReason> stringToCloseReason(const std::string& str) {
    if (str == "ignition_off") return TripCloseReason::IgnitionOff;
    if (str == "idle_timeout") return TripCloseReason::IdleTimeout;
    if (str == "time_gap") return TripCloseReason::TimeGap;
    return std::nullopt;
}

std::string anomalyKindToString(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::OutOfOrderSample: return "out_of_order_sample";
        case AnomalyKind::DuplicateSample: return "duplicate_sample";
        case AnomalyKind::OdometerRollback: return "odometer_rollback";
        case AnomalyKind::GpsJump: return "gps_jump";
        case AnomalyKind::InvalidCoordinates: return "invalid_coordinates";
        case AnomalyKind::InvalidTimestamp: return "invalid_timestamp";
    }
    return "unknown";
}

} // namespace tripseg
