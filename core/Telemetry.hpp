#pragma once

#include "Geo.hpp"
#include "IClock.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace tripseg {

enum class IgnitionMethod {
    StatusBit,
    StringParse,
    MultiSignal,
    SpeedInference,
    Unknown
};

enum class DistanceMethod {
    Odometer,
    Geodesic
};

enum class TripCloseReason {
    IgnitionOff,
    IdleTimeout,
    TimeGap
};

enum class AnomalyKind {
    OutOfOrderSample,
    DuplicateSample,
    OdometerRollback,
    GpsJump,
    InvalidCoordinates,
    InvalidTimestamp
};

// One report as the provider delivered it. Speed is in provider units.
struct RawTelemetryRecord {
    std::string deviceId;
    std::string timestampText;
    std::optional<int64_t> timestampEpoch;
    double latitude = 0.0;
    double longitude = 0.0;
    double speed = 0.0;
    std::optional<int64_t> statusBitmask;
    std::optional<std::string> statusText;
    std::optional<double> odometerTotal;
    std::optional<int> moving;
};

struct NormalizedPosition {
    std::string deviceId;
    Timestamp timestampUtc;
    double latitude = 0.0;
    double longitude = 0.0;
    double speedKmh = 0.0;
    
    bool ignitionOn = false;
    double ignitionConfidence = 0.0;
    IgnitionMethod ignitionMethod = IgnitionMethod::Unknown;
    
    std::optional<double> odometerTotal;

    GeoPoint position() const { return GeoPoint{latitude, longitude}; }
    bool isLowConfidence() const { return ignitionConfidence < 0.5; }
};

struct Trip {
    std::string deviceId;
    int64_t sequenceNumber = 0;
    
    Timestamp startTime;
    std::optional<Timestamp> endTime;
    GeoPoint startPosition;
    GeoPoint endPosition;
    
    double distanceMeters = 0.0;
    DistanceMethod distanceMethod = DistanceMethod::Geodesic;
    double avgSpeedKmh = 0.0;
    double maxSpeedKmh = 0.0;
    int sampleCount = 0;
    
    std::optional<TripCloseReason> closeReason;

    bool isOpen() const { return !endTime.has_value(); }
    bool isApproximate() const { return distanceMethod == DistanceMethod::Geodesic; }
};

struct SyncStatus {
    std::string deviceId;
    std::optional<Timestamp> lastSuccessAt;
    std::optional<Timestamp> lastPositionAt;
    int errorCount = 0;
    std::string lastError;
};

// Recoverable data problem. Reported and logged, never thrown.
struct SegmentationAnomaly {
    AnomalyKind kind;
    std::string deviceId;
    Timestamp timestamp;
    std::string detail;
};

// Provider speed to km/h: values above 200 arrive in m/h, sub-3 km/h readings are GPS drift.
double normalizeSpeedKmh(double providerSpeed);

std::string ignitionMethodToString(IgnitionMethod method);
IgnitionMethod stringToIgnitionMethod(const std::string& str);

std::string distanceMethodToString(DistanceMethod method);
DistanceMethod stringToDistanceMethod(const std::string& str);

std::string closeReasonToString(TripCloseReason reason);
std::optional<TripCloseReason> stringToCloseReason(const std::string& str);

std::string anomalyKindToString(AnomalyKind kind);

} // namespace tripseg
