#pragma once

#include "DistanceAccumulator.hpp"
#include "../Telemetry.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tripseg::domain {

enum class SegmentState {
    IdleOff,
    Active,
    IdleOn
};

// Where a trip split by the idle timeout ends.
enum class IdleCloseAnchor {
    FirstStationarySample,
    LastMovingSample
};

struct SegmenterConfig {
    std::chrono::seconds idleThreshold{180};
    // An active trip with no sample for longer than this is closed. Zero disables.
    std::chrono::seconds maxGap{30 * 60};
    IdleCloseAnchor idleCloseAnchor = IdleCloseAnchor::FirstStationarySample;
};

enum class TripEventType {
    Opened,
    Closed
};

struct TripEvent {
    TripEventType type;
    Trip trip;
};

/**
 * @brief Per-device trip state machine
 *
 * Consumes normalized positions in strictly increasing time order and emits
 * an event whenever a trip opens or closes. Idle timeouts are measured between
 * sample timestamps, never against the wall clock. Samples whose ignition
 * method is unknown keep the last known ignition state.
 *
 * Not thread-safe. Each device's worker owns its segmenter.
 */
class TripSegmenter {
public:
    TripSegmenter(std::string deviceId,
                  SegmenterConfig config = {},
                  std::shared_ptr<const DistanceAccumulator> distance = nullptr);

    std::vector<TripEvent> process(const NormalizedPosition& sample);
    
    /**
     * @brief Rebuild state from the store after a restart or a failed write
     *
     * An open lastTrip is reopened under its own sequence number. The stored
     * samples after its start (or after a closed trip's end) are then replayed,
     * so the returned events include any open or close the store never saw.
     *
     * @param lastPosition Latest persisted position of the device
     * @param lastTrip Latest persisted trip (open or closed)
     * @param storedSamples Persisted positions from lastTrip's start (open) or end (closed)
     * @return Trip events produced by the replay
     */
    std::vector<TripEvent> restore(const std::optional<NormalizedPosition>& lastPosition,
                                   const std::optional<Trip>& lastTrip,
                                   std::vector<NormalizedPosition> storedSamples);

    SegmentState getCurrentState() const { return currentState_; }
    bool isIgnitionOn() const { return ignitionOn_; }
    int64_t lastSequenceNumber() const { return lastSequence_; }
    const std::string& deviceId() const { return deviceId_; }
    
    // Snapshot of the open trip including any idle samples after the anchor
    std::optional<Trip> currentTrip() const;
    
    std::vector<SegmentationAnomaly> takeAnomalies();

private:
    void evaluateIdleOff(const NormalizedPosition& sample, bool ignition, bool previousIgnition,
                         std::vector<TripEvent>& events);
    void openTrip(const NormalizedPosition& sample, std::vector<TripEvent>& events);
    void closeTrip(TripCloseReason reason, std::vector<TripEvent>& events);
    void closeAtIdleAnchor(std::vector<TripEvent>& events);
    void mergePendingIdle();
    Trip buildTrip(const std::vector<NormalizedPosition>& samples, std::vector<SegmentationAnomaly>* anomalies) const;
    void transitionTo(SegmentState newState);
    void recordAnomaly(SegmentationAnomaly anomaly);

    std::string deviceId_;
    SegmenterConfig config_;
    std::shared_ptr<const DistanceAccumulator> distance_;
    
    SegmentState currentState_ = SegmentState::IdleOff;
    bool ignitionOn_ = false;
    std::optional<Timestamp> lastTimestamp_;
    int64_t lastSequence_ = 0;
    
    // Samples of the open trip up to and including the idle anchor
    std::vector<NormalizedPosition> tripSamples_;
    // Zero-speed samples after the anchor while idling
    std::vector<NormalizedPosition> pendingIdle_;
    
    std::vector<SegmentationAnomaly> anomalies_;
};

std::string stateToString(SegmentState state);

} // namespace tripseg::domain
