#include "TripSegmenter.hpp"
#include <algorithm>
#include <iostream>

namespace tripseg::domain {

TripSegmenter::TripSegmenter(std::string deviceId,
                             SegmenterConfig config,
                             std::shared_ptr<const DistanceAccumulator> distance)
    : deviceId_(std::move(deviceId)), config_(config), distance_(distance) {
    if (!distance_) {
        distance_ = std::make_shared<DistanceAccumulator>();
    }
}

std::vector<TripEvent> TripSegmenter::process(const NormalizedPosition& sample) {
    std::vector<TripEvent> events;
    
    if (lastTimestamp_ && sample.timestampUtc <= *lastTimestamp_) {
        bool duplicate = sample.timestampUtc == *lastTimestamp_;
        recordAnomaly({duplicate ? AnomalyKind::DuplicateSample : AnomalyKind::OutOfOrderSample,
                       deviceId_, sample.timestampUtc,
                       "sample at " + formatIso8601(sample.timestampUtc) + " not after " +
                       formatIso8601(*lastTimestamp_)});
        return events;
    }
    
    auto previousTimestamp = lastTimestamp_;
    lastTimestamp_ = sample.timestampUtc;
    
    bool previousIgnition = ignitionOn_;
    bool ignition = sample.ignitionMethod == IgnitionMethod::Unknown ? ignitionOn_ : sample.ignitionOn;
    ignitionOn_ = ignition;
    
    if (currentState_ == SegmentState::Active && config_.maxGap.count() > 0 && previousTimestamp &&
        sample.timestampUtc - *previousTimestamp > config_.maxGap) {
        std::cout << "[Segmenter] " << deviceId_ << ": no data for "
                  << std::chrono::duration_cast<std::chrono::minutes>(sample.timestampUtc - *previousTimestamp).count()
                  << " min, closing trip at last sample" << std::endl;
        closeTrip(TripCloseReason::TimeGap, events);
        transitionTo(SegmentState::IdleOff);
    }
    
    switch (currentState_) {
        case SegmentState::IdleOff:
            evaluateIdleOff(sample, ignition, previousIgnition, events);
            break;
            
        case SegmentState::Active:
            tripSamples_.push_back(sample);
            if (!ignition) {
                closeTrip(TripCloseReason::IgnitionOff, events);
                transitionTo(SegmentState::IdleOff);
            } else if (sample.speedKmh <= 0.0) {
                // This sample becomes the idle anchor
                transitionTo(SegmentState::IdleOn);
            }
            break;
            
        case SegmentState::IdleOn: {
            Timestamp anchorTime = tripSamples_.back().timestampUtc;
            
            if (!ignition) {
                mergePendingIdle();
                tripSamples_.push_back(sample);
                closeTrip(TripCloseReason::IgnitionOff, events);
                transitionTo(SegmentState::IdleOff);
            } else if (sample.timestampUtc - anchorTime >= config_.idleThreshold) {
                closeAtIdleAnchor(events);
                transitionTo(SegmentState::IdleOff);
                evaluateIdleOff(sample, ignition, true, events);
            } else if (sample.speedKmh > 0.0) {
                mergePendingIdle();
                tripSamples_.push_back(sample);
                transitionTo(SegmentState::Active);
            } else {
                pendingIdle_.push_back(sample);
            }
            break;
        }
    }
    
    return events;
}

void TripSegmenter::evaluateIdleOff(const NormalizedPosition& sample, bool ignition, bool previousIgnition,
                                    std::vector<TripEvent>& events) {
    // A fresh ignition-on opens a trip; with ignition already on only movement does
    if (!ignition || (previousIgnition && sample.speedKmh <= 0.0)) {
        return;
    }
    
    openTrip(sample, events);
    transitionTo(sample.speedKmh > 0.0 ? SegmentState::Active : SegmentState::IdleOn);
}

void TripSegmenter::openTrip(const NormalizedPosition& sample, std::vector<TripEvent>& events) {
    tripSamples_.clear();
    pendingIdle_.clear();
    tripSamples_.push_back(sample);
    ++lastSequence_;
    
    Trip trip = buildTrip(tripSamples_, nullptr);
    std::cout << "[Segmenter] " << deviceId_ << ": Trip #" << trip.sequenceNumber
              << " opened at " << formatIso8601(trip.startTime) << std::endl;
    
    events.push_back({TripEventType::Opened, std::move(trip)});
}

void TripSegmenter::closeTrip(TripCloseReason reason, std::vector<TripEvent>& events) {
    if (tripSamples_.empty()) {
        return;
    }
    
    Trip trip = buildTrip(tripSamples_, &anomalies_);
    trip.endTime = tripSamples_.back().timestampUtc;
    trip.closeReason = reason;
    
    std::cout << "[Segmenter] " << deviceId_ << ": Trip #" << trip.sequenceNumber
              << " closed (" << closeReasonToString(reason) << ") at " << formatIso8601(*trip.endTime)
              << ", " << trip.distanceMeters << " m via " << distanceMethodToString(trip.distanceMethod)
              << ", " << trip.sampleCount << " samples" << std::endl;
    
    tripSamples_.clear();
    pendingIdle_.clear();
    events.push_back({TripEventType::Closed, std::move(trip)});
}

void TripSegmenter::closeAtIdleAnchor(std::vector<TripEvent>& events) {
    // Samples after the anchor never belong to the closed trip
    pendingIdle_.clear();
    
    if (config_.idleCloseAnchor == IdleCloseAnchor::LastMovingSample && tripSamples_.size() > 1) {
        tripSamples_.pop_back();
    }
    
    closeTrip(TripCloseReason::IdleTimeout, events);
}

void TripSegmenter::mergePendingIdle() {
    tripSamples_.insert(tripSamples_.end(), pendingIdle_.begin(), pendingIdle_.end());
    pendingIdle_.clear();
}

Trip TripSegmenter::buildTrip(const std::vector<NormalizedPosition>& samples,
                              std::vector<SegmentationAnomaly>* anomalies) const {
    Trip trip;
    trip.deviceId = deviceId_;
    trip.sequenceNumber = lastSequence_;
    trip.startTime = samples.front().timestampUtc;
    trip.startPosition = samples.front().position();
    trip.endPosition = samples.back().position();
    trip.sampleCount = static_cast<int>(samples.size());
    
    auto distance = distance_->compute(samples, anomalies);
    trip.distanceMeters = distance.distanceMeters;
    trip.distanceMethod = distance.method;
    
    double speedSum = 0.0;
    int movingSamples = 0;
    for (const auto& sample : samples) {
        trip.maxSpeedKmh = std::max(trip.maxSpeedKmh, sample.speedKmh);
        if (sample.speedKmh > 0.0) {
            speedSum += sample.speedKmh;
            ++movingSamples;
        }
    }
    trip.avgSpeedKmh = movingSamples > 0 ? speedSum / movingSamples : 0.0;
    
    return trip;
}

std::optional<Trip> TripSegmenter::currentTrip() const {
    if (tripSamples_.empty()) {
        return std::nullopt;
    }
    
    std::vector<NormalizedPosition> samples = tripSamples_;
    samples.insert(samples.end(), pendingIdle_.begin(), pendingIdle_.end());
    return buildTrip(samples, nullptr);
}

std::vector<TripEvent> TripSegmenter::restore(const std::optional<NormalizedPosition>& lastPosition,
                                              const std::optional<Trip>& lastTrip,
                                              std::vector<NormalizedPosition> storedSamples) {
    currentState_ = SegmentState::IdleOff;
    tripSamples_.clear();
    pendingIdle_.clear();
    lastTimestamp_.reset();
    ignitionOn_ = false;
    lastSequence_ = lastTrip ? lastTrip->sequenceNumber : 0;
    
    std::sort(storedSamples.begin(), storedSamples.end(),
              [](const NormalizedPosition& a, const NormalizedPosition& b) {
                  return a.timestampUtc < b.timestampUtc;
              });
    
    size_t replayFrom = 0;
    if (lastTrip && lastTrip->isOpen()) {
        storedSamples.erase(std::remove_if(storedSamples.begin(), storedSamples.end(),
                                           [&](const NormalizedPosition& p) {
                                               return p.timestampUtc < lastTrip->startTime;
                                           }),
                            storedSamples.end());
        
        if (storedSamples.empty()) {
            std::cerr << "[Segmenter] Warning: " << deviceId_ << ": no stored samples for open trip #"
                      << lastTrip->sequenceNumber << ", rebuilding from its start" << std::endl;
            NormalizedPosition start;
            start.deviceId = deviceId_;
            start.timestampUtc = lastTrip->startTime;
            start.latitude = lastTrip->startPosition.latitude;
            start.longitude = lastTrip->startPosition.longitude;
            start.ignitionOn = true;
            storedSamples.push_back(start);
        }
        
        // Reopen under the stored sequence number; the rest is replayed below
        const auto& first = storedSamples.front();
        tripSamples_.push_back(first);
        lastTimestamp_ = first.timestampUtc;
        ignitionOn_ = true;
        currentState_ = first.speedKmh > 0.0 ? SegmentState::Active : SegmentState::IdleOn;
        replayFrom = 1;
    } else if (lastTrip && lastTrip->endTime) {
        // Only an ignition-off close leaves the ignition off
        lastTimestamp_ = *lastTrip->endTime;
        ignitionOn_ = lastTrip->closeReason != TripCloseReason::IgnitionOff;
        storedSamples.erase(std::remove_if(storedSamples.begin(), storedSamples.end(),
                                           [&](const NormalizedPosition& p) {
                                               return p.timestampUtc <= *lastTrip->endTime;
                                           }),
                            storedSamples.end());
    }
    
    // Replaying persisted positions regenerates any trip event whose write was lost
    std::vector<TripEvent> events;
    for (size_t i = replayFrom; i < storedSamples.size(); ++i) {
        auto produced = process(storedSamples[i]);
        events.insert(events.end(), produced.begin(), produced.end());
    }
    
    if (lastPosition && (!lastTimestamp_ || *lastTimestamp_ < lastPosition->timestampUtc)) {
        lastTimestamp_ = lastPosition->timestampUtc;
        if (currentState_ == SegmentState::IdleOff) {
            ignitionOn_ = lastPosition->ignitionMethod != IgnitionMethod::Unknown && lastPosition->ignitionOn;
        }
    }
    
    std::cout << "[Segmenter] " << deviceId_ << ": Restored in " << stateToString(currentState_)
              << ", last trip #" << lastSequence_ << ", " << storedSamples.size() - replayFrom
              << " samples replayed, " << events.size() << " events" << std::endl;
    return events;
}

std::vector<SegmentationAnomaly> TripSegmenter::takeAnomalies() {
    std::vector<SegmentationAnomaly> taken;
    taken.swap(anomalies_);
    return taken;
}

void TripSegmenter::transitionTo(SegmentState newState) {
    if (newState == currentState_) return;
    
    std::cout << "[Segmenter] " << deviceId_ << ": State transition: " << stateToString(currentState_)
              << " -> " << stateToString(newState) << std::endl;
    currentState_ = newState;
}

void TripSegmenter::recordAnomaly(SegmentationAnomaly anomaly) {
    std::cerr << "[Segmenter] Warning: " << anomalyKindToString(anomaly.kind) << " on "
              << anomaly.deviceId << ": " << anomaly.detail << std::endl;
    anomalies_.push_back(std::move(anomaly));
}

std::string stateToString(SegmentState state) {
    switch (state) {
        case SegmentState::IdleOff: return "IdleOff";
        case SegmentState::Active: return "Active";
        case SegmentState::IdleOn: return "IdleOn";
    }
    return "Unknown";
}

} // namespace tripseg::domain
