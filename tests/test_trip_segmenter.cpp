#include <gtest/gtest.h>
#include "../core/domain/TripSegmenter.hpp"
#include <memory>
#include <optional>
#include <vector>

using namespace tripseg;
using namespace tripseg::domain;
using namespace std::chrono_literals;

class TripSegmenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        segmenter_ = std::make_unique<TripSegmenter>("dev-1");
    }

    // Samples move north about 111 m per second of offset so geodesic length is predictable
    NormalizedPosition sample(int offsetSeconds, double speedKmh, bool ignition,
                              IgnitionMethod method = IgnitionMethod::StatusBit,
                              std::optional<double> odometer = std::nullopt) {
        NormalizedPosition position;
        position.deviceId = "dev-1";
        position.timestampUtc = base_ + std::chrono::seconds(offsetSeconds);
        position.latitude = -26.2 + offsetSeconds * 0.00001;
        position.longitude = 28.04;
        position.speedKmh = speedKmh;
        position.ignitionOn = ignition;
        position.ignitionMethod = method;
        position.ignitionConfidence = method == IgnitionMethod::Unknown ? 0.0 : 1.0;
        position.odometerTotal = odometer;
        return position;
    }

    std::vector<TripEvent> feed(const std::vector<NormalizedPosition>& samples) {
        std::vector<TripEvent> all;
        for (const auto& s : samples) {
            auto events = segmenter_->process(s);
            all.insert(all.end(), events.begin(), events.end());
        }
        return all;
    }

    static std::vector<Trip> closedTrips(const std::vector<TripEvent>& events) {
        std::vector<Trip> trips;
        for (const auto& event : events) {
            if (event.type == TripEventType::Closed) {
                trips.push_back(event.trip);
            }
        }
        return trips;
    }

    Timestamp at(int offsetSeconds) const { return base_ + std::chrono::seconds(offsetSeconds); }

    Timestamp base_{std::chrono::seconds(1709251200)};
    std::unique_ptr<TripSegmenter> segmenter_;
};

TEST_F(TripSegmenterTest, IgnitionCycleProducesOneTrip) {
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOff);

    auto opened = segmenter_->process(sample(0, 30.0, true));
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].type, TripEventType::Opened);
    EXPECT_TRUE(opened[0].trip.isOpen());
    EXPECT_EQ(opened[0].trip.sequenceNumber, 1);
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::Active);

    EXPECT_TRUE(segmenter_->process(sample(60, 50.0, true)).empty());

    auto closed = segmenter_->process(sample(120, 10.0, false));
    ASSERT_EQ(closed.size(), 1u);
    const Trip& trip = closed[0].trip;
    EXPECT_EQ(closed[0].type, TripEventType::Closed);
    EXPECT_EQ(trip.sequenceNumber, 1);
    EXPECT_EQ(trip.startTime, at(0));
    ASSERT_TRUE(trip.endTime.has_value());
    EXPECT_EQ(*trip.endTime, at(120));
    EXPECT_EQ(trip.closeReason, TripCloseReason::IgnitionOff);
    EXPECT_EQ(trip.sampleCount, 3);
    EXPECT_DOUBLE_EQ(trip.maxSpeedKmh, 50.0);
    EXPECT_DOUBLE_EQ(trip.avgSpeedKmh, 30.0);
    EXPECT_GT(trip.distanceMeters, 0.0);
    EXPECT_TRUE(trip.isApproximate());
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOff);
}

TEST_F(TripSegmenterTest, IgnitionOnWhileStationaryOpensIdleTrip) {
    auto events = feed({sample(0, 0.0, false), sample(10, 0.0, true)});

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, TripEventType::Opened);
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOn);

    auto closed = closedTrips(feed({sample(40, 0.0, false)}));
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_GE(*closed[0].endTime, closed[0].startTime);
    EXPECT_GE(closed[0].distanceMeters, 0.0);
}

TEST_F(TripSegmenterTest, IdleSplitDefaultEndsAtFirstStationarySample) {
    auto events = feed({
        sample(0, 30.0, true),
        sample(60, 30.0, true),
        sample(120, 0.0, true),
        sample(180, 0.0, true),
        sample(310, 0.0, true),
        sample(320, 40.0, true),
    });

    auto trips = closedTrips(events);
    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].closeReason, TripCloseReason::IdleTimeout);
    EXPECT_EQ(*trips[0].endTime, at(120));
    EXPECT_EQ(trips[0].sampleCount, 3);

    auto open = segmenter_->currentTrip();
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->sequenceNumber, 2);
    EXPECT_EQ(open->startTime, at(320));
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::Active);
}

TEST_F(TripSegmenterTest, IdleSplitLastMovingAnchorEndsAtLastMovingSample) {
    SegmenterConfig config;
    config.idleCloseAnchor = IdleCloseAnchor::LastMovingSample;
    segmenter_ = std::make_unique<TripSegmenter>("dev-1", config);

    auto events = feed({
        sample(0, 30.0, true),
        sample(60, 30.0, true),
        sample(120, 0.0, true),
        sample(180, 0.0, true),
        sample(310, 0.0, true),
        sample(320, 40.0, true),
    });

    auto trips = closedTrips(events);
    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(*trips[0].endTime, at(60));
    EXPECT_EQ(trips[0].sampleCount, 2);
    EXPECT_EQ(segmenter_->lastSequenceNumber(), 2);
}

TEST_F(TripSegmenterTest, ShortStopStaysInSameTrip) {
    auto events = feed({
        sample(0, 30.0, true),
        sample(60, 0.0, true),
        sample(120, 0.0, true),
        sample(200, 25.0, true),
        sample(260, 20.0, false),
    });

    auto trips = closedTrips(events);
    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].closeReason, TripCloseReason::IgnitionOff);
    EXPECT_EQ(trips[0].sampleCount, 5);
    EXPECT_EQ(trips[0].startTime, at(0));
    EXPECT_EQ(*trips[0].endTime, at(260));
}

TEST_F(TripSegmenterTest, IgnitionOffDuringIdleKeepsIdleSamples) {
    auto trips = closedTrips(feed({
        sample(0, 30.0, true),
        sample(60, 0.0, true),
        sample(90, 0.0, true),
        sample(100, 0.0, false),
    }));

    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].closeReason, TripCloseReason::IgnitionOff);
    EXPECT_EQ(*trips[0].endTime, at(100));
    EXPECT_EQ(trips[0].sampleCount, 4);
}

TEST_F(TripSegmenterTest, StationaryIgnitionOnAfterIdleSplitDoesNotReopen) {
    auto events = feed({
        sample(0, 30.0, true),
        sample(10, 0.0, true),
        sample(200, 0.0, true),
        sample(400, 0.0, true),
    });

    EXPECT_EQ(closedTrips(events).size(), 1u);
    EXPECT_FALSE(segmenter_->currentTrip().has_value());
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOff);
}

TEST_F(TripSegmenterTest, UnknownIgnitionCarriesPreviousState) {
    feed({sample(0, 30.0, true)});

    auto events = segmenter_->process(sample(60, 20.0, false, IgnitionMethod::Unknown));
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(segmenter_->isIgnitionOn());
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::Active);
}

TEST_F(TripSegmenterTest, OutOfOrderAndDuplicateSamplesAreIgnored) {
    feed({sample(0, 30.0, true), sample(60, 30.0, true)});

    EXPECT_TRUE(segmenter_->process(sample(60, 0.0, false)).empty());
    EXPECT_TRUE(segmenter_->process(sample(30, 0.0, false)).empty());
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::Active);

    auto anomalies = segmenter_->takeAnomalies();
    ASSERT_EQ(anomalies.size(), 2u);
    EXPECT_EQ(anomalies[0].kind, AnomalyKind::DuplicateSample);
    EXPECT_EQ(anomalies[1].kind, AnomalyKind::OutOfOrderSample);
    EXPECT_TRUE(segmenter_->takeAnomalies().empty());
}

TEST_F(TripSegmenterTest, LongGapClosesActiveTripAtLastSample) {
    auto events = feed({
        sample(0, 30.0, true),
        sample(60, 30.0, true),
        sample(60 + 31 * 60, 30.0, true),
    });

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].type, TripEventType::Closed);
    EXPECT_EQ(events[1].trip.closeReason, TripCloseReason::TimeGap);
    EXPECT_EQ(*events[1].trip.endTime, at(60));
    EXPECT_EQ(events[2].type, TripEventType::Opened);
    EXPECT_EQ(events[2].trip.sequenceNumber, 2);
    EXPECT_EQ(events[2].trip.startTime, at(60 + 31 * 60));
}

TEST_F(TripSegmenterTest, GapClosureCanBeDisabled) {
    SegmenterConfig config;
    config.maxGap = 0s;
    segmenter_ = std::make_unique<TripSegmenter>("dev-1", config);

    auto events = feed({sample(0, 30.0, true), sample(3 * 3600, 30.0, true)});
    EXPECT_TRUE(closedTrips(events).empty());
}

TEST_F(TripSegmenterTest, AtMostOneOpenTrip) {
    int open = 0;
    std::vector<NormalizedPosition> samples = {
        sample(0, 30.0, true), sample(60, 0.0, true), sample(300, 0.0, true),
        sample(310, 20.0, true), sample(400, 0.0, false), sample(500, 10.0, true),
        sample(560, 10.0, false),
    };
    for (const auto& s : samples) {
        for (const auto& event : segmenter_->process(s)) {
            open += event.type == TripEventType::Opened ? 1 : -1;
            EXPECT_GE(open, 0);
            EXPECT_LE(open, 1);
            if (event.type == TripEventType::Closed) {
                EXPECT_GE(*event.trip.endTime, event.trip.startTime);
                EXPECT_GE(event.trip.distanceMeters, 0.0);
            }
        }
    }
    EXPECT_EQ(open, 0);
    EXPECT_EQ(segmenter_->lastSequenceNumber(), 3);
}

TEST_F(TripSegmenterTest, OdometerDistanceIsUsedWhenAvailable) {
    auto trips = closedTrips(feed({
        sample(0, 30.0, true, IgnitionMethod::StatusBit, 10000.0),
        sample(60, 30.0, true, IgnitionMethod::StatusBit, 10450.0),
        sample(120, 30.0, false, IgnitionMethod::StatusBit, 10900.0),
    }));

    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].distanceMethod, DistanceMethod::Odometer);
    EXPECT_DOUBLE_EQ(trips[0].distanceMeters, 900.0);
    EXPECT_FALSE(trips[0].isApproximate());
}

TEST_F(TripSegmenterTest, RestoreResumesIdlingOpenTrip) {
    Trip open;
    open.deviceId = "dev-1";
    open.sequenceNumber = 7;
    open.startTime = at(0);

    std::vector<NormalizedPosition> stored = {
        sample(60, 0.0, true), sample(0, 30.0, true), sample(30, 0.0, true),
    };
    segmenter_->restore(stored[0], open, stored);

    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOn);
    EXPECT_EQ(segmenter_->lastSequenceNumber(), 7);
    EXPECT_TRUE(segmenter_->isIgnitionOn());

    auto events = segmenter_->process(sample(30 + 180, 0.0, true));
    auto trips = closedTrips(events);
    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].sequenceNumber, 7);
    EXPECT_EQ(*trips[0].endTime, at(30));
    EXPECT_EQ(trips[0].closeReason, TripCloseReason::IdleTimeout);
}

TEST_F(TripSegmenterTest, RestoreAfterClosedTripContinuesNumbering) {
    Trip closed;
    closed.deviceId = "dev-1";
    closed.sequenceNumber = 4;
    closed.startTime = at(0);
    closed.endTime = at(100);

    segmenter_->restore(sample(100, 0.0, false), closed, {});
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOff);

    EXPECT_TRUE(segmenter_->process(sample(50, 30.0, true)).empty());

    auto events = segmenter_->process(sample(200, 30.0, true));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].trip.sequenceNumber, 5);
}

TEST_F(TripSegmenterTest, RestoreWithoutStoredSamplesRebuildsFromTripStart) {
    Trip open;
    open.deviceId = "dev-1";
    open.sequenceNumber = 2;
    open.startTime = at(0);
    open.startPosition = GeoPoint{-26.2, 28.04};

    segmenter_->restore(std::nullopt, open, {});

    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOn);
    auto current = segmenter_->currentTrip();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->startTime, at(0));
    EXPECT_EQ(current->sequenceNumber, 2);
}

TEST_F(TripSegmenterTest, RestoreReplaysCloseMissingFromStore) {
    Trip open;
    open.deviceId = "dev-1";
    open.sequenceNumber = 3;
    open.startTime = at(0);

    std::vector<NormalizedPosition> stored = {
        sample(0, 30.0, true), sample(60, 30.0, true), sample(120, 0.0, false),
    };
    auto events = segmenter_->restore(stored.back(), open, stored);

    auto trips = closedTrips(events);
    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].sequenceNumber, 3);
    EXPECT_EQ(*trips[0].endTime, at(120));
    EXPECT_EQ(trips[0].closeReason, TripCloseReason::IgnitionOff);
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::IdleOff);
    EXPECT_FALSE(segmenter_->isIgnitionOn());

    auto next = segmenter_->process(sample(200, 30.0, true));
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].type, TripEventType::Opened);
    EXPECT_EQ(next[0].trip.sequenceNumber, 4);
}

TEST_F(TripSegmenterTest, RestoreReplaysOpenMissingFromStore) {
    Trip closed;
    closed.deviceId = "dev-1";
    closed.sequenceNumber = 1;
    closed.startTime = at(0);
    closed.endTime = at(60);
    closed.closeReason = TripCloseReason::IgnitionOff;

    std::vector<NormalizedPosition> stored = {
        sample(60, 0.0, false), sample(120, 20.0, true),
    };
    auto events = segmenter_->restore(stored.back(), closed, stored);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, TripEventType::Opened);
    EXPECT_EQ(events[0].trip.sequenceNumber, 2);
    EXPECT_EQ(events[0].trip.startTime, at(120));
    EXPECT_EQ(segmenter_->getCurrentState(), SegmentState::Active);
}
