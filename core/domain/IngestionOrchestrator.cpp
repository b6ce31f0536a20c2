#include "IngestionOrchestrator.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace tripseg::domain {

IngestionOrchestrator::IngestionOrchestrator(std::shared_ptr<ports::ITelemetrySource> source,
                                             std::shared_ptr<ports::ITelemetryStore> store,
                                             std::shared_ptr<IClock> clock,
                                             std::shared_ptr<const TelemetryNormalizer> normalizer,
                                             IngestionConfig config,
                                             SegmenterConfig segmenterConfig,
                                             std::shared_ptr<const DistanceAccumulator> distance)
    : source_(source), store_(store), clock_(clock), normalizer_(normalizer),
      config_(std::move(config)), segmenterConfig_(segmenterConfig), distance_(distance) {
    if (!distance_) {
        distance_ = std::make_shared<DistanceAccumulator>();
    }
}

std::vector<DeviceCycleResult> IngestionOrchestrator::runCycle() {
    std::vector<DeviceCycleResult> results(config_.deviceIds.size());
    std::vector<std::thread> workers;
    workers.reserve(config_.deviceIds.size());
    
    for (size_t i = 0; i < config_.deviceIds.size(); ++i) {
        workers.emplace_back([this, i, &results]() {
            results[i] = ingestDevice(config_.deviceIds[i]);
        });
    }
    
    for (auto& worker : workers) {
        worker.join();
    }
    
    size_t failed = std::count_if(results.begin(), results.end(),
                                  [](const DeviceCycleResult& r) { return !r.success; });
    std::cout << "[Orchestrator] Cycle finished: " << results.size() - failed << " ok, "
              << failed << " failed" << std::endl;
    return results;
}

DeviceCycleResult IngestionOrchestrator::ingestDevice(const std::string& deviceId) {
    DeviceCycleResult result;
    result.deviceId = deviceId;
    
    SyncStatus status;
    status.deviceId = deviceId;
    
    try {
        if (auto stored = store_->loadSyncStatus(deviceId)) {
            status = *stored;
        }
        
        auto& context = contextFor(deviceId);
        std::lock_guard<std::mutex> lock(context.mutex);
        
        Timestamp now = clock_->now();
        Timestamp from = now - config_.lookback;
        if (auto latest = store_->latestPosition(deviceId)) {
            from = std::max(from, latest->timestampUtc + std::chrono::seconds(1));
        }
        
        auto records = source_->fetchTrack(deviceId, from, now, now + config_.fetchDeadline);
        result = processOrDiscard(context, records);
        
        status.lastSuccessAt = now;
        status.errorCount = 0;
        status.lastError.clear();
        if (auto latest = store_->latestPosition(deviceId)) {
            status.lastPositionAt = latest->timestampUtc;
        }
        store_->saveSyncStatus(status);
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Device " << deviceId << " failed: " << e.what() << std::endl;
        result.success = false;
        result.error = e.what();
        
        status.errorCount += 1;
        status.lastError = e.what();
        try {
            store_->saveSyncStatus(status);
        } catch (const std::exception& storeError) {
            std::cerr << "[Orchestrator] Could not record sync status for " << deviceId
                      << ": " << storeError.what() << std::endl;
        }
    }
    
    return result;
}

DeviceCycleResult IngestionOrchestrator::ingestRecords(const std::string& deviceId,
                                                       const std::vector<RawTelemetryRecord>& records) {
    auto& context = contextFor(deviceId);
    std::lock_guard<std::mutex> lock(context.mutex);
    return processOrDiscard(context, records);
}

void IngestionOrchestrator::run(const std::atomic<bool>& running) {
    while (running) {
        runCycle();
        
        auto waited = std::chrono::seconds(0);
        while (running && waited < config_.pollInterval) {
            clock_->sleepFor(std::chrono::seconds(1));
            waited += std::chrono::seconds(1);
        }
    }
}

IngestionOrchestrator::DeviceContext& IngestionOrchestrator::contextFor(const std::string& deviceId) {
    DeviceContext* context = nullptr;
    bool created = false;
    {
        std::lock_guard<std::mutex> lock(contextsMutex_);
        auto& slot = contexts_[deviceId];
        if (!slot) {
            slot = std::make_unique<DeviceContext>();
            created = true;
        }
        context = slot.get();
    }
    
    // Restore outside the map lock so one slow store read does not stall other devices
    std::lock_guard<std::mutex> lock(context->mutex);
    if (created || !context->segmenter) {
        auto segmenter = std::make_unique<TripSegmenter>(deviceId, segmenterConfig_, distance_);
        restoreSegmenter(*segmenter);
        context->segmenter = std::move(segmenter);
    }
    return *context;
}

void IngestionOrchestrator::restoreSegmenter(TripSegmenter& segmenter) {
    const auto& deviceId = segmenter.deviceId();
    auto lastPosition = store_->latestPosition(deviceId);
    auto lastTrip = store_->latestTrip(deviceId);
    
    // Everything stored since the last trip boundary is replayed
    std::vector<NormalizedPosition> storedSamples;
    if (lastPosition) {
        Timestamp from = fromEpochMillis(0);
        if (lastTrip) {
            from = lastTrip->isOpen() ? lastTrip->startTime : *lastTrip->endTime;
        }
        storedSamples = store_->positionsInRange(deviceId, from, lastPosition->timestampUtc);
    }
    
    auto events = segmenter.restore(lastPosition, lastTrip, std::move(storedSamples));
    for (const auto& event : events) {
        store_->upsertTrip(event.trip);
    }
    segmenter.takeAnomalies();
}

DeviceCycleResult IngestionOrchestrator::processOrDiscard(DeviceContext& context,
                                                          const std::vector<RawTelemetryRecord>& records) {
    try {
        return processBatch(*context.segmenter, records);
    } catch (const std::exception&) {
        // The segmenter may be past a trip event the store never received; rebuild it from the store next time
        std::cerr << "[Orchestrator] Discarding segmenter state for " << context.segmenter->deviceId()
                  << " after failed batch" << std::endl;
        context.segmenter.reset();
        throw;
    }
}

DeviceCycleResult IngestionOrchestrator::processBatch(TripSegmenter& segmenter,
                                                      const std::vector<RawTelemetryRecord>& records) {
    DeviceCycleResult result;
    result.deviceId = segmenter.deviceId();
    result.fetched = records.size();
    
    std::vector<NormalizedPosition> positions;
    positions.reserve(records.size());
    
    for (const auto& record : records) {
        RawTelemetryRecord scoped = record;
        if (scoped.deviceId.empty()) {
            scoped.deviceId = segmenter.deviceId();
        } else if (scoped.deviceId != segmenter.deviceId()) {
            std::cerr << "[Orchestrator] Warning: record for " << scoped.deviceId
                      << " in batch of " << segmenter.deviceId() << " skipped" << std::endl;
            ++result.dropped;
            continue;
        }
        
        if (auto position = normalizer_->normalize(scoped)) {
            positions.push_back(std::move(*position));
        } else {
            ++result.dropped;
        }
    }
    
    std::stable_sort(positions.begin(), positions.end(),
                     [](const NormalizedPosition& a, const NormalizedPosition& b) {
                         return a.timestampUtc < b.timestampUtc;
                     });
    
    for (const auto& position : positions) {
        if (!store_->insertPosition(position)) {
            ++result.duplicates;
            continue;
        }
        ++result.inserted;
        
        for (const auto& event : segmenter.process(position)) {
            store_->upsertTrip(event.trip);
            if (event.type == TripEventType::Opened) {
                ++result.tripsOpened;
            } else {
                ++result.tripsClosed;
            }
        }
    }
    
    result.anomalies = segmenter.takeAnomalies().size();
    
    result.success = true;
    std::cout << "[Orchestrator] " << result.deviceId << ": " << result.fetched << " fetched, "
              << result.inserted << " new, " << result.duplicates << " duplicate, "
              << result.dropped << " dropped, " << result.tripsOpened << " trips opened, "
              << result.tripsClosed << " closed" << std::endl;
    return result;
}

} // namespace tripseg::domain
