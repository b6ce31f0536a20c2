#pragma once

#include "TelemetryNormalizer.hpp"
#include "TripSegmenter.hpp"
#include "../ports/ITelemetrySource.hpp"
#include "../ports/ITelemetryStore.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tripseg::domain {

struct IngestionConfig {
    std::vector<std::string> deviceIds;
    // How far back the first fetch of a device reaches
    std::chrono::seconds lookback{24 * 3600};
    // Long enough for two rate-limit back-offs inside one fetch
    std::chrono::seconds fetchDeadline{150};
    std::chrono::seconds pollInterval{60};
};

struct DeviceCycleResult {
    std::string deviceId;
    bool success = false;
    size_t fetched = 0;
    size_t inserted = 0;
    size_t duplicates = 0;
    size_t dropped = 0;
    size_t tripsOpened = 0;
    size_t tripsClosed = 0;
    size_t anomalies = 0;
    std::string error;
};

/**
 * @brief Drives fetch, normalization, segmentation and persistence per device
 *
 * Each cycle runs one worker thread per device. A device's segmenter is
 * created lazily and restored from the store on first use; after that it is
 * only touched by that device's worker. A failed batch discards the
 * segmenter so the next cycle rebuilds it from the store. A failure in one
 * device is recorded in its sync status and does not affect the others.
 */
class IngestionOrchestrator {
public:
    IngestionOrchestrator(std::shared_ptr<ports::ITelemetrySource> source,
                          std::shared_ptr<ports::ITelemetryStore> store,
                          std::shared_ptr<IClock> clock,
                          std::shared_ptr<const TelemetryNormalizer> normalizer,
                          IngestionConfig config,
                          SegmenterConfig segmenterConfig = {},
                          std::shared_ptr<const DistanceAccumulator> distance = nullptr);

    std::vector<DeviceCycleResult> runCycle();
    
    // Fetch and process one device. Never throws.
    DeviceCycleResult ingestDevice(const std::string& deviceId);
    
    // Process an already fetched batch. Store failures propagate.
    DeviceCycleResult ingestRecords(const std::string& deviceId, const std::vector<RawTelemetryRecord>& records);
    
    // Repeats runCycle every pollInterval until running becomes false.
    void run(const std::atomic<bool>& running);

private:
    struct DeviceContext {
        std::mutex mutex;
        std::unique_ptr<TripSegmenter> segmenter;
    };

    DeviceContext& contextFor(const std::string& deviceId);
    void restoreSegmenter(TripSegmenter& segmenter);
    DeviceCycleResult processOrDiscard(DeviceContext& context, const std::vector<RawTelemetryRecord>& records);
    DeviceCycleResult processBatch(TripSegmenter& segmenter, const std::vector<RawTelemetryRecord>& records);

    std::shared_ptr<ports::ITelemetrySource> source_;
    std::shared_ptr<ports::ITelemetryStore> store_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<const TelemetryNormalizer> normalizer_;
    IngestionConfig config_;
    SegmenterConfig segmenterConfig_;
    std::shared_ptr<const DistanceAccumulator> distance_;
    
    std::mutex contextsMutex_;
    std::map<std::string, std::unique_ptr<DeviceContext>> contexts_;
};

} // namespace tripseg::domain
