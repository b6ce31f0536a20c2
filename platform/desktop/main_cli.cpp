/**
 * @file main_cli.cpp
 * @brief Command-line interface for the trip segmentation engine
 *
 * Runs the ingestion loop against the GPS51 provider, or a single cycle with
 * --once, and answers read-only queries (trips, open trip, latest position,
 * sync status) as JSON on stdout.
 *
 * @note Includes signal handling so the polling loop stops between cycles
 * @note Supports configuration via TOML files and environment variables
 */

#include "TomlConfig.hpp"
#include "../../core/IClock.hpp"
#include "../../core/JsonCodec.hpp"
#include "../../core/adapters/DefaultPolicies.hpp"
#include "../../core/adapters/HttplibTransport.hpp"
#include "../../core/adapters/InMemoryTelemetryStore.hpp"
#include "../../provider/ProviderTelemetrySource.hpp"
#include "../../storage/MySQLTelemetryStore.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace tripseg;

/// Global flag for graceful shutdown coordination
static std::atomic<bool> g_running{true};

/**
 * @brief Signal handler for graceful shutdown
 *
 * Handles SIGINT (Ctrl+C) and SIGTERM. The orchestrator finishes the cycle in
 * progress and returns.
 *
 * @param signal Signal number received
 */
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]        Configuration file (default: tripseg.toml)\n"
              << "  --device [id]          Device to ingest (repeatable, overrides [ingestion].devices)\n"
              << "  --once                 Run a single ingestion cycle and exit\n"
              << "  --interval [seconds]   Polling interval for the ingestion loop\n"
              << "  --trips [id] [hours]   Print trips of a device overlapping the last hours (default: 24)\n"
              << "  --open-trip [id]       Print the open trip of a device\n"
              << "  --latest [id]          Print the latest normalized position of a device\n"
              << "  --status [id]          Print the sync status of a device\n"
              << "  --help                 Show this help message\n"
              << "\nEnvironment overrides:\n"
              << "  GPS51_USERNAME, GPS51_PASSWORD, GPS51_BASE_URL, TRIPSEG_DB_PASSWORD\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [provider]\n"
              << "  username = \"fleet-user\"\n"
              << "  [ingestion]\n"
              << "  devices = [\"868120300000001\"]\n"
              << "  [storage]\n"
              << "  backend = \"mysql\"\n"
              << std::endl;
}

struct Stores {
    std::shared_ptr<ports::ITelemetryStore> telemetry;
    std::shared_ptr<ports::IProviderStateStore> providerState;
};

/**
 * @brief Open the configured storage backend
 * @param config Storage section of the engine configuration
 * @return Telemetry and provider-state ports backed by the same store
 * @throws std::runtime_error if the MySQL connection fails
 */
Stores openStores(const StorageConfig& config) {
    if (config.backend == "mysql") {
        auto store = std::make_shared<storage::MySQLTelemetryStore>(
            config.uri, config.user, config.password, config.schema);
        return Stores{store, store};
    }
    if (config.backend != "memory") {
        throw std::runtime_error("Unknown storage backend: " + config.backend);
    }
    std::cout << "[Main] Using in-memory store, data is lost on exit" << std::endl;
    auto store = std::make_shared<adapters::InMemoryTelemetryStore>();
    return Stores{store, store};
}

/**
 * @brief Answer a read-only query against the store
 * @return Exit code
 */
int runQuery(const std::string& query, const std::string& deviceId, int hours,
             ports::ITelemetryStore& store, IClock& clock) {
    nlohmann::json output;

    if (query == "--trips") {
        Timestamp to = clock.now();
        Timestamp from = to - std::chrono::hours(hours);
        output = nlohmann::json::array();
        for (const auto& trip : store.tripsInRange(deviceId, from, to)) {
            output.push_back(JsonCodec::tripToJson(trip));
        }
    } else if (query == "--open-trip") {
        auto trip = store.openTrip(deviceId);
        output = trip ? JsonCodec::tripToJson(*trip) : nlohmann::json(nullptr);
    } else if (query == "--latest") {
        auto position = store.latestPosition(deviceId);
        output = position ? JsonCodec::positionToJson(*position) : nlohmann::json(nullptr);
    } else if (query == "--status") {
        auto status = store.loadSyncStatus(deviceId);
        output = status ? JsonCodec::syncStatusToJson(*status) : nlohmann::json(nullptr);
    }

    std::cout << output.dump(2) << std::endl;
    return 0;
}

void printCycle(const std::vector<domain::DeviceCycleResult>& results) {
    for (const auto& result : results) {
        if (result.success) {
            std::cout << "[Main] " << result.deviceId << ": fetched " << result.fetched
                      << ", inserted " << result.inserted
                      << ", duplicates " << result.duplicates
                      << ", dropped " << result.dropped
                      << ", trips opened " << result.tripsOpened
                      << ", closed " << result.tripsClosed << std::endl;
        } else {
            std::cerr << "[Main] " << result.deviceId << " failed: " << result.error << std::endl;
        }
    }
}

/**
 * @brief Main application entry point
 *
 * @param argc Command line argument count
 * @param argv Command line argument values
 * @return Exit code (0 for success, 1 for error)
 */
int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configFile = "tripseg.toml";
    std::vector<std::string> devices;
    bool once = false;
    int intervalSeconds = 0;
    std::string query;
    std::string queryDevice;
    int queryHours = 24;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if (arg == "--device" && i + 1 < argc) {
                devices.push_back(argv[++i]);
            } else if (arg == "--once") {
                once = true;
            } else if (arg == "--interval" && i + 1 < argc) {
                intervalSeconds = std::stoi(argv[++i]);
            } else if ((arg == "--trips" || arg == "--open-trip" || arg == "--latest" || arg == "--status")
                       && i + 1 < argc) {
                query = arg;
                queryDevice = argv[++i];
                if (arg == "--trips" && i + 1 < argc && argv[i + 1][0] != '-') {
                    queryHours = std::stoi(argv[++i]);
                }
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    try {
        EngineConfig config = TomlConfig::loadFromFile(configFile);
        TomlConfig::applyEnvironment(config);
        if (!devices.empty()) {
            config.ingestion.deviceIds = devices;
        }
        if (intervalSeconds > 0) {
            config.ingestion.pollInterval = std::chrono::seconds(intervalSeconds);
        }

        auto clock = std::make_shared<SystemClock>();
        Stores stores = openStores(config.storage);

        if (!query.empty()) {
            return runQuery(query, queryDevice, queryHours, *stores.telemetry, *clock);
        }

        if (config.ingestion.deviceIds.empty()) {
            std::cerr << "Error: no devices configured, use --device or [ingestion].devices" << std::endl;
            return 1;
        }
        if (config.provider.username.empty() || config.provider.password.empty()) {
            std::cerr << "Error: provider credentials missing, set GPS51_USERNAME and GPS51_PASSWORD" << std::endl;
            return 1;
        }

        std::cout << "Starting trip segmentation engine" << std::endl;
        std::cout << "Provider: " << config.provider.baseUrl << std::endl;
        std::cout << "Devices: " << config.ingestion.deviceIds.size() << std::endl;
        std::cout << "Poll interval: " << config.ingestion.pollInterval.count() << "s" << std::endl;

        // Platform dependencies are injected into the core
        auto transport = std::make_shared<adapters::HttplibTransport>(config.verifyServerCert);
        auto rateLimiter = std::make_shared<provider::RateLimiter>(clock, config.rateLimit, stores.providerState);
        auto policies = std::make_shared<adapters::DefaultPolicyEngine>(adapters::ExponentialBackoffRetryPolicy(
            config.retry.baseDelay, config.retry.multiplier, config.retry.maxDelay, config.retry.maxRetries + 1));
        auto client = std::make_shared<provider::ProviderClient>(
            transport, clock, rateLimiter, policies, config.provider, stores.providerState);
        auto source = std::make_shared<provider::ProviderTelemetrySource>(client, config.providerUtcOffset);

        auto resolver = std::make_shared<const domain::IgnitionResolver>(config.ignition);
        auto normalizer = std::make_shared<const domain::TelemetryNormalizer>(clock, resolver, config.normalization);
        auto distance = std::make_shared<const domain::DistanceAccumulator>(config.distance);

        domain::IngestionOrchestrator orchestrator(source, stores.telemetry, clock, normalizer,
                                                   config.ingestion, config.segmentation, distance);

        if (once) {
            auto results = orchestrator.runCycle();
            printCycle(results);
            for (const auto& result : results) {
                if (!result.success) {
                    return 1;
                }
            }
            return 0;
        }

        std::cout << "Running ingestion loop. Press Ctrl+C to stop." << std::endl;
        orchestrator.run(g_running);
        std::cout << "Engine stopped." << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
