/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the trip segmentation engine
 *
 * Provides a simple TOML parser for engine settings: provider credentials
 * and error codes, rate limiting, retry spacing, ignition resolution,
 * segmentation thresholds, ingestion schedule and storage backend.
 *
 * Supported Sections:
 * - [provider]: Endpoint, credentials, token lifetime and status codes
 * - [rate_limit]: Global call budget and back-off duration
 * - [retry]: Exponential retry spacing for rate-limited and failed calls
 * - [ignition]: Status bits and speed thresholds for ignition inference
 * - [segmentation]: Idle timeout, time-gap closure, idle close anchor
 * - [normalization]: Timestamp plausibility window
 * - [ingestion]: Device list and polling schedule
 * - [storage]: Backend selection and MySQL connection
 *
 * @note Simple line-based parser: key = value, quoted strings, one-line arrays, # comments
 * @note Secrets may be supplied through the environment instead of the file
 */

#pragma once

#include "../../core/domain/DistanceAccumulator.hpp"
#include "../../core/domain/IgnitionResolver.hpp"
#include "../../core/domain/IngestionOrchestrator.hpp"
#include "../../core/domain/TelemetryNormalizer.hpp"
#include "../../core/domain/TripSegmenter.hpp"
#include "../../provider/ProviderClient.hpp"
#include "../../provider/RateLimiter.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tripseg {

struct StorageConfig {
    std::string backend = "memory";
    std::string uri = "tcp://127.0.0.1:3306";
    std::string user = "tripseg";
    std::string password;
    std::string schema = "tripseg";
};

struct RetryConfig {
    std::chrono::milliseconds baseDelay{2000};
    double multiplier = 3.0;
    std::chrono::milliseconds maxDelay{60000};
    int maxRetries = 2;
};

struct EngineConfig {
    provider::ProviderClientConfig provider;
    bool verifyServerCert = true;
    std::chrono::minutes providerUtcOffset{8 * 60};

    provider::RateLimiterConfig rateLimit;
    RetryConfig retry;
    domain::IgnitionResolverConfig ignition;
    domain::NormalizerConfig normalization;
    domain::SegmenterConfig segmentation;
    domain::DistanceConfig distance;
    domain::IngestionConfig ingestion;
    StorageConfig storage;
};

/**
 * @brief TOML configuration file parser and validator
 *
 * Parses TOML configuration files into an EngineConfig. Every key is optional;
 * missing keys keep the engine defaults.
 *
 * @note Thread-safe static methods for configuration loading
 * @note Malformed numeric values raise std::runtime_error naming the key
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Engine configuration; defaults if the file cannot be opened
     * @throws std::runtime_error if a value cannot be parsed
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << ", using defaults" << std::endl;
            return EngineConfig{};
        }

        return parse(file);
    }

    /**
     * @brief Parse TOML configuration from a string
     * @param content TOML document
     * @return Engine configuration
     * @throws std::runtime_error if a value cannot be parsed
     */
    static EngineConfig loadFromString(const std::string& content) {
        std::istringstream stream(content);
        return parse(stream);
    }

    /**
     * @brief Apply environment variable overrides for secrets and endpoint
     * @param config Configuration to update in place
     * @note GPS51_USERNAME, GPS51_PASSWORD, GPS51_BASE_URL, TRIPSEG_DB_PASSWORD
     */
    static void applyEnvironment(EngineConfig& config) {
        if (auto value = getEnv("GPS51_USERNAME"); !value.empty()) config.provider.username = value;
        if (auto value = getEnv("GPS51_PASSWORD"); !value.empty()) config.provider.password = value;
        if (auto value = getEnv("GPS51_BASE_URL"); !value.empty()) config.provider.baseUrl = value;
        if (auto value = getEnv("TRIPSEG_DB_PASSWORD"); !value.empty()) config.storage.password = value;
    }

private:
    static EngineConfig parse(std::istream& input) {
        EngineConfig config;

        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                std::cerr << "[Config] Warning: ignoring line without '=': " << line << std::endl;
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);

            applyKey(config, currentSection, key, value);
        }

        return config;
    }

    static void applyKey(EngineConfig& config, const std::string& section,
                         const std::string& key, const std::string& rawValue) {
        std::string value = rawValue;
        unquote(value);
        const std::string name = section + "." + key;

        if (section == "provider") {
            if (key == "base_url") {
                config.provider.baseUrl = value;
            } else if (key == "username") {
                config.provider.username = value;
            } else if (key == "password") {
                config.provider.password = value;
            } else if (key == "browser") {
                config.provider.browser = value;
            } else if (key == "request_timeout_ms") {
                config.provider.requestTimeout = std::chrono::milliseconds(toInt(name, value));
            } else if (key == "token_validity_hours") {
                config.provider.tokenPolicy.tokenValidity = std::chrono::hours(toInt(name, value));
            } else if (key == "token_refresh_buffer_minutes") {
                config.provider.tokenPolicy.refreshBuffer = std::chrono::minutes(toInt(name, value));
            } else if (key == "utc_offset_minutes") {
                config.providerUtcOffset = std::chrono::minutes(toInt(name, value));
                config.normalization.providerUtcOffset = config.providerUtcOffset;
            } else if (key == "verify_server_cert") {
                config.verifyServerCert = toBool(value);
            } else if (key == "rate_limited_code") {
                config.provider.statusCodes.rateLimited = toInt(name, value);
            } else if (key == "bad_parameters_code") {
                config.provider.statusCodes.badParameters = toInt(name, value);
            } else if (key == "token_expired_codes") {
                config.provider.statusCodes.tokenExpired.clear();
                for (const auto& item : parseArray(rawValue)) {
                    config.provider.statusCodes.tokenExpired.push_back(toInt(name, item));
                }
            } else {
                warnUnknown(name);
            }
        } else if (section == "rate_limit") {
            if (key == "max_calls_per_second") {
                config.rateLimit.maxCallsPerWindow = toInt(name, value);
            } else if (key == "min_spacing_ms") {
                config.rateLimit.minSpacing = std::chrono::milliseconds(toInt(name, value));
            } else if (key == "backoff_seconds") {
                config.rateLimit.backoffDuration = std::chrono::seconds(toInt(name, value));
            } else {
                warnUnknown(name);
            }
        } else if (section == "retry") {
            if (key == "base_delay_ms") {
                config.retry.baseDelay = std::chrono::milliseconds(toInt(name, value));
            } else if (key == "multiplier") {
                config.retry.multiplier = toDouble(name, value);
            } else if (key == "max_delay_ms") {
                config.retry.maxDelay = std::chrono::milliseconds(toInt(name, value));
            } else if (key == "max_retries") {
                config.retry.maxRetries = toInt(name, value);
            } else {
                warnUnknown(name);
            }
        } else if (section == "ignition") {
            if (key == "status_bits") {
                config.ignition.ignitionBits.clear();
                for (const auto& item : parseArray(rawValue)) {
                    config.ignition.ignitionBits.push_back(toInt(name, item));
                }
            } else if (key == "speed_threshold_kmh") {
                config.ignition.speedThresholdKmh = toDouble(name, value);
            } else if (key == "moving_speed_threshold_kmh") {
                config.ignition.movingSpeedThresholdKmh = toDouble(name, value);
            } else {
                warnUnknown(name);
            }
        } else if (section == "segmentation") {
            if (key == "idle_threshold_seconds") {
                config.segmentation.idleThreshold = std::chrono::seconds(toInt(name, value));
            } else if (key == "max_gap_minutes") {
                config.segmentation.maxGap = std::chrono::minutes(toInt(name, value));
            } else if (key == "idle_close_anchor") {
                if (value == "first_stationary") {
                    config.segmentation.idleCloseAnchor = domain::IdleCloseAnchor::FirstStationarySample;
                } else if (value == "last_moving") {
                    config.segmentation.idleCloseAnchor = domain::IdleCloseAnchor::LastMovingSample;
                } else {
                    throw std::runtime_error("[Config] " + name + " must be first_stationary or last_moving");
                }
            } else if (key == "max_jump_meters") {
                config.distance.maxJumpMeters = toDouble(name, value);
            } else {
                warnUnknown(name);
            }
        } else if (section == "normalization") {
            if (key == "future_tolerance_seconds") {
                config.normalization.futureTolerance = std::chrono::seconds(toInt(name, value));
            } else {
                warnUnknown(name);
            }
        } else if (section == "ingestion") {
            if (key == "devices") {
                config.ingestion.deviceIds = parseArray(rawValue);
            } else if (key == "lookback_hours") {
                config.ingestion.lookback = std::chrono::hours(toInt(name, value));
            } else if (key == "fetch_deadline_seconds") {
                config.ingestion.fetchDeadline = std::chrono::seconds(toInt(name, value));
            } else if (key == "poll_interval_seconds") {
                config.ingestion.pollInterval = std::chrono::seconds(toInt(name, value));
            } else {
                warnUnknown(name);
            }
        } else if (section == "storage") {
            if (key == "backend") {
                config.storage.backend = value;
            } else if (key == "uri") {
                config.storage.uri = value;
            } else if (key == "user") {
                config.storage.user = value;
            } else if (key == "password") {
                config.storage.password = value;
            } else if (key == "schema") {
                config.storage.schema = value;
            } else {
                warnUnknown(name);
            }
        } else {
            warnUnknown(name);
        }
    }

    /**
     * @brief Split a one-line array such as ["a", "b"] or [1, 2]
     * @param value Raw value including brackets
     * @return Unquoted, trimmed items
     */
    static std::vector<std::string> parseArray(const std::string& value) {
        std::vector<std::string> items;
        std::string body = value;
        trim(body);
        if (body.size() < 2 || body.front() != '[' || body.back() != ']') {
            throw std::runtime_error("[Config] Expected array, got: " + value);
        }
        body = body.substr(1, body.size() - 2);

        std::istringstream ss(body);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            unquote(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    static int toInt(const std::string& name, const std::string& value) {
        try {
            size_t consumed = 0;
            int result = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::logic_error&) {
            throw std::runtime_error("[Config] Invalid integer for " + name + ": " + value);
        }
    }

    static double toDouble(const std::string& name, const std::string& value) {
        try {
            size_t consumed = 0;
            double result = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return result;
        } catch (const std::logic_error&) {
            throw std::runtime_error("[Config] Invalid number for " + name + ": " + value);
        }
    }

    static bool toBool(const std::string& value) {
        return value == "true" || value == "1";
    }

    static void warnUnknown(const std::string& name) {
        std::cerr << "[Config] Warning: unknown key " << name << std::endl;
    }

    static std::string getEnv(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
    }

    /**
     * @brief Remove a # comment that is not inside a quoted string
     * @param line Line to strip (modified in place)
     */
    static void stripComment(std::string& line) {
        bool inQuotes = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                inQuotes = !inQuotes;
            } else if (line[i] == '#' && !inQuotes) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace tripseg
