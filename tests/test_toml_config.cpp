#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include <cstdlib>

using namespace tripseg;
using namespace std::chrono_literals;

TEST(TomlConfigTest, DefaultsWhenFileIsMissing) {
    auto config = TomlConfig::loadFromFile("/nonexistent/tripseg.toml");

    EXPECT_EQ(config.provider.baseUrl, "https://api.gps51.com/openapi");
    EXPECT_EQ(config.rateLimit.maxCallsPerWindow, 3);
    EXPECT_EQ(config.segmentation.idleThreshold, 180s);
    EXPECT_EQ(config.segmentation.maxGap, 30min);
    EXPECT_EQ(config.segmentation.idleCloseAnchor, domain::IdleCloseAnchor::FirstStationarySample);
    EXPECT_EQ(config.ingestion.lookback, 24h);
    EXPECT_EQ(config.storage.backend, "memory");
    EXPECT_EQ(config.retry.maxRetries, 2);
}

TEST(TomlConfigTest, ParsesAllSections) {
    auto config = TomlConfig::loadFromString(R"(
# engine settings
[provider]
base_url = "https://example.test/openapi"
username = "fleet"        # trailing comment
password = "p#ss"
utc_offset_minutes = 120
token_expired_codes = [9903, 9906, 9907]
verify_server_cert = false

[rate_limit]
max_calls_per_second = 5
min_spacing_ms = 200
backoff_seconds = 90

[retry]
base_delay_ms = 1000
multiplier = 2.5
max_retries = 4

[ignition]
status_bits = [0, 10]

[segmentation]
idle_threshold_seconds = 300
max_gap_minutes = 0
idle_close_anchor = "last_moving"
max_jump_meters = 5000

[normalization]
future_tolerance_seconds = 60

[ingestion]
devices = ["868120300000001", "868120300000002"]
lookback_hours = 6
poll_interval_seconds = 120

[storage]
backend = "mysql"
uri = "tcp://db:3306"
schema = "fleet"
)");

    EXPECT_EQ(config.provider.baseUrl, "https://example.test/openapi");
    EXPECT_EQ(config.provider.username, "fleet");
    EXPECT_EQ(config.provider.password, "p#ss");
    EXPECT_EQ(config.providerUtcOffset, 120min);
    EXPECT_EQ(config.normalization.providerUtcOffset, 120min);
    EXPECT_EQ(config.provider.statusCodes.tokenExpired, (std::vector<int>{9903, 9906, 9907}));
    EXPECT_FALSE(config.verifyServerCert);

    EXPECT_EQ(config.rateLimit.maxCallsPerWindow, 5);
    EXPECT_EQ(config.rateLimit.minSpacing, 200ms);
    EXPECT_EQ(config.rateLimit.backoffDuration, 90s);

    EXPECT_EQ(config.retry.baseDelay, 1000ms);
    EXPECT_DOUBLE_EQ(config.retry.multiplier, 2.5);
    EXPECT_EQ(config.retry.maxRetries, 4);

    EXPECT_EQ(config.ignition.ignitionBits, (std::vector<int>{0, 10}));

    EXPECT_EQ(config.segmentation.idleThreshold, 300s);
    EXPECT_EQ(config.segmentation.maxGap, 0s);
    EXPECT_EQ(config.segmentation.idleCloseAnchor, domain::IdleCloseAnchor::LastMovingSample);
    EXPECT_DOUBLE_EQ(config.distance.maxJumpMeters, 5000.0);

    EXPECT_EQ(config.normalization.futureTolerance, 60s);

    ASSERT_EQ(config.ingestion.deviceIds.size(), 2u);
    EXPECT_EQ(config.ingestion.deviceIds[1], "868120300000002");
    EXPECT_EQ(config.ingestion.lookback, 6h);
    EXPECT_EQ(config.ingestion.pollInterval, 120s);

    EXPECT_EQ(config.storage.backend, "mysql");
    EXPECT_EQ(config.storage.uri, "tcp://db:3306");
    EXPECT_EQ(config.storage.schema, "fleet");
}

TEST(TomlConfigTest, InvalidNumberNamesTheKey) {
    try {
        TomlConfig::loadFromString("[segmentation]\nidle_threshold_seconds = soon\n");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("segmentation.idle_threshold_seconds"), std::string::npos);
    }

    EXPECT_THROW(TomlConfig::loadFromString("[segmentation]\nidle_close_anchor = \"middle\"\n"),
                 std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[ingestion]\ndevices = \"dev-1\"\n"), std::runtime_error);
}

TEST(TomlConfigTest, UnknownKeysAreIgnored) {
    auto config = TomlConfig::loadFromString("[provider]\ncolour = \"blue\"\n[extras]\nanything = 1\n");
    EXPECT_EQ(config.provider.username, "");
}

TEST(TomlConfigTest, EnvironmentOverridesSecrets) {
    setenv("GPS51_USERNAME", "env-user", 1);
    setenv("GPS51_PASSWORD", "env-pass", 1);
    setenv("TRIPSEG_DB_PASSWORD", "db-secret", 1);

    auto config = TomlConfig::loadFromString("[provider]\nusername = \"file-user\"\n");
    TomlConfig::applyEnvironment(config);

    EXPECT_EQ(config.provider.username, "env-user");
    EXPECT_EQ(config.provider.password, "env-pass");
    EXPECT_EQ(config.storage.password, "db-secret");

    unsetenv("GPS51_USERNAME");
    unsetenv("GPS51_PASSWORD");
    unsetenv("TRIPSEG_DB_PASSWORD");
}
