#include <gtest/gtest.h>
#include "../core/domain/IgnitionResolver.hpp"
#include <memory>
#include <vector>

using namespace tripseg;

class IgnitionResolverTest : public ::testing::Test {
protected:
    RawTelemetryRecord record(std::optional<int64_t> status, std::optional<std::string> text,
                              double speed = 0.0, std::optional<int> moving = std::nullopt) {
        RawTelemetryRecord raw;
        raw.deviceId = "dev-1";
        raw.statusBitmask = status;
        raw.statusText = text;
        raw.speed = speed;
        raw.moving = moving;
        return raw;
    }

    domain::IgnitionResolver resolver_;
};

TEST_F(IgnitionResolverTest, StatusBitWinsOverText) {
    auto result = resolver_.resolve(record(0x1, std::string("ACC OFF")));

    EXPECT_TRUE(result.ignitionOn);
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_EQ(result.method, IgnitionMethod::StatusBit);
}

TEST_F(IgnitionResolverTest, ClearAccBitsFallThroughToText) {
    auto result = resolver_.resolve(record(0, std::string("ACC ON"), 40.0));

    EXPECT_TRUE(result.ignitionOn);
    EXPECT_DOUBLE_EQ(result.confidence, 0.9);
    EXPECT_EQ(result.method, IgnitionMethod::StringParse);
}

TEST_F(IgnitionResolverTest, ClearAccBitsFallThroughToSpeed) {
    auto moving = resolver_.resolve(record(0x100, std::nullopt, 60.0));
    EXPECT_TRUE(moving.ignitionOn);
    EXPECT_EQ(moving.method, IgnitionMethod::SpeedInference);

    auto parked = resolver_.resolve(record(0, std::nullopt, 0.0));
    EXPECT_FALSE(parked.ignitionOn);
    EXPECT_EQ(parked.method, IgnitionMethod::Unknown);
}

TEST_F(IgnitionResolverTest, NegativeBitmaskIsNeverStatusBit) {
    auto result = resolver_.resolve(record(-1, std::nullopt));
    EXPECT_NE(result.method, IgnitionMethod::StatusBit);
    EXPECT_EQ(result.method, IgnitionMethod::Unknown);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_FALSE(result.ignitionOn);

    auto withText = resolver_.resolve(record(-1, std::string("ACC ON")));
    EXPECT_EQ(withText.method, IgnitionMethod::StringParse);
    EXPECT_TRUE(withText.ignitionOn);
}

TEST_F(IgnitionResolverTest, OutOfRangeBitmaskUsesLowWord) {
    int64_t wide = (int64_t(1) << 40) | 0x2;
    auto result = resolver_.resolve(record(wide, std::nullopt));

    EXPECT_TRUE(result.ignitionOn);
    EXPECT_EQ(result.method, IgnitionMethod::StatusBit);
}

TEST_F(IgnitionResolverTest, StatusTextVariants) {
    EXPECT_TRUE(resolver_.resolve(record(std::nullopt, std::string("ACC ON"))).ignitionOn);
    EXPECT_TRUE(resolver_.resolve(record(std::nullopt, std::string("acc:on, GPS fixed"))).ignitionOn);
    EXPECT_FALSE(resolver_.resolve(record(std::nullopt, std::string("Parked, ACC OFF"))).ignitionOn);
    EXPECT_TRUE(resolver_.resolve(record(std::nullopt, std::string("ACC\xE5\xBC\x80"))).ignitionOn);

    auto localisedOff = resolver_.resolve(record(std::nullopt, std::string("ACC\xE5\x85\xB3")));
    EXPECT_FALSE(localisedOff.ignitionOn);
    EXPECT_EQ(localisedOff.method, IgnitionMethod::StringParse);
    EXPECT_DOUBLE_EQ(localisedOff.confidence, 0.9);
}

TEST_F(IgnitionResolverTest, OffWinsWhenTextCarriesBoth) {
    auto result = resolver_.resolve(record(std::nullopt, std::string("ACC ON ... ACC OFF")));

    EXPECT_FALSE(result.ignitionOn);
    EXPECT_EQ(result.method, IgnitionMethod::StringParse);
}

TEST_F(IgnitionResolverTest, TextWithoutMarkerFallsThrough) {
    auto result = resolver_.resolve(record(std::nullopt, std::string("ACCELERATING")));
    EXPECT_EQ(result.method, IgnitionMethod::Unknown);
}

TEST_F(IgnitionResolverTest, SpeedAndMovingGiveMultiSignal) {
    auto result = resolver_.resolve(record(std::nullopt, std::nullopt, 40.0, 1));

    EXPECT_TRUE(result.ignitionOn);
    EXPECT_DOUBLE_EQ(result.confidence, 0.7);
    EXPECT_EQ(result.method, IgnitionMethod::MultiSignal);
}

TEST_F(IgnitionResolverTest, SingleMotionSignalIsSpeedInference) {
    auto speedOnly = resolver_.resolve(record(std::nullopt, std::nullopt, 40.0));
    EXPECT_TRUE(speedOnly.ignitionOn);
    EXPECT_DOUBLE_EQ(speedOnly.confidence, 0.3);
    EXPECT_EQ(speedOnly.method, IgnitionMethod::SpeedInference);

    // 4 km/h is above the moving threshold (3) but below the speed threshold (5)
    auto movingOnly = resolver_.resolve(record(std::nullopt, std::nullopt, 4.0, 1));
    EXPECT_TRUE(movingOnly.ignitionOn);
    EXPECT_EQ(movingOnly.method, IgnitionMethod::SpeedInference);
}

TEST_F(IgnitionResolverTest, NoEvidenceIsUnknown) {
    auto result = resolver_.resolve(record(std::nullopt, std::nullopt, 0.0, 0));

    EXPECT_FALSE(result.ignitionOn);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.method, IgnitionMethod::Unknown);
}

TEST_F(IgnitionResolverTest, ConfiguredBitsAreRespected) {
    domain::IgnitionResolverConfig config;
    config.ignitionBits = {10};
    domain::IgnitionResolver resolver(config);

    auto unconfigured = resolver.resolve(record(0x1, std::nullopt));
    EXPECT_FALSE(unconfigured.ignitionOn);
    EXPECT_EQ(unconfigured.method, IgnitionMethod::Unknown);

    auto configured = resolver.resolve(record(1 << 10, std::nullopt));
    EXPECT_TRUE(configured.ignitionOn);
    EXPECT_EQ(configured.method, IgnitionMethod::StatusBit);
}

TEST_F(IgnitionResolverTest, CustomChainOrder) {
    domain::IgnitionResolverConfig config;
    std::vector<std::unique_ptr<domain::IgnitionEvaluator>> chain;
    chain.push_back(std::make_unique<domain::StatusTextEvaluator>(config));
    chain.push_back(std::make_unique<domain::StatusBitEvaluator>(config));
    domain::IgnitionResolver resolver(std::move(chain));

    auto result = resolver.resolve(record(0x1, std::string("ACC OFF")));
    EXPECT_FALSE(result.ignitionOn);
    EXPECT_EQ(result.method, IgnitionMethod::StringParse);
}
