#pragma once

#include "../Telemetry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tripseg::domain {

struct IgnitionResolution {
    bool ignitionOn = false;
    double confidence = 0.0;
    IgnitionMethod method = IgnitionMethod::Unknown;
};

// Evidence an evaluator may look at. Speed is already in km/h.
struct IgnitionSignals {
    std::optional<int64_t> statusBitmask;
    std::optional<std::string> statusText;
    double speedKmh = 0.0;
    std::optional<int> moving;
};

struct IgnitionResolverConfig {
    std::vector<int> ignitionBits{0, 1, 2, 3};
    double speedThresholdKmh = 5.0;
    double movingSpeedThresholdKmh = 3.0;
    
    double statusBitConfidence = 1.0;
    double stringParseConfidence = 0.9;
    double multiSignalConfidence = 0.7;
    double singleSignalConfidence = 0.3;
};

/// nullopt means the evaluator has no opinion and the next one in the chain is asked.
using IgnitionEvaluation = std::optional<IgnitionResolution>;

class IgnitionEvaluator {
public:
    virtual ~IgnitionEvaluator() = default;
    virtual IgnitionEvaluation evaluate(const IgnitionSignals& signals) const = 0;
    virtual std::string name() const = 0;
};

class StatusBitEvaluator : public IgnitionEvaluator {
public:
    explicit StatusBitEvaluator(const IgnitionResolverConfig& config);
    IgnitionEvaluation evaluate(const IgnitionSignals& signals) const override;
    std::string name() const override { return "status_bit"; }

private:
    uint32_t ignitionMask_ = 0;
    double confidence_;
};

class StatusTextEvaluator : public IgnitionEvaluator {
public:
    explicit StatusTextEvaluator(const IgnitionResolverConfig& config);
    IgnitionEvaluation evaluate(const IgnitionSignals& signals) const override;
    std::string name() const override { return "string_parse"; }

private:
    double confidence_;
};

class MotionSignalEvaluator : public IgnitionEvaluator {
public:
    explicit MotionSignalEvaluator(const IgnitionResolverConfig& config);
    IgnitionEvaluation evaluate(const IgnitionSignals& signals) const override;
    std::string name() const override { return "motion"; }

private:
    IgnitionResolverConfig config_;
};

/**
 * @brief Reconciles status bitmask, status text and motion into one ignition value
 *
 * Evaluators are consulted in order and the first that resolves wins. When none
 * resolves the result is ignition off with confidence 0 and method unknown.
 * Pure: no I/O and no state between calls.
 */
class IgnitionResolver {
public:
    explicit IgnitionResolver(const IgnitionResolverConfig& config = {});
    explicit IgnitionResolver(std::vector<std::unique_ptr<IgnitionEvaluator>> chain);

    IgnitionResolution resolve(const RawTelemetryRecord& record) const;
    IgnitionResolution resolve(const IgnitionSignals& signals) const;

    static IgnitionSignals signalsFrom(const RawTelemetryRecord& record);

private:
    std::vector<std::unique_ptr<IgnitionEvaluator>> chain_;
};

} // namespace tripseg::domain
