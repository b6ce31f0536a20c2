#include "IgnitionResolver.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace tripseg::domain {

namespace {

// Localised firmware reports "ACC开" (on) and "ACC关" (off)
const std::string kAccOnLocalised = "ACC\xE5\xBC\x80";
const std::string kAccOffLocalised = "ACC\xE5\x85\xB3";

std::string upperAscii(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::toupper(c)) : static_cast<char>(c);
    });
    return result;
}

} // namespace

StatusBitEvaluator::StatusBitEvaluator(const IgnitionResolverConfig& config)
    : confidence_(config.statusBitConfidence) {
    for (int bit : config.ignitionBits) {
        if (bit >= 0 && bit < 32) {
            ignitionMask_ |= (1u << bit);
        }
    }
}

IgnitionEvaluation StatusBitEvaluator::evaluate(const IgnitionSignals& signals) const {
    // Negative values are the "no status" sentinel, not a bit pattern
    if (!signals.statusBitmask || *signals.statusBitmask < 0) {
        return std::nullopt;
    }
    
    auto bits = static_cast<uint32_t>(static_cast<uint64_t>(*signals.statusBitmask) & 0xFFFFFFFFULL);
    // No ACC bit set says nothing about ignition; later steps decide
    if ((bits & ignitionMask_) == 0) {
        return std::nullopt;
    }
    return IgnitionResolution{true, confidence_, IgnitionMethod::StatusBit};
}

StatusTextEvaluator::StatusTextEvaluator(const IgnitionResolverConfig& config)
    : confidence_(config.stringParseConfidence) {
}

IgnitionEvaluation StatusTextEvaluator::evaluate(const IgnitionSignals& signals) const {
    if (!signals.statusText || signals.statusText->empty()) {
        return std::nullopt;
    }
    
    static const std::regex accPattern(R"(ACC[\s:_=]*(ON|OFF)\b)");
    
    const std::string text = upperAscii(*signals.statusText);
    
    bool sawOn = text.find(kAccOnLocalised) != std::string::npos;
    bool sawOff = text.find(kAccOffLocalised) != std::string::npos;
    
    for (std::sregex_iterator it(text.begin(), text.end(), accPattern), end; it != end; ++it) {
        if ((*it)[1].str() == "OFF") {
            sawOff = true;
        } else {
            sawOn = true;
        }
    }
    
    // Off wins when a report carries both markers
    if (sawOff) {
        return IgnitionResolution{false, confidence_, IgnitionMethod::StringParse};
    }
    if (sawOn) {
        return IgnitionResolution{true, confidence_, IgnitionMethod::StringParse};
    }
    return std::nullopt;
}

MotionSignalEvaluator::MotionSignalEvaluator(const IgnitionResolverConfig& config)
    : config_(config) {
}

IgnitionEvaluation MotionSignalEvaluator::evaluate(const IgnitionSignals& signals) const {
    bool fastEnough = signals.speedKmh > config_.speedThresholdKmh;
    bool flaggedMoving = signals.moving && *signals.moving == 1 &&
                         signals.speedKmh > config_.movingSpeedThresholdKmh;
    
    if (fastEnough && flaggedMoving) {
        return IgnitionResolution{true, config_.multiSignalConfidence, IgnitionMethod::MultiSignal};
    }
    if (fastEnough || flaggedMoving) {
        return IgnitionResolution{true, config_.singleSignalConfidence, IgnitionMethod::SpeedInference};
    }
    return std::nullopt;
}

IgnitionResolver::IgnitionResolver(const IgnitionResolverConfig& config) {
    chain_.push_back(std::make_unique<StatusBitEvaluator>(config));
    chain_.push_back(std::make_unique<StatusTextEvaluator>(config));
    chain_.push_back(std::make_unique<MotionSignalEvaluator>(config));
}

IgnitionResolver::IgnitionResolver(std::vector<std::unique_ptr<IgnitionEvaluator>> chain)
    : chain_(std::move(chain)) {
}

IgnitionResolution IgnitionResolver::resolve(const RawTelemetryRecord& record) const {
    return resolve(signalsFrom(record));
}

IgnitionResolution IgnitionResolver::resolve(const IgnitionSignals& signals) const {
    for (const auto& evaluator : chain_) {
        if (auto result = evaluator->evaluate(signals)) {
            return *result;
        }
    }
    return IgnitionResolution{false, 0.0, IgnitionMethod::Unknown};
}

IgnitionSignals IgnitionResolver::signalsFrom(const RawTelemetryRecord& record) {
    IgnitionSignals signals;
    signals.statusBitmask = record.statusBitmask;
    signals.statusText = record.statusText;
    signals.speedKmh = normalizeSpeedKmh(record.speed);
    signals.moving = record.moving;
    return signals;
}

} // namespace tripseg::domain
