#pragma once

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

struct ConfidenceInputs {
    int biasScore = 0;
    ValidatorState validator = ValidatorState::NEUTRAL;
    TriggerChecks checks;
    double rvol = 1.0;
    double adx = 0.0;
    bool adxRising = false;
};

// Additive 0-100 score:
//   +20 |bias| strong   +15 validator aligned   +15 VWAP hysteresis
//   +10 RVOL            +10 ADX rising or trending
//   +10 RSI             +5 EWO   +5 pivot   +5 Bollinger
class ConfidenceScorer {
public:
    static constexpr int W_BIAS      = 20;
    static constexpr int W_VALIDATOR = 15;
    static constexpr int W_VWAP      = 15;
    static constexpr int W_RVOL      = 10;
    static constexpr int W_ADX       = 10;
    static constexpr int W_RSI       = 10;
    static constexpr int W_EWO       = 5;
    static constexpr int W_PIVOT     = 5;
    static constexpr int W_BOLLINGER = 5;

    ConfidenceScorer(int strongBias, double rvolThreshold, double adxTrend, int pushThreshold);

    int score(const ConfidenceInputs& in) const;
    bool shouldPush(int confidence) const { return confidence >= pushThreshold_; }

private:
    int strongBias_;
    double rvolThreshold_;
    double adxTrend_;
    int pushThreshold_;
};

} // namespace Scalp
