#include "scalp/signal/ConfidenceScorer.hpp"

#include <algorithm>
#include <cstdlib>

using namespace Scalp;

ConfidenceScorer::ConfidenceScorer(int strongBias, double rvolThreshold, double adxTrend, int pushThreshold)
    : strongBias_(strongBias),
      rvolThreshold_(rvolThreshold),
      adxTrend_(adxTrend),
      pushThreshold_(pushThreshold) {}

int ConfidenceScorer::score(const ConfidenceInputs& in) const {
    int s = 0;
    if (std::abs(in.biasScore) >= strongBias_)          s += W_BIAS;
    if (in.validator != ValidatorState::NEUTRAL)        s += W_VALIDATOR;
    if (in.checks.vwapHysteresis)                       s += W_VWAP;
    if (in.rvol >= rvolThreshold_)                      s += W_RVOL;
    if (in.adxRising || in.adx >= adxTrend_)            s += W_ADX;
    if (in.checks.rsi)                                  s += W_RSI;
    if (in.checks.ewo)                                  s += W_EWO;
    if (in.checks.pivot)                                s += W_PIVOT;
    if (in.checks.bollinger)                            s += W_BOLLINGER;
    return std::min(s, 100);
}
