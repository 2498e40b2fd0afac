#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

// Elliott Wave Oscillator: EMA(short) - EMA(long) of close, both EMAs taken
// on the same bar. Element j <-> bar j + longPeriod - 1.
struct EwoResult {
    std::vector<double> ewo;
    std::vector<TrendSignal> signal;   // BUY/SELL on zero crossing only

    double last() const { return lastOr(ewo, 0.0); }
    double prev() const { return prevOr(ewo, last()); }
    bool rising() const { return ewo.size() >= 2 && last() > prev(); }
    bool falling() const { return ewo.size() >= 2 && last() < prev(); }
};

EwoResult computeEwo(const CandleSeries& bars, int shortPeriod = 5, int longPeriod = 35);

} // namespace Scalp
