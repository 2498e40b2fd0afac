#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"

namespace Scalp {

struct DivergenceResult {
    bool bullish = false;   // lower price low, higher RSI low
    bool bearish = false;   // higher price high, lower RSI high
};

// Compares the first and second halves of the last `lookback` closes and
// RSI values. No divergence when either series is shorter than lookback.
DivergenceResult detectRsiDivergence(const CandleSeries& bars, const std::vector<double>& rsi,
                                     int lookback = 10);

} // namespace Scalp
