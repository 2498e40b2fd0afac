#pragma once
// =============================================================================
// SuperTrend.hpp - ATR-banded trailing stop
// =============================================================================
// Output is aligned bar-for-bar with the input. Bars before the first ATR
// value carry trend 0, HOLD and zero bands.
//
// Band ratchet:
//   upper = basicUpper if basicUpper < prevUpper or prevClose > prevUpper
//   lower = basicLower if basicLower > prevLower or prevClose < prevLower
// =============================================================================

#include <vector>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct SuperTrendResult {
    std::vector<int> trend;              // +1 up, -1 down, 0 warm-up
    std::vector<TrendSignal> signal;     // BUY/SELL only on the flip bar
    std::vector<double> upperBand;
    std::vector<double> lowerBand;

    int lastTrend() const { return trend.empty() ? 0 : trend.back(); }
    int trendAt(size_t fromEnd) const {
        return fromEnd < trend.size() ? trend[trend.size() - 1 - fromEnd] : 0;
    }
    TrendSignal lastSignal() const { return signal.empty() ? TrendSignal::HOLD : signal.back(); }
};

SuperTrendResult computeSuperTrend(const CandleSeries& bars, int period = 7, double multiplier = 2.5);

} // namespace Scalp
