#include "scalp/indicators/Atr.hpp"

#include "scalp/indicators/MovingAverage.hpp"

namespace Scalp {

std::vector<double> computeAtr(const CandleSeries& bars, int period) {
    return ema(trueRanges(bars), period);
}

AtrSlope computeAtrSlope(const CandleSeries& bars, int period, int slopeLookback) {
    AtrSlope s;
    const std::vector<double> atr = computeAtr(bars, period);
    s.current = lastOr(atr, 0.0);
    if (slopeLookback < 2 || atr.size() < static_cast<size_t>(slopeLookback) + 1) return s;

    const double oldest = atr[atr.size() - static_cast<size_t>(slopeLookback)];
    const double newest = atr.back();
    s.slope = newest - oldest;
    s.expansionRate = safeDiv(s.slope, oldest, 0.0) * 100.0;
    s.isExpanding = s.slope > 0.0;
    return s;
}

} // namespace Scalp
