#include "scalp/indicators/Divergence.hpp"

#include <algorithm>

namespace Scalp {

DivergenceResult detectRsiDivergence(const CandleSeries& bars, const std::vector<double>& rsi,
                                     int lookback) {
    DivergenceResult r;
    if (lookback < 2) return r;
    const size_t lb = static_cast<size_t>(lookback);
    if (bars.size() < lb || rsi.size() < lb) return r;

    const size_t half = lb / 2;
    const size_t pStart = bars.size() - lb;
    const size_t rStart = rsi.size() - lb;

    double pLow1 = bars[pStart].close, pHigh1 = pLow1;
    double rLow1 = rsi[rStart], rHigh1 = rLow1;
    for (size_t i = 0; i < half; ++i) {
        pLow1 = std::min(pLow1, bars[pStart + i].close);
        pHigh1 = std::max(pHigh1, bars[pStart + i].close);
        rLow1 = std::min(rLow1, rsi[rStart + i]);
        rHigh1 = std::max(rHigh1, rsi[rStart + i]);
    }

    double pLow2 = bars[pStart + half].close, pHigh2 = pLow2;
    double rLow2 = rsi[rStart + half], rHigh2 = rLow2;
    for (size_t i = half; i < lb; ++i) {
        pLow2 = std::min(pLow2, bars[pStart + i].close);
        pHigh2 = std::max(pHigh2, bars[pStart + i].close);
        rLow2 = std::min(rLow2, rsi[rStart + i]);
        rHigh2 = std::max(rHigh2, rsi[rStart + i]);
    }

    r.bullish = pLow2 < pLow1 && rLow2 > rLow1;
    r.bearish = pHigh2 > pHigh1 && rHigh2 < rHigh1;
    return r;
}

} // namespace Scalp
