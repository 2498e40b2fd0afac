#include "scalp/indicators/SuperTrend.hpp"

#include "scalp/indicators/Atr.hpp"

namespace Scalp {

SuperTrendResult computeSuperTrend(const CandleSeries& bars, int period, double multiplier) {
    SuperTrendResult r;
    const size_t n = bars.size();
    r.trend.assign(n, 0);
    r.signal.assign(n, TrendSignal::HOLD);
    r.upperBand.assign(n, 0.0);
    r.lowerBand.assign(n, 0.0);

    const std::vector<double> atr = computeAtr(bars, period);
    if (atr.empty()) return r;

    const size_t first = static_cast<size_t>(period);   // atr[0] <-> bar period
    int prevTrend = 1;
    double prevUpper = 0.0;
    double prevLower = 0.0;

    for (size_t i = first; i < n; ++i) {
        const double a = atr[i - first];
        const double basicUpper = bars[i].hl2() + multiplier * a;
        const double basicLower = bars[i].hl2() - multiplier * a;
        const double prevClose = bars[i - 1].close;

        const double upper = (basicUpper < prevUpper || prevClose > prevUpper) ? basicUpper : prevUpper;
        const double lower = (basicLower > prevLower || prevClose < prevLower) ? basicLower : prevLower;
        r.upperBand[i] = upper;
        r.lowerBand[i] = lower;

        const double close = bars[i].close;
        int t = prevTrend;
        if (close > upper)      t = 1;
        else if (close < lower) t = -1;

        r.trend[i] = t;
        if (i > first && t != prevTrend) {
            r.signal[i] = (t == 1) ? TrendSignal::BUY : TrendSignal::SELL;
        }

        prevTrend = t;
        prevUpper = upper;
        prevLower = lower;
    }
    return r;
}

} // namespace Scalp
