#include "scalp/indicators/Macd.hpp"

#include "scalp/indicators/MovingAverage.hpp"

namespace Scalp {

MacdResult computeMacd(const CandleSeries& bars, int fast, int slow, int signalPeriod) {
    MacdResult r;
    if (fast <= 0 || fast >= slow || signalPeriod <= 0) return r;

    const std::vector<double> c = closes(bars);
    const std::vector<double> fastEma = ema(c, fast);
    const std::vector<double> slowEma = ema(c, slow);
    if (slowEma.empty()) return r;

    const size_t offset = static_cast<size_t>(slow - fast);
    r.macd.reserve(slowEma.size());
    for (size_t j = 0; j < slowEma.size(); ++j) {
        r.macd.push_back(fastEma[j + offset] - slowEma[j]);
    }

    r.signal = ema(r.macd, signalPeriod);
    const size_t sigOffset = static_cast<size_t>(signalPeriod - 1);
    r.histogram.reserve(r.signal.size());
    r.crossover.reserve(r.signal.size());
    for (size_t j = 0; j < r.signal.size(); ++j) {
        const size_t m = j + sigOffset;
        r.histogram.push_back(r.macd[m] - r.signal[j]);

        TrendSignal x = TrendSignal::HOLD;
        if (j > 0) {
            const double pm = r.macd[m - 1], ps = r.signal[j - 1];
            const double cm = r.macd[m],     cs = r.signal[j];
            if (pm <= ps && cm > cs)      x = TrendSignal::BUY;
            else if (pm >= ps && cm < cs) x = TrendSignal::SELL;
        }
        r.crossover.push_back(x);
    }
    return r;
}

} // namespace Scalp
