#include "scalp/indicators/Ewo.hpp"

#include "scalp/indicators/MovingAverage.hpp"

namespace Scalp {

EwoResult computeEwo(const CandleSeries& bars, int shortPeriod, int longPeriod) {
    EwoResult r;
    if (shortPeriod <= 0 || shortPeriod >= longPeriod) return r;

    const std::vector<double> c = closes(bars);
    const std::vector<double> fast = ema(c, shortPeriod);
    const std::vector<double> slow = ema(c, longPeriod);
    if (slow.empty()) return r;

    const size_t offset = static_cast<size_t>(longPeriod - shortPeriod);
    r.ewo.reserve(slow.size());
    r.signal.reserve(slow.size());
    for (size_t j = 0; j < slow.size(); ++j) {
        const double v = fast[j + offset] - slow[j];
        TrendSignal s = TrendSignal::HOLD;
        if (j > 0) {
            const double p = r.ewo.back();
            if (v > 0 && p <= 0)      s = TrendSignal::BUY;
            else if (v < 0 && p >= 0) s = TrendSignal::SELL;
        }
        r.ewo.push_back(v);
        r.signal.push_back(s);
    }
    return r;
}

} // namespace Scalp
