#include "scalp/indicators/Ichimoku.hpp"

#include <algorithm>

namespace Scalp {

namespace {

// Midpoint of highest high / lowest low for every full window
std::vector<double> midpoints(const CandleSeries& bars, int period) {
    std::vector<double> out;
    if (period <= 0 || bars.size() < static_cast<size_t>(period)) return out;
    const size_t p = static_cast<size_t>(period);
    out.reserve(bars.size() - p + 1);
    for (size_t i = p - 1; i < bars.size(); ++i) {
        double hi = bars[i + 1 - p].high;
        double lo = bars[i + 1 - p].low;
        for (size_t j = i + 2 - p; j <= i; ++j) {
            hi = std::max(hi, bars[j].high);
            lo = std::min(lo, bars[j].low);
        }
        out.push_back((hi + lo) * 0.5);
    }
    return out;
}

} // namespace

IchimokuResult computeIchimoku(const CandleSeries& bars, int tenkanPeriod,
                               int kijunPeriod, int senkouBPeriod) {
    IchimokuResult r;
    r.tenkan = midpoints(bars, tenkanPeriod);
    r.kijun = midpoints(bars, kijunPeriod);
    r.spanB = midpoints(bars, senkouBPeriod);

    // Pair tenkan and kijun on the same bar
    const size_t pairs = std::min(r.tenkan.size(), r.kijun.size());
    r.spanA.reserve(pairs);
    for (size_t i = 0; i < pairs; ++i) {
        const double t = r.tenkan[r.tenkan.size() - pairs + i];
        const double k = r.kijun[r.kijun.size() - pairs + i];
        r.spanA.push_back((t + k) * 0.5);
    }

    if (kijunPeriod > 0) {
        for (size_t i = static_cast<size_t>(kijunPeriod); i < bars.size(); ++i) {
            r.chikou.push_back(bars[i - static_cast<size_t>(kijunPeriod)].close);
        }
    }

    r.tenkanNow = lastOr(r.tenkan, 0.0);
    r.kijunNow = lastOr(r.kijun, 0.0);
    r.spanANow = lastOr(r.spanA, 0.0);
    r.spanBNow = lastOr(r.spanB, 0.0);

    r.valid = !r.spanA.empty() && !r.spanB.empty() && !bars.empty();
    if (!r.valid) return r;

    r.cloudTop = std::max(r.spanANow, r.spanBNow);
    r.cloudBottom = std::min(r.spanANow, r.spanBNow);

    const double price = bars.back().close;
    r.aboveCloud = price > r.cloudTop;
    r.belowCloud = price < r.cloudBottom;
    r.insideCloud = !r.aboveCloud && !r.belowCloud;

    if (r.aboveCloud && r.tenkanNow > r.kijunNow)      r.signal = TrendDirection::BULLISH;
    else if (r.belowCloud && r.tenkanNow < r.kijunNow) r.signal = TrendDirection::BEARISH;
    return r;
}

} // namespace Scalp
