#include "scalp/core/BarAggregator.hpp"

#include <algorithm>

namespace Scalp {

CandleSeries aggregateBars(const CandleSeries& bars1m, Timeframe tf) {
    const int64_t step = timeframe_ms(tf);
    CandleSeries out;
    if (bars1m.empty()) return out;
    out.reserve(bars1m.size() / static_cast<size_t>(tf) + 1);

    for (const Candle& b : bars1m) {
        int64_t bucket = b.ts_ms / step;
        if (b.ts_ms < 0 && b.ts_ms % step != 0) --bucket;
        const int64_t open = bucket * step;

        if (out.empty() || out.back().ts_ms != open) {
            Candle merged = b;
            merged.ts_ms = open;
            out.push_back(merged);
            continue;
        }

        Candle& m = out.back();
        m.high = std::max(m.high, b.high);
        m.low = std::min(m.low, b.low);
        m.close = b.close;
        m.volume += b.volume;
    }
    return out;
}

} // namespace Scalp
