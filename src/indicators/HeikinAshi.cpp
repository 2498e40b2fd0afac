#include "scalp/indicators/HeikinAshi.hpp"

#include <algorithm>

namespace Scalp {

HeikinAshiResult computeHeikinAshi(const CandleSeries& bars) {
    HeikinAshiResult r;
    if (bars.size() < 2) return r;

    r.candles.reserve(bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        const Candle& c = bars[i];
        Candle ha;
        ha.ts_ms = c.ts_ms;
        ha.volume = c.volume;
        ha.close = (c.open + c.high + c.low + c.close) / 4.0;
        ha.open = (i == 0) ? (c.open + c.close) * 0.5
                           : (r.candles[i - 1].open + r.candles[i - 1].close) * 0.5;
        ha.high = std::max({c.high, ha.open, ha.close});
        ha.low = std::min({c.low, ha.open, ha.close});
        r.candles.push_back(ha);
    }

    const Candle& last = r.candles[r.candles.size() - 1];
    const Candle& prev = r.candles[r.candles.size() - 2];
    if (last.green() && prev.green())    r.signal = CandleBias::UP;
    else if (last.red() && prev.red())   r.signal = CandleBias::DOWN;
    return r;
}

} // namespace Scalp
