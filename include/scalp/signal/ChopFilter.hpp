#pragma once

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

// Cross-timeframe noise veto. Checks in order and reports the first hit:
//   inside 5m cloud, ADX weak+falling on 5m, then 2m, VWAP whipsaw on 1m,
//   tight 1m Bollinger with price pinned to VWAP.
class ChopFilter {
public:
    explicit ChopFilter(const ChopConfig& cfg);

    ChopResult evaluate(const CandleSeries& bars5m, const CandleSeries& bars2m,
                        const CandleSeries& bars1m, const DirectorResult& director) const;

    // Sign changes of (close > vwap) across the last `lookback` closes
    static int countVwapCrosses(const CandleSeries& bars, double vwap, int lookback);

private:
    bool adxWeakAndFalling(const CandleSeries& bars) const;

    ChopConfig cfg_;
};

} // namespace Scalp
