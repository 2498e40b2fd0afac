#pragma once

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct HeikinAshiResult {
    CandleSeries candles;                    // aligned bar-for-bar, empty below 2 bars
    CandleBias signal = CandleBias::NEUTRAL; // last two HA candles agree
};

HeikinAshiResult computeHeikinAshi(const CandleSeries& bars);

} // namespace Scalp
