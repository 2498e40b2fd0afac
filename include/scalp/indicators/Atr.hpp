#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"

namespace Scalp {

// EMA (SMA-seeded) of true range. Element j <-> bar j + period.
// Empty when size <= period.
std::vector<double> computeAtr(const CandleSeries& bars, int period = 14);

struct AtrSlope {
    double current = 0.0;
    double slope = 0.0;           // newest - oldest over the lookback
    double expansionRate = 0.0;   // percent
    bool   isExpanding = false;
};

AtrSlope computeAtrSlope(const CandleSeries& bars, int period = 14, int slopeLookback = 5);

} // namespace Scalp
