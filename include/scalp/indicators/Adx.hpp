#pragma once
// =============================================================================
// Adx.hpp - Average Directional Index with +DI / -DI
// =============================================================================
// TR, +DM and -DM are smoothed with a rolling mean (not Wilder's recursion),
// DX is formed per bar and ADX is the rolling mean of DX.
// =============================================================================

#include <string>
#include <vector>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct AdxResult {
    std::vector<double> adx;       // element j <-> bar j + 2*period - 1
    std::vector<double> plusDI;    // element j <-> bar j + period
    std::vector<double> minusDI;

    double lastAdx = 0.0;
    double prevAdx = 0.0;
    double lastPlusDI = 0.0;
    double lastMinusDI = 0.0;
    TrendDirection direction = TrendDirection::NEUTRAL;
    TrendStrength strength = TrendStrength::NO_TREND;
    std::string description = "Insufficient data";

    bool valid() const { return !adx.empty(); }
    bool rising() const { return adx.size() >= 2 && lastAdx > prevAdx; }
    bool falling() const { return adx.size() >= 2 && lastAdx < prevAdx; }
};

AdxResult computeAdx(const CandleSeries& bars, int period = 14);

TrendStrength classifyTrendStrength(double adx);

} // namespace Scalp
