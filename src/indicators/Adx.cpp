#include "scalp/indicators/Adx.hpp"

#include <cmath>
#include <cstdio>

#include "scalp/indicators/MovingAverage.hpp"

namespace Scalp {

TrendStrength classifyTrendStrength(double adx) {
    if (adx >= 50.0) return TrendStrength::VERY_STRONG;
    if (adx >= 40.0) return TrendStrength::STRONG;
    if (adx >= 25.0) return TrendStrength::MODERATE;
    if (adx >= 15.0) return TrendStrength::WEAK;
    return TrendStrength::NO_TREND;
}

AdxResult computeAdx(const CandleSeries& bars, int period) {
    AdxResult r;
    if (period <= 0 || bars.size() < static_cast<size_t>(period) + 1) return r;

    std::vector<double> tr = trueRanges(bars);
    std::vector<double> plusDM, minusDM;
    plusDM.reserve(tr.size());
    minusDM.reserve(tr.size());
    for (size_t i = 1; i < bars.size(); ++i) {
        const double up = bars[i].high - bars[i - 1].high;
        const double down = bars[i - 1].low - bars[i].low;
        plusDM.push_back(up > down && up > 0 ? up : 0.0);
        minusDM.push_back(down > up && down > 0 ? down : 0.0);
    }

    const std::vector<double> sTR = rollingMean(tr, period);
    const std::vector<double> sPlus = rollingMean(plusDM, period);
    const std::vector<double> sMinus = rollingMean(minusDM, period);

    std::vector<double> dx;
    dx.reserve(sTR.size());
    r.plusDI.reserve(sTR.size());
    r.minusDI.reserve(sTR.size());
    for (size_t i = 0; i < sTR.size(); ++i) {
        const double pdi = safeDiv(sPlus[i], sTR[i], 0.0) * 100.0;
        const double mdi = safeDiv(sMinus[i], sTR[i], 0.0) * 100.0;
        r.plusDI.push_back(pdi);
        r.minusDI.push_back(mdi);
        dx.push_back(safeDiv(std::abs(pdi - mdi), pdi + mdi, 0.0) * 100.0);
    }

    r.adx = rollingMean(dx, period);
    r.lastAdx = lastOr(r.adx, 0.0);
    r.prevAdx = prevOr(r.adx, r.lastAdx);
    r.lastPlusDI = lastOr(r.plusDI, 0.0);
    r.lastMinusDI = lastOr(r.minusDI, 0.0);

    if (r.lastPlusDI > r.lastMinusDI + 5.0)      r.direction = TrendDirection::BULLISH;
    else if (r.lastMinusDI > r.lastPlusDI + 5.0) r.direction = TrendDirection::BEARISH;

    r.strength = classifyTrendStrength(r.lastAdx);

    char buf[96];
    if (r.adx.empty()) {
        r.description = "Insufficient data";
    } else if (r.strength == TrendStrength::NO_TREND) {
        snprintf(buf, sizeof(buf), "ADX at %.0f - No clear trend", r.lastAdx);
        r.description = buf;
    } else if (r.direction == TrendDirection::NEUTRAL) {
        snprintf(buf, sizeof(buf), "ADX at %.0f - %s but directionless",
                 r.lastAdx, trend_strength_str(r.strength));
        r.description = buf;
    } else {
        snprintf(buf, sizeof(buf), "ADX at %.0f - %s %s trend", r.lastAdx,
                 trend_strength_str(r.strength),
                 r.direction == TrendDirection::BULLISH ? "bullish" : "bearish");
        r.description = buf;
    }
    return r;
}

} // namespace Scalp
