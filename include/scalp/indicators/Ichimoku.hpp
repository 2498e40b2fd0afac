#pragma once
// =============================================================================
// Ichimoku.hpp - Ichimoku cloud, unshifted
// =============================================================================
// Span A and span B are read at the current bar, NOT displaced 26 bars
// forward. The "cloud" is therefore the current (tenkan+kijun)/2 versus the
// current 52-bar midpoint. Director and chop veto both depend on this.
// =============================================================================

#include <vector>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct IchimokuResult {
    std::vector<double> tenkan;   // element j <-> bar j + tenkanPeriod - 1
    std::vector<double> kijun;    // element j <-> bar j + kijunPeriod - 1
    std::vector<double> spanA;    // aligned with kijun
    std::vector<double> spanB;    // element j <-> bar j + senkouBPeriod - 1
    std::vector<double> chikou;   // element j <-> bar j + kijunPeriod, value close[j]

    double tenkanNow = 0.0;
    double kijunNow = 0.0;
    double spanANow = 0.0;
    double spanBNow = 0.0;
    double cloudTop = 0.0;
    double cloudBottom = 0.0;

    bool valid = false;           // false below senkouBPeriod bars
    bool aboveCloud = false;
    bool belowCloud = false;
    bool insideCloud = false;
    TrendDirection signal = TrendDirection::NEUTRAL;
};

IchimokuResult computeIchimoku(const CandleSeries& bars, int tenkanPeriod = 9,
                               int kijunPeriod = 26, int senkouBPeriod = 52);

} // namespace Scalp
