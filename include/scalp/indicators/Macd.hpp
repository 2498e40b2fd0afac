#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct MacdResult {
    std::vector<double> macd;        // element j <-> bar j + slow - 1
    std::vector<double> signal;      // element j <-> macd j + signalPeriod - 1
    std::vector<double> histogram;   // aligned with signal
    std::vector<TrendSignal> crossover;

    TrendSignal lastCrossover() const {
        return crossover.empty() ? TrendSignal::HOLD : crossover.back();
    }
};

MacdResult computeMacd(const CandleSeries& bars, int fast = 12, int slow = 26, int signalPeriod = 9);

} // namespace Scalp
