#pragma once
// =============================================================================
// MovingAverage.hpp - SMA / EMA / rolling mean / true range
// =============================================================================
// Alignment convention used across the indicator library: every function
// documents which input index its element 0 corresponds to. Consumers only
// ever read from the back, through lastOr()/prevOr().
// =============================================================================

#include <vector>

#include "scalp/core/Candle.hpp"

namespace Scalp {

// Element j <-> input index j + period - 1. Empty when size < period.
std::vector<double> sma(const std::vector<double>& values, int period);

// SMA-seeded EMA. Element j <-> input index j + period - 1.
// Empty when size < period.
std::vector<double> ema(const std::vector<double>& values, int period);

// Rolling sum / period (Wilder-style smoothing without the recursion).
// Same alignment as sma().
std::vector<double> rollingMean(const std::vector<double>& values, int period);

// max(H-L, |H-prevC|, |L-prevC|). Element j <-> bar j + 1.
std::vector<double> trueRanges(const CandleSeries& bars);

double mean(const std::vector<double>& values);
double populationStdDev(const std::vector<double>& values, double mu);

} // namespace Scalp
