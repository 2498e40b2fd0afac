#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"

namespace Scalp {

// Simple-mean RSI over the trailing `period` close-to-close changes,
// the change into the current bar included. 100 when there are no losses.
// Element j <-> bar j + period. Empty when size <= period.
std::vector<double> computeRsi(const CandleSeries& bars, int period = 14);

} // namespace Scalp
