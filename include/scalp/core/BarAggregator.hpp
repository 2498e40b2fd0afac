#pragma once

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

// Merge 1m bars into wall-clock aligned buckets of tf (bucket open =
// floor(ts / tf) * tf). The last bucket may be partial; callers drop it by
// close time when they need closed bars only.
CandleSeries aggregateBars(const CandleSeries& bars1m, Timeframe tf);

} // namespace Scalp
