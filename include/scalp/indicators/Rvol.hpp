#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"

namespace Scalp {

struct RvolResult {
    double rvol = 1.0;        // current volume / mean of the preceding lookback bars
    double avgVolume = 0.0;
    bool   isSpike = false;   // rvol > 1.5
};

// 1.0 when fewer than lookback + 1 bars or the average is zero
RvolResult computeRvol(const CandleSeries& bars, int lookback = 20);

// Per bar: volume > threshold * mean of the preceding lookback bars.
// Aligned bar-for-bar; false during warm-up.
std::vector<bool> detectVolumeSpikes(const CandleSeries& bars, int lookback = 20, double threshold = 2.0);

} // namespace Scalp
