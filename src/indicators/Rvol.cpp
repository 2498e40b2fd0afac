#include "scalp/indicators/Rvol.hpp"

namespace Scalp {

RvolResult computeRvol(const CandleSeries& bars, int lookback) {
    RvolResult r;
    if (lookback <= 0 || bars.size() < static_cast<size_t>(lookback) + 1) return r;

    const size_t n = bars.size();
    double sum = 0.0;
    for (size_t i = n - 1 - static_cast<size_t>(lookback); i < n - 1; ++i) {
        sum += bars[i].volume;
    }
    r.avgVolume = sum / lookback;
    r.rvol = safeDiv(bars.back().volume, r.avgVolume, 1.0);
    r.isSpike = r.rvol > 1.5;
    return r;
}

std::vector<bool> detectVolumeSpikes(const CandleSeries& bars, int lookback, double threshold) {
    std::vector<bool> spikes(bars.size(), false);
    if (lookback <= 0) return spikes;

    const size_t lb = static_cast<size_t>(lookback);
    double window = 0.0;
    for (size_t i = 0; i < bars.size(); ++i) {
        if (i >= lb) {
            spikes[i] = bars[i].volume > (window / lookback) * threshold;
            window -= bars[i - lb].volume;
        }
        window += bars[i].volume;
    }
    return spikes;
}

} // namespace Scalp
