#pragma once

#include <vector>

#include "scalp/core/Candle.hpp"

namespace Scalp {

// SMA(close) +/- k * population stddev. Element j <-> bar j + period - 1.
struct BollingerResult {
    std::vector<double> upper;
    std::vector<double> middle;
    std::vector<double> lower;
    std::vector<bool>   danger;   // close within 2% of a band, or outside

    bool valid() const { return !middle.empty(); }

    // (upper - lower) k elements from the end; 0 when out of range
    double widthAt(size_t fromEnd) const {
        if (fromEnd >= middle.size()) return 0.0;
        const size_t i = middle.size() - 1 - fromEnd;
        return upper[i] - lower[i];
    }

    // Width relative to the middle band, last element
    double bandwidthPct() const {
        if (middle.empty()) return 0.0;
        return safeDiv(upper.back() - lower.back(), middle.back(), 0.0);
    }
};

BollingerResult computeBollinger(const CandleSeries& bars, int period = 20, double k = 2.0);

} // namespace Scalp
