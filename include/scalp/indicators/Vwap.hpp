// =============================================================================
// Vwap.hpp - Volume-weighted average price over a bar window
// =============================================================================
// PURPOSE: VWAP of typical price (H+L+C)/3 weighted by bar volume, with
// +/- 2 sigma bands built from the population stddev of typical price.
//
// RULES:
//   - The window passed in is the session; no resets inside
//   - Zero total volume falls back to the last close
//   - Empty window yields zeros, AT_VWAP, HOLD
// =============================================================================
#pragma once

#include <cmath>
#include <vector>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

class VwapCalculator {
public:
    void reset() {
        cumPxVol_ = 0.0;
        cumVol_ = 0.0;
        lastClose_ = 0.0;
        typical_.clear();
    }

    void onBar(const Candle& bar) {
        const double tp = bar.typical();
        typical_.push_back(tp);
        lastClose_ = bar.close;
        if (bar.volume <= 0.0) return;
        cumPxVol_ += tp * bar.volume;
        cumVol_ += bar.volume;
    }

    double getVwap() const {
        if (typical_.empty()) return 0.0;
        return cumVol_ > 0.0 ? cumPxVol_ / cumVol_ : lastClose_;
    }

    double stdDev() const;

    size_t barCount() const { return typical_.size(); }

    // Computed helpers
    double distancePct(double price) const {
        const double v = getVwap();
        if (v <= 0.0) return 0.0;
        return std::abs(price - v) / v;
    }

    bool priceAbove(double price) const { return price > getVwap(); }
    bool priceBelow(double price) const { return price < getVwap(); }

private:
    double cumPxVol_  = 0.0;
    double cumVol_    = 0.0;
    double lastClose_ = 0.0;
    std::vector<double> typical_;
};

struct VwapResult {
    double vwap = 0.0;
    double upperBand = 0.0;
    double lowerBand = 0.0;
    double stdDev = 0.0;
    VwapPosition position = VwapPosition::AT_VWAP;
    RunSignal signal = RunSignal::HOLD;

    double distancePct(double price) const {
        if (vwap <= 0.0) return 0.0;
        return std::abs(price - vwap) / vwap;
    }
};

VwapResult computeVwap(const CandleSeries& bars);

} // namespace Scalp
