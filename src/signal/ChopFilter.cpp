#include "scalp/signal/ChopFilter.hpp"

#include <cstdio>

#include "scalp/indicators/Adx.hpp"
#include "scalp/indicators/Bollinger.hpp"
#include "scalp/indicators/Vwap.hpp"

using namespace Scalp;

namespace {
constexpr int BB_PERIOD = 20;
constexpr double BB_MULT = 2.0;
}

ChopFilter::ChopFilter(const ChopConfig& cfg)
    : cfg_(cfg) {}

int ChopFilter::countVwapCrosses(const CandleSeries& bars, double vwap, int lookback) {
    if (lookback < 2 || bars.size() < static_cast<size_t>(lookback)) return 0;
    int crosses = 0;
    const size_t start = bars.size() - static_cast<size_t>(lookback);
    for (size_t i = start + 1; i < bars.size(); ++i) {
        const bool prevAbove = bars[i - 1].close > vwap;
        const bool currAbove = bars[i].close > vwap;
        if (prevAbove != currAbove) ++crosses;
    }
    return crosses;
}

bool ChopFilter::adxWeakAndFalling(const CandleSeries& bars) const {
    if (bars.size() < static_cast<size_t>(cfg_.adxMinBars)) return false;
    const AdxResult adx = computeAdx(bars, cfg_.adxPeriod);
    return adx.valid() && adx.lastAdx < cfg_.adxThreshold && adx.falling();
}

ChopResult ChopFilter::evaluate(const CandleSeries& bars5m, const CandleSeries& bars2m,
                                const CandleSeries& bars1m, const DirectorResult& director) const {
    ChopResult r;
    char buf[96];

    if (director.insideCloud) {
        r.isChop = true;
        r.reason = ChopReason::INSIDE_CLOUD;
        r.text = "Price inside 5m Ichimoku cloud";
        return r;
    }

    if (adxWeakAndFalling(bars5m)) {
        r.isChop = true;
        r.reason = ChopReason::ADX_FALLING_5M;
        snprintf(buf, sizeof(buf), "ADX < %.0f and falling on 5m", cfg_.adxThreshold);
        r.text = buf;
        return r;
    }
    if (adxWeakAndFalling(bars2m)) {
        r.isChop = true;
        r.reason = ChopReason::ADX_FALLING_2M;
        snprintf(buf, sizeof(buf), "ADX < %.0f and falling on 2m", cfg_.adxThreshold);
        r.text = buf;
        return r;
    }

    if (bars1m.empty()) return r;
    const VwapResult vw = computeVwap(bars1m);

    const int crosses = countVwapCrosses(bars1m, vw.vwap, cfg_.vwapCrossLookback);
    if (crosses >= cfg_.vwapCrossMax) {
        r.isChop = true;
        r.reason = ChopReason::VWAP_WHIPSAW;
        snprintf(buf, sizeof(buf), "VWAP crossed %d times in last %d min", crosses, cfg_.vwapCrossLookback);
        r.text = buf;
        return r;
    }

    const BollingerResult bb = computeBollinger(bars1m, BB_PERIOD, BB_MULT);
    if (bb.valid()) {
        const bool tight = bb.bandwidthPct() < cfg_.bandwidthPct;
        const bool pinned = vw.vwap > 0.0 && vw.distancePct(bars1m.back().close) < cfg_.vwapProximity;
        if (tight && pinned) {
            r.isChop = true;
            r.reason = ChopReason::BAND_SQUEEZE;
            r.text = "Tight Bollinger bands with VWAP oscillation";
            return r;
        }
    }
    return r;
}
