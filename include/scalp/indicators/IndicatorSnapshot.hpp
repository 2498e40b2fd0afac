#pragma once
// =============================================================================
// IndicatorSnapshot.hpp - Last values of every indicator for one timeframe
// =============================================================================
// Recomputed on demand, never persisted. With too little history every field
// holds its neutral value (RSI 50, RVOL 1, zeros elsewhere).
// =============================================================================

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct SnapshotParams {
    int    rsiPeriod        = 14;
    int    adxPeriod        = 14;
    int    supertrendPeriod = 7;
    double supertrendMult   = 2.5;
    int    ewoShort         = 5;
    int    ewoLong          = 35;
    int    bbPeriod         = 20;
    double bbMult           = 2.0;
    int    atrPeriod        = 14;
    int    atrSlopeLookback = 5;
    int    rvolLookback     = 20;
    int    tenkan           = 9;
    int    kijun            = 26;
    int    senkouB          = 52;
};

struct IndicatorSnapshot {
    size_t bars = 0;
    int64_t ts_ms = 0;
    double close = 0.0;

    double rsi = 50.0;
    double adx = 0.0;
    double plusDI = 0.0;
    double minusDI = 0.0;
    TrendDirection adxDirection = TrendDirection::NEUTRAL;
    TrendStrength adxStrength = TrendStrength::NO_TREND;

    int supertrendTrend = 0;
    TrendSignal supertrendSignal = TrendSignal::HOLD;

    double ewo = 0.0;
    TrendSignal ewoSignal = TrendSignal::HOLD;

    double bbUpper = 0.0;
    double bbMiddle = 0.0;
    double bbLower = 0.0;

    double vwap = 0.0;
    double vwapUpper = 0.0;
    double vwapLower = 0.0;
    VwapPosition vwapPosition = VwapPosition::AT_VWAP;

    double atr = 0.0;
    double atrSlope = 0.0;
    bool   atrExpanding = false;

    double tenkan = 0.0;
    double kijun = 0.0;
    double spanA = 0.0;
    double spanB = 0.0;
    double cloudTop = 0.0;
    double cloudBottom = 0.0;
    bool   insideCloud = false;

    double rvol = 1.0;
};

IndicatorSnapshot computeSnapshot(const CandleSeries& bars, const SnapshotParams& params = SnapshotParams{});

} // namespace Scalp
