#include "scalp/indicators/IndicatorSnapshot.hpp"

#include "scalp/indicators/Adx.hpp"
#include "scalp/indicators/Atr.hpp"
#include "scalp/indicators/Bollinger.hpp"
#include "scalp/indicators/Ewo.hpp"
#include "scalp/indicators/Ichimoku.hpp"
#include "scalp/indicators/Rsi.hpp"
#include "scalp/indicators/Rvol.hpp"
#include "scalp/indicators/SuperTrend.hpp"
#include "scalp/indicators/Vwap.hpp"

namespace Scalp {

IndicatorSnapshot computeSnapshot(const CandleSeries& bars, const SnapshotParams& p) {
    IndicatorSnapshot s;
    s.bars = bars.size();
    if (bars.empty()) return s;

    s.ts_ms = bars.back().ts_ms;
    s.close = bars.back().close;

    s.rsi = lastOr(computeRsi(bars, p.rsiPeriod), 50.0);

    const AdxResult adx = computeAdx(bars, p.adxPeriod);
    s.adx = adx.lastAdx;
    s.plusDI = adx.lastPlusDI;
    s.minusDI = adx.lastMinusDI;
    s.adxDirection = adx.direction;
    s.adxStrength = adx.strength;

    const SuperTrendResult st = computeSuperTrend(bars, p.supertrendPeriod, p.supertrendMult);
    s.supertrendTrend = st.lastTrend();
    s.supertrendSignal = st.lastSignal();

    const EwoResult ewo = computeEwo(bars, p.ewoShort, p.ewoLong);
    s.ewo = ewo.last();
    s.ewoSignal = ewo.signal.empty() ? TrendSignal::HOLD : ewo.signal.back();

    const BollingerResult bb = computeBollinger(bars, p.bbPeriod, p.bbMult);
    s.bbUpper = lastOr(bb.upper, 0.0);
    s.bbMiddle = lastOr(bb.middle, 0.0);
    s.bbLower = lastOr(bb.lower, 0.0);

    const VwapResult vw = computeVwap(bars);
    s.vwap = vw.vwap;
    s.vwapUpper = vw.upperBand;
    s.vwapLower = vw.lowerBand;
    s.vwapPosition = vw.position;

    const AtrSlope atr = computeAtrSlope(bars, p.atrPeriod, p.atrSlopeLookback);
    s.atr = atr.current;
    s.atrSlope = atr.slope;
    s.atrExpanding = atr.isExpanding;

    const IchimokuResult ichi = computeIchimoku(bars, p.tenkan, p.kijun, p.senkouB);
    s.tenkan = ichi.tenkanNow;
    s.kijun = ichi.kijunNow;
    s.spanA = ichi.spanANow;
    s.spanB = ichi.spanBNow;
    s.cloudTop = ichi.cloudTop;
    s.cloudBottom = ichi.cloudBottom;
    s.insideCloud = ichi.insideCloud;

    s.rvol = computeRvol(bars, p.rvolLookback).rvol;
    return s;
}

} // namespace Scalp
