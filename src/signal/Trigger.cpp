#include "scalp/signal/Trigger.hpp"

#include "scalp/indicators/Adx.hpp"
#include "scalp/indicators/Bollinger.hpp"
#include "scalp/indicators/Ewo.hpp"
#include "scalp/indicators/PivotPoints.hpp"
#include "scalp/indicators/Rsi.hpp"
#include "scalp/indicators/Rvol.hpp"
#include "scalp/indicators/SuperTrend.hpp"
#include "scalp/indicators/Vwap.hpp"

using namespace Scalp;

Trigger::Trigger(const TriggerConfig& trigger, const ValidatorConfig& momentum, double adxTrend)
    : cfg_(trigger),
      momentum_(momentum),
      adxTrend_(adxTrend) {}

TriggerResult Trigger::evaluate(const CandleSeries& bars1m, const DirectorResult& director,
                                const ValidatorResult& validator, const TrapModeState& trap) const {
    TriggerResult r;
    if (bars1m.size() < static_cast<size_t>(cfg_.minBars) || trap.active) return r;

    const size_t n = bars1m.size();
    if (n < 2) return r;
    const size_t hyst = static_cast<size_t>(cfg_.vwapHysteresis);
    const double price = bars1m.back().close;

    // ---- VWAP hysteresis ----
    const VwapResult vw = computeVwap(bars1m);
    r.vwap = vw.vwap;
    bool above = n >= hyst, below = n >= hyst;
    for (size_t k = 0; k < hyst && k < n; ++k) {
        const double c = bars1m[n - 1 - k].close;
        above = above && c > vw.vwap;
        below = below && c < vw.vwap;
    }

    // ---- SuperTrend colour, same bar count as VWAP hysteresis ----
    const SuperTrendResult st = computeSuperTrend(bars1m, momentum_.supertrendPeriod, momentum_.supertrendMult);
    bool green = true, red = true;
    for (size_t k = 0; k < hyst; ++k) {
        green = green && st.trendAt(k) == 1;
        red = red && st.trendAt(k) == -1;
    }

    // ---- RVOL ----
    r.rvol = computeRvol(bars1m, cfg_.rvolLookback).rvol;
    const bool rvolOk = r.rvol >= cfg_.rvolThreshold;

    // ---- ADX ----
    const AdxResult adx = computeAdx(bars1m, momentum_.adxPeriod);
    r.adx = adx.lastAdx;
    r.prevAdx = adx.prevAdx;
    const bool adxOk = adx.valid() && adx.lastAdx >= adxTrend_ && adx.lastAdx >= adx.prevAdx;

    // ---- RSI / EWO ----
    const auto rsi = computeRsi(bars1m, momentum_.rsiPeriod);
    r.rsi = lastOr(rsi, 50.0);
    const double rsiPrev = prevOr(rsi, 50.0);
    const EwoResult ewo = computeEwo(bars1m, momentum_.ewoShort, momentum_.ewoLong);

    // ---- Pivots from the previous bar ----
    const PivotLevels pv = computePivots(bars1m[n - 2]);
    const bool pivotLong = price > pv.r1 || (price > pv.s1 && price > vw.vwap);
    const bool pivotShort = price < pv.s1 || (price < pv.r1 && price < vw.vwap);

    // ---- Bollinger expansion ----
    const BollingerResult bb = computeBollinger(bars1m, cfg_.bbPeriod, cfg_.bbMult);
    const size_t back = static_cast<size_t>(cfg_.bbExpansionBars);
    const bool expanding = bb.middle.size() > back &&
                           bb.widthAt(0) > bb.widthAt(back) * cfg_.bbExpansion;
    const double mid = lastOr(bb.middle, price);

    TriggerChecks longC;
    longC.vwapHysteresis = above;
    longC.supertrend     = green;
    longC.rvol           = rvolOk;
    longC.adx            = adxOk;
    longC.rsi            = r.rsi >= momentum_.rsiLong && r.rsi > rsiPrev;
    longC.ewo            = ewo.last() > 0 && ewo.rising();
    longC.notInCloud     = !director.insideCloud;
    longC.pivot          = pivotLong;
    longC.bollinger      = expanding && price > mid;

    TriggerChecks shortC;
    shortC.vwapHysteresis = below;
    shortC.supertrend     = red;
    shortC.rvol           = rvolOk;
    shortC.adx            = adxOk;
    shortC.rsi            = r.rsi <= momentum_.rsiShort && r.rsi < rsiPrev;
    shortC.ewo            = ewo.last() < 0 && ewo.falling();
    shortC.notInCloud     = !director.insideCloud;
    shortC.pivot          = pivotShort;
    shortC.bollinger      = expanding && price < mid;

    if (director.state == DirectorState::BULL && validator.longValid && longC.all()) {
        r.valid = true;
        r.direction = Direction::LONG;
        r.checks = longC;
        return r;
    }
    if (director.state == DirectorState::BEAR && validator.shortValid && shortC.all()) {
        r.valid = true;
        r.direction = Direction::SHORT;
        r.checks = shortC;
        return r;
    }

    // Report the side the director leans to
    const bool leansShort = director.state == DirectorState::BEAR ||
                            (director.state == DirectorState::CHOP && director.biasScore < 0);
    r.checks = leansShort ? shortC : longC;
    return r;
}
