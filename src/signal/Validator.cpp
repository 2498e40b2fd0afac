#include "scalp/signal/Validator.hpp"

#include "scalp/indicators/Adx.hpp"
#include "scalp/indicators/Ewo.hpp"
#include "scalp/indicators/Rsi.hpp"
#include "scalp/indicators/SuperTrend.hpp"
#include "scalp/indicators/Vwap.hpp"

using namespace Scalp;

Validator::Validator(const ValidatorConfig& cfg)
    : cfg_(cfg) {}

ValidatorResult Validator::evaluate(const CandleSeries& bars2m, const CandleSeries& bars1m,
                                    const DirectorResult& director) const {
    ValidatorResult r;
    if (bars2m.size() < static_cast<size_t>(cfg_.minBars)) return r;

    const double price = bars2m.back().close;

    const VwapResult vw = computeVwap(bars2m);
    const int stTrend = computeSuperTrend(bars2m, cfg_.supertrendPeriod, cfg_.supertrendMult).lastTrend();

    const auto rsi = computeRsi(bars2m, cfg_.rsiPeriod);
    const double rsiNow = lastOr(rsi, 50.0);
    const double rsiPrev = prevOr(rsi, 50.0);

    const EwoResult ewo = computeEwo(bars2m, cfg_.ewoShort, cfg_.ewoLong);

    // ADX from 2m, 1m as a proxy when 2m is too short
    bool adxOk = false;
    const size_t minAdx = static_cast<size_t>(cfg_.adxMinBars);
    const CandleSeries* adxSource = nullptr;
    if (bars2m.size() >= minAdx) {
        adxSource = &bars2m;
    } else if (bars1m.size() >= minAdx) {
        adxSource = &bars1m;
        r.adxFromOneMinute = true;
    }
    if (adxSource) {
        const AdxResult adx = computeAdx(*adxSource, cfg_.adxPeriod);
        adxOk = adx.lastAdx >= cfg_.adxTrend || adx.rising();
    }

    r.longChecks.vwap       = price > vw.vwap;
    r.longChecks.supertrend = stTrend == 1;
    r.longChecks.rsi        = rsiNow >= cfg_.rsiLong && rsiNow > rsiPrev;
    r.longChecks.ewo        = ewo.last() > 0 || ewo.rising();
    r.longChecks.adx        = adxOk;

    r.shortChecks.vwap       = price < vw.vwap;
    r.shortChecks.supertrend = stTrend == -1;
    r.shortChecks.rsi        = rsiNow <= cfg_.rsiShort && rsiNow < rsiPrev;
    r.shortChecks.ewo        = ewo.last() < 0 || ewo.falling();
    r.shortChecks.adx        = adxOk;

    r.longValid = r.longChecks.all();
    r.shortValid = r.shortChecks.all();

    if (r.longValid && director.state == DirectorState::BULL)       r.state = ValidatorState::BULL;
    else if (r.shortValid && director.state == DirectorState::BEAR) r.state = ValidatorState::BEAR;
    return r;
}
