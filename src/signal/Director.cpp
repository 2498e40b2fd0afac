#include "scalp/signal/Director.hpp"

#include "scalp/indicators/Adx.hpp"
#include "scalp/indicators/Ewo.hpp"
#include "scalp/indicators/Ichimoku.hpp"
#include "scalp/indicators/Rsi.hpp"
#include "scalp/indicators/SuperTrend.hpp"
#include "scalp/indicators/Vwap.hpp"

using namespace Scalp;

Director::Director(const DirectorConfig& cfg)
    : cfg_(cfg) {}

int64_t Director::nextBoundary(int64_t now_ms) const {
    const int64_t step = static_cast<int64_t>(cfg_.lockMinutes) * 60LL * 1000LL;
    if (step <= 0) return now_ms;
    int64_t q = now_ms / step;
    if (now_ms < 0 && now_ms % step != 0) --q;
    return (q + 1) * step;
}

DirectorResult Director::evaluate(const CandleSeries& bars5m, int64_t now_ms,
                                  const std::optional<DirectorResult>& previous) const {
    if (bars5m.size() < static_cast<size_t>(cfg_.minBars)) {
        return DirectorResult{};
    }

    if (previous && previous->lockedUntil > now_ms) {
        return *previous;
    }

    DirectorResult r;
    r.computedAt = now_ms;
    r.lockedUntil = nextBoundary(now_ms);
    DirectorVotes& v = r.votes;
    const double price = bars5m.back().close;

    // ---- SuperTrend ----
    const SuperTrendResult st = computeSuperTrend(bars5m, cfg_.supertrendPeriod, cfg_.supertrendMult);
    const int stTrend = st.lastTrend();
    const TrendSignal stSignal = st.lastSignal();
    if (stTrend == 1 || stSignal == TrendSignal::BUY)        v.supertrend = 1;
    else if (stTrend == -1 || stSignal == TrendSignal::SELL) v.supertrend = -1;

    // ---- VWAP side ----
    const VwapResult vw = computeVwap(bars5m);
    r.vwap = vw.vwap;
    if (price > vw.vwap)      v.vwap = 1;
    else if (price < vw.vwap) v.vwap = -1;

    // ---- RSI ----
    const auto rsi = computeRsi(bars5m, cfg_.rsiPeriod);
    r.rsi = lastOr(rsi, 50.0);
    if (r.rsi > cfg_.rsiBull)      v.rsi = 1;
    else if (r.rsi < cfg_.rsiBear) v.rsi = -1;

    // ---- EWO: sign together with slope ----
    const EwoResult ewo = computeEwo(bars5m, cfg_.ewoShort, cfg_.ewoLong);
    if (ewo.last() > 0 && ewo.rising())       v.ewo = 1;
    else if (ewo.last() < 0 && ewo.falling()) v.ewo = -1;

    // ---- ADX: trending and rising, signed by DI ----
    const AdxResult adx = computeAdx(bars5m, cfg_.adxPeriod);
    r.adx = adx.lastAdx;
    if (adx.lastAdx >= cfg_.adxTrend && adx.rising()) {
        int sign = 0;
        if (adx.direction == TrendDirection::BULLISH)      sign = 1;
        else if (adx.direction == TrendDirection::BEARISH) sign = -1;

        if (sign != 0 && stTrend != 0 && sign != stTrend) {
            r.adxConflict = true;   // non-confirming, no vote
        } else {
            v.adx = sign;
        }
    }

    // ---- Ichimoku (unshifted cloud) ----
    const IchimokuResult ichi = computeIchimoku(bars5m, cfg_.tenkan, cfg_.kijun, cfg_.senkouB);
    r.insideCloud = ichi.valid && ichi.insideCloud;
    if (!r.insideCloud) {
        if (ichi.aboveCloud)      v.ichimoku = 1;
        else if (ichi.belowCloud) v.ichimoku = -1;
    }

    r.biasScore = v.sum();
    if (r.insideCloud) {
        r.state = DirectorState::CHOP;
    } else if (r.biasScore >= cfg_.biasThreshold) {
        r.state = DirectorState::BULL;
    } else if (r.biasScore <= -cfg_.biasThreshold) {
        r.state = DirectorState::BEAR;
    }
    return r;
}
