// ============================================================================
// test_director_validator.cpp - 5m Director, 2m Validator, Chop filter
// ============================================================================

#include <iostream>
#include <optional>

#include "TestHarness.hpp"
#include "SyntheticBars.hpp"

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/indicators/Adx.hpp"
#include "scalp/signal/ChopFilter.hpp"
#include "scalp/signal/Director.hpp"
#include "scalp/signal/Validator.hpp"

using namespace Scalp;
using namespace ScalpTest;

namespace {

const ScalpConfig kCfg;

// 25 strong 5m up bars then a +-0.1 zigzag: ADX decays through 16
CandleSeries fadingTrend5m(int n) {
    const int64_t step = timeframe_ms(Timeframe::M5);
    CandleSeries s;
    double p = 100.0;
    for (int i = 0; i < n; ++i) {
        const double d = i < 25 ? 0.5 : (i % 2 == 0 ? 0.1 : -0.1);
        const double o = p, c = p + d;
        append(s, o, std::max(o, c) + 0.05, std::min(o, c) - 0.05, c, 100.0, step);
        p = c;
    }
    return s;
}

} // namespace

// ----------------------------------------------------------------------------
// Director
// ----------------------------------------------------------------------------

bool test_director_bull() {
    const CandleSeries m1 = squeezeSetup(1);
    const CandleSeries m5 = aggregateBars(m1, Timeframe::M5);
    const int64_t now = closeOf(m1);

    Director dir(kCfg.director);
    const DirectorResult r = dir.evaluate(m5, now, std::nullopt);

    TEST_ASSERT(m5.size() == 60, "60 5m bars");
    TEST_ASSERT(r.state == DirectorState::BULL, "uptrend is BULL");
    TEST_ASSERT(r.biasScore == 5, "bias 5");
    TEST_ASSERT(r.votes.supertrend == 1 && r.votes.vwap == 1 && r.votes.rsi == 1, "trend votes");
    TEST_ASSERT(r.votes.ewo == 1 && r.votes.ichimoku == 1, "ewo and cloud votes");
    TEST_ASSERT(r.votes.adx == 0, "ADX at a plateau does not vote");
    TEST_ASSERT(!r.insideCloud && !r.adxConflict, "clear of cloud, no conflict");
    TEST_ASSERT(r.computedAt == now, "computed now");
    TEST_ASSERT(r.lockedUntil == now + 5 * MIN_MS, "locked to next 5m boundary");

    TEST_PASSED("director_bull");
}

bool test_director_bear() {
    const CandleSeries m1 = squeezeSetup(-1);
    const CandleSeries m5 = aggregateBars(m1, Timeframe::M5);

    Director dir(kCfg.director);
    const DirectorResult r = dir.evaluate(m5, closeOf(m1), std::nullopt);
    TEST_ASSERT(r.state == DirectorState::BEAR, "downtrend is BEAR");
    TEST_ASSERT(r.biasScore == -5, "bias -5");
    TEST_ASSERT(r.votes.sum() == r.biasScore, "score is the vote sum");

    TEST_PASSED("director_bear");
}

bool test_director_min_bars() {
    const CandleSeries m5 = aggregateBars(squeezeSetup(1), Timeframe::M5);
    const CandleSeries shortRun(m5.begin(), m5.begin() + 51);

    Director dir(kCfg.director);
    const DirectorResult r = dir.evaluate(shortRun, T0, std::nullopt);
    TEST_ASSERT(r.state == DirectorState::CHOP && r.biasScore == 0, "neutral below 52 bars");
    TEST_ASSERT(r.lockedUntil == 0, "not computed");

    // A cached result does not survive a history that shrank below minimum
    DirectorResult cached;
    cached.state = DirectorState::BULL;
    cached.biasScore = 5;
    cached.lockedUntil = T0 + 5 * MIN_MS;
    const DirectorResult again = dir.evaluate(shortRun, T0, cached);
    TEST_ASSERT(again.state == DirectorState::CHOP, "history gate before cache");

    TEST_PASSED("director_min_bars");
}

bool test_director_lock() {
    const CandleSeries m1 = squeezeSetup(1);
    const CandleSeries m5 = aggregateBars(m1, Timeframe::M5);
    const int64_t now = closeOf(m1);

    Director dir(kCfg.director);
    const DirectorResult first = dir.evaluate(m5, now, std::nullopt);

    // Same window, four more minutes: identical result
    for (int k = 1; k < 5; ++k) {
        const DirectorResult r = dir.evaluate(m5, now + k * MIN_MS, first);
        TEST_ASSERT(r.state == first.state && r.biasScore == first.biasScore, "locked state");
        TEST_ASSERT(r.computedAt == first.computedAt, "not recomputed inside window");
    }

    // A locked BEAR survives bullish bars until the boundary
    DirectorResult bear;
    bear.state = DirectorState::BEAR;
    bear.biasScore = -4;
    bear.lockedUntil = now + MIN_MS;
    const DirectorResult held = dir.evaluate(m5, now, bear);
    TEST_ASSERT(held.state == DirectorState::BEAR && held.biasScore == -4, "cached until lockedUntil");

    // At the boundary it is recomputed
    const DirectorResult next = dir.evaluate(m5, first.lockedUntil, first);
    TEST_ASSERT(next.computedAt == first.lockedUntil, "recomputed at boundary");
    TEST_ASSERT(next.lockedUntil == first.lockedUntil + 5 * MIN_MS, "new lock");

    TEST_ASSERT(dir.nextBoundary(T0 + 123) == T0 + 5 * MIN_MS, "boundary after an offset");
    TEST_ASSERT(dir.nextBoundary(T0) == T0 + 5 * MIN_MS, "boundary strictly after now");

    TEST_PASSED("director_lock");
}

bool test_director_inside_cloud() {
    const CandleSeries m5 = aggregateBars(flatBase(300), Timeframe::M5);

    Director dir(kCfg.director);
    const DirectorResult r = dir.evaluate(m5, closeOf(m5, 5 * MIN_MS), std::nullopt);
    TEST_ASSERT(r.insideCloud, "flat closes sit in the cloud");
    TEST_ASSERT(r.state == DirectorState::CHOP, "inside cloud forces CHOP");
    TEST_ASSERT(r.votes.ichimoku == 0, "no cloud vote inside");

    TEST_PASSED("director_inside_cloud");
}

bool test_director_adx_conflict() {
    // Flat wide bars, then a slow slide: -DI leads and ADX climbs while the
    // close stays above the SuperTrend lower band
    CandleSeries m5;
    for (int i = 0; i < 50; ++i) append(m5, 100.0, 101.0, 99.0, 100.0, 100.0, 5 * MIN_MS);
    for (int k = 1; k <= 10; ++k) {
        const double c = 100.0 - 0.2 * k;
        append(m5, c + 0.2, c + 1.0, c - 1.0, c, 100.0, 5 * MIN_MS);
    }

    const AdxResult adx = computeAdx(m5, kCfg.director.adxPeriod);
    TEST_ASSERT(adx.lastAdx >= kCfg.director.adxTrend && adx.rising(), "ADX trending and rising");
    TEST_ASSERT(adx.direction == TrendDirection::BEARISH, "-DI leads by more than 5");

    const DirectorResult r = Director(kCfg.director).evaluate(m5, closeOf(m5, 5 * MIN_MS), std::nullopt);
    TEST_ASSERT(r.votes.supertrend == 1, "SuperTrend still up");
    TEST_ASSERT(r.adxConflict, "conflict flagged");
    TEST_ASSERT(r.votes.adx == 0, "conflicting ADX does not vote");
    TEST_ASSERT(r.votes.vwap == -1 && r.votes.rsi == -1 && r.votes.ewo == -1 && r.votes.ichimoku == -1,
                "other votes bearish");
    // A counted ADX vote would have made it -4
    TEST_ASSERT(r.biasScore == -3, "bias without the ADX vote");
    TEST_ASSERT(r.state == DirectorState::BEAR, "still BEAR at threshold");

    TEST_PASSED("director_adx_conflict");
}

// ----------------------------------------------------------------------------
// Validator
// ----------------------------------------------------------------------------

bool test_validator_aligned() {
    const CandleSeries m1 = squeezeSetup(1);
    const CandleSeries m2 = aggregateBars(m1, Timeframe::M2);
    const CandleSeries m5 = aggregateBars(m1, Timeframe::M5);

    const DirectorResult d = Director(kCfg.director).evaluate(m5, closeOf(m1), std::nullopt);
    Validator val(kCfg.validator);
    const ValidatorResult r = val.evaluate(m2, m1, d);

    TEST_ASSERT(r.longValid && !r.shortValid, "long side valid");
    TEST_ASSERT(r.longChecks.count() == 5, "all five long checks");
    TEST_ASSERT(r.state == ValidatorState::BULL, "agrees with BULL director");
    TEST_ASSERT(!r.adxFromOneMinute, "2m ADX used");

    // Same bars, director without bias: valid side but NEUTRAL
    DirectorResult chop;
    const ValidatorResult n = val.evaluate(m2, m1, chop);
    TEST_ASSERT(n.longValid && n.state == ValidatorState::NEUTRAL, "needs director agreement");

    // Same bars, opposite director
    DirectorResult bear;
    bear.state = DirectorState::BEAR;
    TEST_ASSERT(val.evaluate(m2, m1, bear).state == ValidatorState::NEUTRAL, "disagreement is NEUTRAL");

    const CandleSeries s1 = squeezeSetup(-1);
    const CandleSeries s2 = aggregateBars(s1, Timeframe::M2);
    const DirectorResult ds = Director(kCfg.director).evaluate(aggregateBars(s1, Timeframe::M5),
                                                               closeOf(s1), std::nullopt);
    const ValidatorResult rs = val.evaluate(s2, s1, ds);
    TEST_ASSERT(rs.shortValid && rs.state == ValidatorState::BEAR, "short mirror");

    TEST_PASSED("validator_aligned");
}

bool test_validator_short_history() {
    const CandleSeries m1 = squeezeSetup(1);
    const CandleSeries m2 = aggregateBars(m1, Timeframe::M2);
    const CandleSeries shortRun(m2.begin(), m2.begin() + 29);

    DirectorResult bull;
    bull.state = DirectorState::BULL;
    const ValidatorResult r = Validator(kCfg.validator).evaluate(shortRun, m1, bull);
    TEST_ASSERT(r.state == ValidatorState::NEUTRAL, "NEUTRAL below 30 bars");
    TEST_ASSERT(!r.longValid && !r.shortValid, "no side valid");

    // Lower minimum: 2m too short for ADX, 1m stands in
    ValidatorConfig loose = kCfg.validator;
    loose.minBars = 15;
    const CandleSeries m1Short(m1.begin(), m1.begin() + 36);
    const CandleSeries m2Short = aggregateBars(m1Short, Timeframe::M2);
    const ValidatorResult p = Validator(loose).evaluate(m2Short, m1Short, bull);
    TEST_ASSERT(m2Short.size() == 18, "18 2m bars");
    TEST_ASSERT(p.adxFromOneMinute, "1m ADX proxy");
    TEST_ASSERT(p.longChecks.adx, "1m ADX above trend level");

    TEST_PASSED("validator_short_history");
}

// ----------------------------------------------------------------------------
// Chop filter
// ----------------------------------------------------------------------------

bool test_chop_inside_cloud() {
    DirectorResult d;
    d.insideCloud = true;
    const ChopResult r = ChopFilter(kCfg.chop).evaluate({}, {}, {}, d);
    TEST_ASSERT(r.isChop && r.reason == ChopReason::INSIDE_CLOUD, "cloud veto");
    TEST_ASSERT(r.text == "Price inside 5m Ichimoku cloud", "cloud text");

    TEST_PASSED("chop_inside_cloud");
}

bool test_chop_adx_falling() {
    const CandleSeries bars = fadingTrend5m(51);
    ChopFilter chop(kCfg.chop);
    DirectorResult d;

    const ChopResult on5 = chop.evaluate(bars, {}, {}, d);
    TEST_ASSERT(on5.isChop && on5.reason == ChopReason::ADX_FALLING_5M, "5m ADX veto");
    TEST_ASSERT(on5.text == "ADX < 16 and falling on 5m", "5m text");

    const ChopResult on2 = chop.evaluate({}, bars, {}, d);
    TEST_ASSERT(on2.isChop && on2.reason == ChopReason::ADX_FALLING_2M, "2m ADX veto");

    // Still trending: ADX high
    const CandleSeries strong = fadingTrend5m(40);
    TEST_ASSERT(!chop.evaluate(strong, {}, {}, d).isChop, "trend still strong");

    TEST_PASSED("chop_adx_falling");
}

bool test_chop_vwap_whipsaw() {
    const CandleSeries bars = tightRange(30);
    TEST_ASSERT(ChopFilter::countVwapCrosses(bars, 100.0, 10) == 9, "every bar crosses");
    TEST_ASSERT(ChopFilter::countVwapCrosses(bars, 100.0, 1) == 0, "lookback below 2");

    const ChopResult r = ChopFilter(kCfg.chop).evaluate({}, {}, bars, DirectorResult{});
    TEST_ASSERT(r.isChop && r.reason == ChopReason::VWAP_WHIPSAW, "whipsaw veto");
    TEST_ASSERT(r.text == "VWAP crossed 9 times in last 10 min", "whipsaw text");

    TEST_PASSED("chop_vwap_whipsaw");
}

bool test_chop_band_squeeze() {
    CandleSeries bars;
    for (int i = 0; i < 30; ++i) append(bars, 100.0, 100.05, 99.95, 100.0, 100.0);

    const ChopResult r = ChopFilter(kCfg.chop).evaluate({}, {}, bars, DirectorResult{});
    TEST_ASSERT(r.isChop && r.reason == ChopReason::BAND_SQUEEZE, "squeeze veto");
    TEST_ASSERT(r.text == "Tight Bollinger bands with VWAP oscillation", "squeeze text");

    TEST_PASSED("chop_band_squeeze");
}

bool test_chop_clear_trend() {
    const CandleSeries m1 = squeezeSetup(1);
    const CandleSeries m2 = aggregateBars(m1, Timeframe::M2);
    const CandleSeries m5 = aggregateBars(m1, Timeframe::M5);
    const DirectorResult d = Director(kCfg.director).evaluate(m5, closeOf(m1), std::nullopt);

    const ChopResult r = ChopFilter(kCfg.chop).evaluate(m5, m2, m1, d);
    TEST_ASSERT(!r.isChop && r.reason == ChopReason::NONE, "trend is not chop");
    TEST_ASSERT(r.text.empty(), "no text");

    TEST_PASSED("chop_clear_trend");
}

int main() {
    std::cout << "=== Director / Validator / Chop Tests ===" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_director_bull);
    RUN_TEST(test_director_bear);
    RUN_TEST(test_director_min_bars);
    RUN_TEST(test_director_lock);
    RUN_TEST(test_director_inside_cloud);
    RUN_TEST(test_director_adx_conflict);
    RUN_TEST(test_validator_aligned);
    RUN_TEST(test_validator_short_history);
    RUN_TEST(test_chop_inside_cloud);
    RUN_TEST(test_chop_adx_falling);
    RUN_TEST(test_chop_vwap_whipsaw);
    RUN_TEST(test_chop_band_squeeze);
    RUN_TEST(test_chop_clear_trend);

    TEST_RESULTS();
}
