// ============================================================================
// test_session.cpp - ScalpSession: bar clock, closed bars, history, callbacks
// ============================================================================

#include <iostream>
#include <vector>

#include "TestHarness.hpp"
#include "SyntheticBars.hpp"

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/engine/ScalpSession.hpp"

using namespace Scalp;
using namespace ScalpTest;

namespace {

constexpr int64_t SHIFT_MS = 30 * MIN_MS;

ScalpConfig testConfig() {
    ScalpConfig cfg;
    cfg.session.symbol = "TEST";
    return cfg;
}

void feed(ScalpSession& s, const CandleSeries& m1, int64_t now) {
    s.updateSeries(Timeframe::M1, m1, now);
    s.updateSeries(Timeframe::M2, aggregateBars(m1, Timeframe::M2), now);
    s.updateSeries(Timeframe::M5, aggregateBars(m1, Timeframe::M5), now);
}

// Short setup starting half an hour after the long one
CandleSeries laterShortSetup() {
    CandleSeries s = squeezeSetup(-1);
    for (auto& b : s) b.ts_ms += SHIFT_MS;
    return s;
}

} // namespace

bool test_no_data() {
    ScalpSession s(testConfig());
    TEST_ASSERT(s.onBarClose(T0) == CycleStatus::NO_DATA, "nothing fed");

    // A bar that has not closed yet does not count
    CandleSeries one;
    append(one, 100.0, 100.1, 99.9, 100.0, 100.0);
    feed(s, one, T0 + 30000);
    TEST_ASSERT(s.onBarClose(T0 + 30000) == CycleStatus::NO_DATA, "open bar ignored");
    TEST_ASSERT(s.cycles() == 0 && s.candleIndex() == 0, "no cycle ran");

    TEST_PASSED("no_data");
}

bool test_alert_cycle() {
    ScalpSession s(testConfig());
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t now = closeOf(m1);

    int alerts = 0, pushes = 0;
    bool pushedWeak = false;
    s.setOnAlert([&](const Alert&) { ++alerts; });
    s.setOnPushAlert([&](const Alert& a) {
        ++pushes;
        if (!a.shouldPush) pushedWeak = true;
    });

    feed(s, m1, now);
    TEST_ASSERT(s.lastUpdate(Timeframe::M1) == now && s.lastUpdate(Timeframe::M5) == now, "update stamped");

    TEST_ASSERT(s.onBarClose(now) == CycleStatus::RAN, "cycle ran");
    TEST_ASSERT(alerts == 1 && pushes == 1, "both callbacks once");
    TEST_ASSERT(!pushedWeak, "only pushable alerts pushed");
    TEST_ASSERT(s.currentAlert().has_value(), "alert on display");
    TEST_ASSERT(s.currentAlert()->type == AlertType::SQUEEZE_LONG, "squeeze long");
    TEST_ASSERT(s.candleIndex() == 1 && s.cycles() == 1, "counters");
    TEST_ASSERT(s.lastCycle().has_value() && s.lastCycle()->alert.has_value(), "last cycle kept");

    // Same newest bar again
    TEST_ASSERT(s.onBarClose(now + 1000) == CycleStatus::DUPLICATE_BAR, "duplicate bar");
    TEST_ASSERT(s.cycles() == 1 && alerts == 1, "duplicate not evaluated");

    const SessionSummary sum = s.summary(now);
    TEST_ASSERT(sum.director == DirectorState::BULL && sum.biasScore == 5, "director summary");
    TEST_ASSERT(sum.lastDirection == Direction::LONG, "last direction");
    TEST_ASSERT(sum.oppositeCooldownActive && sum.cooldownRemainingSec == 180, "cooldown summary");
    TEST_ASSERT(!sum.trapActive && sum.trapType == TrapType::NONE, "no trap");
    TEST_ASSERT(sum.alerts == 1 && sum.cycles == 1 && sum.candleIndex == 1, "summary counters");

    TEST_ASSERT(s.summary(now + 60000).cooldownRemainingSec == 120, "cooldown counts down");
    TEST_ASSERT(!s.summary(now + 180000).oppositeCooldownActive, "cooldown over");

    TEST_PASSED("alert_cycle");
}

bool test_history_dismiss_reset() {
    ScalpSession s(testConfig());

    const CandleSeries longBars = squeezeSetup(1);
    feed(s, longBars, closeOf(longBars));
    TEST_ASSERT(s.onBarClose(closeOf(longBars)) == CycleStatus::RAN, "long cycle");

    const CandleSeries shortBars = laterShortSetup();
    feed(s, shortBars, closeOf(shortBars));
    TEST_ASSERT(s.onBarClose(closeOf(shortBars)) == CycleStatus::RAN, "short cycle");

    const std::vector<Alert> h = s.history();
    TEST_ASSERT(h.size() == 2, "two alerts");
    TEST_ASSERT(h[0].type == AlertType::SQUEEZE_SHORT && h[1].type == AlertType::SQUEEZE_LONG, "newest first");
    TEST_ASSERT(s.currentAlert()->type == AlertType::SQUEEZE_SHORT, "latest on display");

    s.dismiss();
    TEST_ASSERT(!s.currentAlert().has_value(), "dismissed");
    TEST_ASSERT(s.history().size() == 2, "history kept");

    TEST_ASSERT(s.reset(), "reset between cycles");
    TEST_ASSERT(s.history().empty() && !s.lastCycle().has_value(), "history cleared");
    TEST_ASSERT(s.candleIndex() == 0 && s.cycles() == 0, "counters cleared");
    TEST_ASSERT(s.lastUpdate(Timeframe::M1) == 0, "series cleared");
    TEST_ASSERT(s.onBarClose(closeOf(shortBars)) == CycleStatus::NO_DATA, "nothing left to evaluate");

    TEST_PASSED("history_dismiss_reset");
}

bool test_history_limit() {
    ScalpConfig cfg = testConfig();
    cfg.session.historySize = 1;
    ScalpSession s(cfg);

    const CandleSeries longBars = squeezeSetup(1);
    feed(s, longBars, closeOf(longBars));
    s.onBarClose(closeOf(longBars));

    const CandleSeries shortBars = laterShortSetup();
    feed(s, shortBars, closeOf(shortBars));
    s.onBarClose(closeOf(shortBars));

    const std::vector<Alert> h = s.history();
    TEST_ASSERT(h.size() == 1 && h[0].type == AlertType::SQUEEZE_SHORT, "oldest dropped");
    TEST_ASSERT(s.summary(closeOf(shortBars)).alerts == 2, "alert count unaffected");

    TEST_PASSED("history_limit");
}

bool test_reentrant_cycle_dropped() {
    ScalpSession s(testConfig());
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t now = closeOf(m1);

    CycleStatus inner = CycleStatus::RAN;
    s.setOnAlert([&](const Alert&) { inner = s.onBarClose(now + 500); });

    feed(s, m1, now);
    TEST_ASSERT(s.onBarClose(now) == CycleStatus::RAN, "outer cycle ran");
    TEST_ASSERT(inner == CycleStatus::BUSY, "inner cycle dropped");
    TEST_ASSERT(s.droppedCycles() == 1 && s.summary(now).dropped == 1, "drop counted");
    TEST_ASSERT(s.cycles() == 1, "only one cycle evaluated");

    TEST_PASSED("reentrant_cycle_dropped");
}

bool test_reset_refused_mid_cycle() {
    ScalpSession s(testConfig());
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t now = closeOf(m1);

    // Callbacks run while the cycle still holds the slot
    bool resetInCycle = true;
    s.setOnAlert([&](const Alert&) { resetInCycle = s.reset(); });

    feed(s, m1, now);
    TEST_ASSERT(s.onBarClose(now) == CycleStatus::RAN, "cycle ran");
    TEST_ASSERT(!resetInCycle, "reset refused while the cycle runs");
    TEST_ASSERT(s.history().size() == 1 && s.cycles() == 1, "cycle results kept");
    TEST_ASSERT(s.summary(now).director == DirectorState::BULL, "director state kept");
    TEST_ASSERT(s.summary(now).lastDirection == Direction::LONG, "cooldown state kept");
    TEST_ASSERT(s.droppedCycles() == 0, "refused reset is not a dropped cycle");

    TEST_ASSERT(s.reset(), "reset once the cycle is done");
    TEST_ASSERT(s.history().empty() && s.summary(now).lastDirection == Direction::NONE, "cleared");

    TEST_PASSED("reset_refused_mid_cycle");
}

bool test_callback_swap_in_callback() {
    ScalpSession s(testConfig());

    int first = 0, second = 0;
    s.setOnAlert([&](const Alert&) {
        ++first;
        s.setOnAlert([&](const Alert&) { ++second; });
    });

    const CandleSeries longBars = squeezeSetup(1);
    feed(s, longBars, closeOf(longBars));
    TEST_ASSERT(s.onBarClose(closeOf(longBars)) == CycleStatus::RAN, "long cycle");
    TEST_ASSERT(first == 1 && second == 0, "original callback ran");

    const CandleSeries shortBars = laterShortSetup();
    feed(s, shortBars, closeOf(shortBars));
    TEST_ASSERT(s.onBarClose(closeOf(shortBars)) == CycleStatus::RAN, "short cycle");
    TEST_ASSERT(first == 1 && second == 1, "replacement callback ran");

    TEST_PASSED("callback_swap_in_callback");
}

bool test_closed_bars_only() {
    ScalpSession s(testConfig());
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t close = closeOf(m1);

    feed(s, m1, close - 1);

    // One millisecond early: the breakout bar is still forming
    TEST_ASSERT(s.onBarClose(close - 1) == CycleStatus::RAN, "cycle on the prior bar");
    TEST_ASSERT(!s.currentAlert().has_value(), "no alert from a forming bar");

    TEST_ASSERT(s.onBarClose(close) == CycleStatus::RAN, "breakout bar closed");
    TEST_ASSERT(s.currentAlert().has_value(), "alert at the close");
    TEST_ASSERT(s.candleIndex() == 2, "two bars processed");

    TEST_PASSED("closed_bars_only");
}

bool test_stale_feed() {
    ScalpSession s(testConfig());
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t close = closeOf(m1);

    feed(s, m1, close);
    s.onBarClose(close);
    TEST_ASSERT(!s.isStale(Timeframe::M1) && !s.isStale(Timeframe::M5), "fresh feed");

    // Ten minutes on with no new 1m bar
    TEST_ASSERT(s.onBarClose(close + 10 * MIN_MS) == CycleStatus::DUPLICATE_BAR, "nothing new");

    CandleSeries more = m1;
    append(more, 110.05, 110.1, 110.0, 110.06, 100.0);
    feed(s, more, close + 10 * MIN_MS);
    TEST_ASSERT(s.onBarClose(close + 10 * MIN_MS) == CycleStatus::RAN, "new bar");
    TEST_ASSERT(s.isStale(Timeframe::M1), "1m behind the clock");
    TEST_ASSERT(!s.isStale(Timeframe::M5), "5m within three bars");

    TEST_PASSED("stale_feed");
}

int main() {
    std::cout << "=== Scalp Session Tests ===" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_no_data);
    RUN_TEST(test_alert_cycle);
    RUN_TEST(test_history_dismiss_reset);
    RUN_TEST(test_history_limit);
    RUN_TEST(test_reentrant_cycle_dropped);
    RUN_TEST(test_reset_refused_mid_cycle);
    RUN_TEST(test_callback_swap_in_callback);
    RUN_TEST(test_closed_bars_only);
    RUN_TEST(test_stale_feed);

    TEST_RESULTS();
}
