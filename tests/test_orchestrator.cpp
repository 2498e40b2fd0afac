// ============================================================================
// test_orchestrator.cpp - Full bar-close cycle: gates, alerts, carried state
// ============================================================================

#include <iostream>
#include <string>

#include "TestHarness.hpp"
#include "SyntheticBars.hpp"

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/engine/AlertOrchestrator.hpp"
#include "scalp/indicators/Atr.hpp"

using namespace Scalp;
using namespace ScalpTest;

namespace {

const ScalpConfig kCfg;

CycleResult runCycle(const AlertOrchestrator& orch, const CandleSeries& m1,
                     const PipelineState& prev, int64_t index, int64_t now) {
    return orch.evaluate(m1, aggregateBars(m1, Timeframe::M2), aggregateBars(m1, Timeframe::M5),
                         prev, index, now);
}

CycleResult runCycle(const AlertOrchestrator& orch, const CandleSeries& m1,
                     const PipelineState& prev = PipelineState{}) {
    return runCycle(orch, m1, prev, static_cast<int64_t>(m1.size()), closeOf(m1));
}

double lastAtr(const CandleSeries& m1) {
    return lastOr(computeAtr(m1, kCfg.risk.atrPeriod), 0.0);
}

} // namespace

bool test_warmup() {
    const AlertOrchestrator orch(kCfg);

    const CandleSeries m1 = stairs(29, 100.0, 0.10, 0.25, 5);
    const CycleResult r = runCycle(orch, m1);
    TEST_ASSERT(!r.alert, "no alert while warming up");
    TEST_ASSERT(r.suppress == SuppressReason::WARMUP, "warm-up suppression");
    TEST_ASSERT(r.suppressText == "Warming up: 1m=29 2m=15 5m=6 bars", "bar counts reported");

    // Enough 1m and 2m history but only 51 5m bars
    const CandleSeries full = squeezeSetup(1);
    CandleSeries m5 = aggregateBars(full, Timeframe::M5);
    m5.erase(m5.begin(), m5.begin() + 9);
    const CycleResult r5 = orch.evaluate(full, aggregateBars(full, Timeframe::M2), m5,
                                         PipelineState{}, 300, closeOf(full));
    TEST_ASSERT(r5.suppress == SuppressReason::WARMUP, "5m history gates too");

    TEST_PASSED("warmup");
}

bool test_squeeze_long() {
    const AlertOrchestrator orch(kCfg);
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t now = closeOf(m1);

    const CycleResult r = runCycle(orch, m1);
    TEST_ASSERT(r.alert.has_value(), "alert produced");
    TEST_ASSERT(r.suppress == SuppressReason::NONE, "nothing suppressed");

    const Alert& a = *r.alert;
    TEST_ASSERT(a.type == AlertType::SQUEEZE_LONG && a.direction() == Direction::LONG, "squeeze long");
    TEST_ASSERT(a.id == "squeeze-LONG-" + std::to_string(now), "id carries direction and time");
    TEST_ASSERT(a.ts_ms == now, "stamped at now");
    TEST_ASSERT(a.confidence == 95 && a.shouldPush, "full confidence pushes");
    TEST_ASSERT(a.director == DirectorState::BULL && a.validator == ValidatorState::BULL, "stage states");
    TEST_ASSERT(a.triggerReason == "VWAP hold + RVOL 3.0x", "trigger reason");
    TEST_ASSERT(a.explanation == "Director: BULL | Validator: BULL | Trigger: VWAP hold + RVOL 3.0x",
                "explanation");
    TEST_ASSERT(a.holdTime == "5-15 min", "hold time");

    const double atr = lastAtr(m1);
    TEST_ASSERT(atr > 0.0, "ATR available");
    TEST_ASSERT(approx(a.entryPrice, 110.05, 1e-6), "entry at last close");
    TEST_ASSERT(approx(a.stopLoss, a.entryPrice - 0.5 * atr), "stop half an ATR below");
    TEST_ASSERT(approx(a.targetPrice, a.entryPrice + 1.0 * atr), "target one ATR above");

    // Cooldown recorded for the next cycle
    TEST_ASSERT(r.cooldown.lastDirection == Direction::LONG && r.cooldown.lastAlertTs == now, "cooldown set");
    TEST_ASSERT(r.cooldown.sameDirectionBlocked, "same direction blocked");
    TEST_ASSERT(r.director.lockedUntil == now + 5 * MIN_MS, "director locked to next 5m boundary");

    TEST_PASSED("squeeze_long");
}

bool test_squeeze_short() {
    const AlertOrchestrator orch(kCfg);
    const CandleSeries m1 = squeezeSetup(-1);
    const int64_t now = closeOf(m1);

    const CycleResult r = runCycle(orch, m1);
    TEST_ASSERT(r.alert.has_value(), "alert produced");

    const Alert& a = *r.alert;
    TEST_ASSERT(a.type == AlertType::SQUEEZE_SHORT, "squeeze short");
    TEST_ASSERT(a.id == "squeeze-SHORT-" + std::to_string(now), "short id");
    TEST_ASSERT(a.triggerReason == "VWAP loss + RVOL 3.0x", "short reason");
    TEST_ASSERT(approx(a.entryPrice, 89.95, 1e-6), "entry");
    TEST_ASSERT(a.stopLoss > a.entryPrice && a.targetPrice < a.entryPrice, "levels inverted for shorts");
    TEST_ASSERT(a.director == DirectorState::BEAR, "BEAR director");

    TEST_PASSED("squeeze_short");
}

bool test_cooldown_suppression() {
    const AlertOrchestrator orch(kCfg);
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t now = closeOf(m1);

    PipelineState prev;
    prev.cooldown = CooldownGate::afterAlert(Direction::SHORT, now - 60000);
    CycleResult r = runCycle(orch, m1, prev);
    TEST_ASSERT(!r.alert && r.suppress == SuppressReason::OPPOSITE_COOLDOWN, "opposite cooldown");
    TEST_ASSERT(r.suppressText == "Opposite direction cooldown: 120s remaining", "remaining seconds");
    TEST_ASSERT(r.trigger.valid, "trigger itself was valid");

    prev.cooldown = CooldownGate::afterAlert(Direction::LONG, now - 60000);
    r = runCycle(orch, m1, prev);
    TEST_ASSERT(!r.alert && r.suppress == SuppressReason::SAME_DIRECTION_BLOCKED, "no VWAP retest");

    prev.cooldown.vwapRetestSinceLastAlert = true;
    prev.cooldown.sameDirectionBlocked = false;
    r = runCycle(orch, m1, prev);
    TEST_ASSERT(r.alert.has_value(), "retest clears the block");

    prev.cooldown = CooldownGate::afterAlert(Direction::SHORT, now - 180000);
    r = runCycle(orch, m1, prev);
    TEST_ASSERT(r.alert.has_value() && r.alert->type == AlertType::SQUEEZE_LONG, "window elapsed");
    TEST_ASSERT(r.cooldown.lastDirection == Direction::LONG, "cooldown flipped to LONG");

    TEST_PASSED("cooldown_suppression");
}

bool test_director_lock() {
    const AlertOrchestrator orch(kCfg);
    const CandleSeries m1 = squeezeSetup(1);
    const int64_t now = closeOf(m1);

    // Locked CHOP from earlier in the 5m window wins over the fresh bars
    DirectorResult locked;
    locked.state = DirectorState::CHOP;
    locked.biasScore = 1;
    locked.lockedUntil = now + 1;
    PipelineState prev;
    prev.director = locked;

    const CycleResult r = runCycle(orch, m1, prev);
    TEST_ASSERT(!r.alert, "no alert under a CHOP director");
    TEST_ASSERT(r.suppress == SuppressReason::DIRECTOR_CHOP, "director chop");
    TEST_ASSERT(r.suppressText == "Director CHOP (bias 1)", "bias reported");

    // Once the lock lapses the bars are re-read
    prev.director->lockedUntil = now;
    const CycleResult fresh = runCycle(orch, m1, prev);
    TEST_ASSERT(fresh.director.state == DirectorState::BULL && fresh.alert.has_value(), "recomputed");

    TEST_PASSED("director_lock");
}

bool test_chop_filter() {
    const AlertOrchestrator orch(kCfg);
    const CandleSeries m1 = tightRange(300);
    const int64_t now = closeOf(m1);

    CycleResult r = runCycle(orch, m1);
    TEST_ASSERT(!r.alert && r.suppress == SuppressReason::CHOP_FILTER, "chop veto");
    TEST_ASSERT(r.chop.reason == ChopReason::VWAP_WHIPSAW, "whipsaw");
    TEST_ASSERT(r.suppressText == "VWAP crossed 9 times in last 10 min", "cross count");

    // Veto applies even when a trending director is still locked in
    DirectorResult bull;
    bull.state = DirectorState::BULL;
    bull.biasScore = 5;
    bull.lockedUntil = now + 60000;
    PipelineState prev;
    prev.director = bull;
    r = runCycle(orch, m1, prev);
    TEST_ASSERT(!r.alert && r.suppress == SuppressReason::CHOP_FILTER, "chop beats BULL director");

    TEST_PASSED("chop_filter");
}

bool test_trap_fade() {
    const AlertOrchestrator orch(kCfg);

    CandleSeries m1 = flatBase(300);
    upWickTrap(m1);

    const int64_t trapIdx = 301;
    CycleResult r = runCycle(orch, m1, PipelineState{}, trapIdx, closeOf(m1));
    TEST_ASSERT(!r.alert, "trap bar itself does not alert");
    TEST_ASSERT(r.trap.active && r.trap.type == TrapType::UP_WICK, "trap entered");
    TEST_ASSERT(r.suppress == SuppressReason::TRAP_PENDING, "waiting for the fade");
    TEST_ASSERT(r.suppressText == "Trap UP_WICK active until candle 304", "pending text");

    append(m1, 98.0, 98.5, 97.0, 97.5, 100.0);
    const int64_t now = closeOf(m1);
    r = runCycle(orch, m1, r.nextState(), trapIdx + 1, now);
    TEST_ASSERT(r.alert.has_value(), "fade alert");

    const Alert& a = *r.alert;
    TEST_ASSERT(a.type == AlertType::TRAP_FADE_SHORT, "fade short");
    TEST_ASSERT(a.id == "trap-fade-SHORT-" + std::to_string(now), "fade id");
    TEST_ASSERT(a.confidence == 75 && a.shouldPush, "fixed confidence, always pushed");
    TEST_ASSERT(a.validator == ValidatorState::NEUTRAL, "validator not consulted");
    TEST_ASSERT(a.triggerReason == "Liquidity trap + VWAP reject", "fade reason");
    TEST_ASSERT(a.explanation == std::string("Director: ") + director_state_str(r.director.state) +
                                     " | Validator: n/a | Trigger: Liquidity trap + VWAP reject",
                "fade explanation");
    TEST_ASSERT(a.holdTime == "3-8 min", "fade hold time");

    const double atr = lastAtr(m1);
    TEST_ASSERT(approx(atr, 2.1644444444, 1e-6), "ATR over the trap");
    TEST_ASSERT(approx(a.entryPrice, 97.5), "entry");
    TEST_ASSERT(approx(a.stopLoss, 101.05 + 0.3 * atr), "stop beyond the wick");
    TEST_ASSERT(approx(a.targetPrice, 97.5 - 0.8 * atr), "target");

    TEST_ASSERT(!r.trap.active, "fade resolves the trap");
    TEST_ASSERT(r.cooldown.lastDirection == Direction::SHORT, "cooldown recorded");

    TEST_PASSED("trap_fade");
}

bool test_trap_expiry() {
    const AlertOrchestrator orch(kCfg);

    CandleSeries m1 = flatBase(300);
    upWickTrap(m1);

    const int64_t trapIdx = 301;
    CycleResult r = runCycle(orch, m1, PipelineState{}, trapIdx, closeOf(m1));
    TEST_ASSERT(r.trap.active, "trap entered");

    // Green follow-through never confirms the fade
    for (int k = 0; k < 3; ++k) {
        append(m1, 98.0 + 0.1 * k, 98.8 + 0.1 * k, 97.9 + 0.1 * k, 98.6 + 0.1 * k, 100.0);
        r = runCycle(orch, m1, r.nextState(), trapIdx + 1 + k, closeOf(m1));
        TEST_ASSERT(!r.alert, "no alert while the trap plays out");
        if (k < 2) {
            TEST_ASSERT(r.suppress == SuppressReason::TRAP_PENDING, "still pending");
        }
    }

    TEST_ASSERT(!r.trap.active, "trap expired after three candles");
    TEST_ASSERT(r.suppress != SuppressReason::TRAP_PENDING, "normal gates again");

    TEST_PASSED("trap_expiry");
}

bool test_bar_by_bar() {
    const AlertOrchestrator orch(kCfg);
    const CandleSeries full = squeezeSetup(1);

    PipelineState state;
    int alerts = 0;
    CycleResult r;
    for (size_t n = 1; n <= full.size(); ++n) {
        const CandleSeries m1(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(n));
        r = runCycle(orch, m1, state, static_cast<int64_t>(n), closeOf(m1));
        if (r.alert) ++alerts;
        state = r.nextState();
    }

    TEST_ASSERT(alerts == 1, "exactly one alert");
    TEST_ASSERT(r.alert.has_value() && r.alert->type == AlertType::SQUEEZE_LONG, "on the breakout bar");

    TEST_PASSED("bar_by_bar");
}

int main() {
    std::cout << "=== Alert Orchestrator Tests ===" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_warmup);
    RUN_TEST(test_squeeze_long);
    RUN_TEST(test_squeeze_short);
    RUN_TEST(test_cooldown_suppression);
    RUN_TEST(test_director_lock);
    RUN_TEST(test_chop_filter);
    RUN_TEST(test_trap_fade);
    RUN_TEST(test_trap_expiry);
    RUN_TEST(test_bar_by_bar);

    TEST_RESULTS();
}
