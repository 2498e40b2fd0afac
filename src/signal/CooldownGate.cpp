#include "scalp/signal/CooldownGate.hpp"

#include <cmath>
#include <string>

using namespace Scalp;

CooldownGate::CooldownGate(const CooldownConfig& cfg)
    : cfg_(cfg) {}

CooldownState CooldownGate::noteVwapRetest(const CooldownState& state, double close, double vwap) const {
    CooldownState next = state;
    if (state.lastDirection == Direction::NONE || vwap <= 0.0) return next;
    if (std::abs(close - vwap) / vwap < cfg_.retestProximity) {
        next.vwapRetestSinceLastAlert = true;
        next.sameDirectionBlocked = false;
    }
    return next;
}

int64_t CooldownGate::oppositeRemainingSec(const CooldownState& state, int64_t now_ms) const {
    if (state.lastDirection == Direction::NONE) return 0;
    const int64_t left = cfg_.oppositeMs - (now_ms - state.lastAlertTs);
    if (left <= 0) return 0;
    return (left + 999) / 1000;
}

GateDecision CooldownGate::check(Direction dir, const CooldownState& state, int64_t now_ms) const {
    GateDecision d;
    if (state.lastDirection == Direction::NONE) return d;

    if (state.lastDirection != dir && now_ms - state.lastAlertTs < cfg_.oppositeMs) {
        d.allowed = false;
        d.reason = SuppressReason::OPPOSITE_COOLDOWN;
        d.text = "Opposite direction cooldown: " +
                 std::to_string(oppositeRemainingSec(state, now_ms)) + "s remaining";
        return d;
    }

    if (state.lastDirection == dir && !state.vwapRetestSinceLastAlert) {
        d.allowed = false;
        d.reason = SuppressReason::SAME_DIRECTION_BLOCKED;
        d.text = "Same direction blocked until VWAP retest";
    }
    return d;
}

CooldownState CooldownGate::afterAlert(Direction dir, int64_t now_ms) {
    CooldownState s;
    s.lastDirection = dir;
    s.lastAlertTs = now_ms;
    s.vwapRetestSinceLastAlert = false;
    s.sameDirectionBlocked = true;
    return s;
}
