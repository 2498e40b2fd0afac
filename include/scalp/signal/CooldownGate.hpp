#pragma once

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

// Cross-cycle re-alert suppression.
//   opposite direction: blocked for oppositeMs after the last alert
//   same direction:     blocked until a close within retestProximity of VWAP
class CooldownGate {
public:
    explicit CooldownGate(const CooldownConfig& cfg);

    // Marks the VWAP retest when the last close sits on VWAP and an alert exists
    CooldownState noteVwapRetest(const CooldownState& state, double close, double vwap) const;

    GateDecision check(Direction dir, const CooldownState& state, int64_t now_ms) const;

    static CooldownState afterAlert(Direction dir, int64_t now_ms);

    // Whole seconds left on the opposite-direction window, 0 when clear
    int64_t oppositeRemainingSec(const CooldownState& state, int64_t now_ms) const;

private:
    CooldownConfig cfg_;
};

} // namespace Scalp
