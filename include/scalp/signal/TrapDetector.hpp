#pragma once
// =============================================================================
// TrapDetector.hpp - 1m liquidity-wick detection and fade confirmation
// =============================================================================
// A trap bar needs all of: volume spike, range spike, a high or low tagging a
// key level (pivots of the previous bar, Bollinger bands), and a rejection
// wick against the close. Once detected the trap stays active for
// durationCandles bars, overriding the squeeze pipeline, unless a fade is
// confirmed first.
// =============================================================================

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

class TrapDetector {
public:
    explicit TrapDetector(const TrapConfig& cfg);

    // candleIndex is the caller's running index of the last 1m bar
    TrapModeState evaluate(const CandleSeries& bars1m, int64_t candleIndex,
                           const TrapModeState& previous) const;

    FadeCheck confirmFade(const CandleSeries& bars1m, const TrapModeState& trap, double vwap) const;

private:
    TrapConfig cfg_;
};

} // namespace Scalp
