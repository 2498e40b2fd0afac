#pragma once
// =============================================================================
// Director.hpp - 5m bias classifier
// =============================================================================
// Six ternary votes (SuperTrend, VWAP side, RSI, EWO, ADX, Ichimoku) summed
// into a bias score. The result is locked until the next 5-minute boundary;
// inside that window the previous result is returned untouched.
// =============================================================================

#include <optional>

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

class Director {
public:
    explicit Director(const DirectorConfig& cfg);

    DirectorResult evaluate(const CandleSeries& bars5m, int64_t now_ms,
                            const std::optional<DirectorResult>& previous) const;

    // First lock boundary strictly after now
    int64_t nextBoundary(int64_t now_ms) const;

private:
    DirectorConfig cfg_;
};

} // namespace Scalp
