#pragma once
// =============================================================================
// Trigger.hpp - 1m entry timing
// =============================================================================
// Fires only when director and validator agree on a side and all nine 1m
// checks hold for that side:
//   VWAP hysteresis, SuperTrend colour on the last bars, RVOL, ADX trending
//   and non-decreasing, RSI, EWO, outside 5m cloud, pivot, Bollinger expansion
// =============================================================================

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

class Trigger {
public:
    Trigger(const TriggerConfig& trigger, const ValidatorConfig& momentum, double adxTrend);

    TriggerResult evaluate(const CandleSeries& bars1m, const DirectorResult& director,
                           const ValidatorResult& validator, const TrapModeState& trap) const;

private:
    TriggerConfig cfg_;
    ValidatorConfig momentum_;   // SuperTrend / RSI / EWO / ADX settings shared with 2m
    double adxTrend_;
};

} // namespace Scalp
