#pragma once
// =============================================================================
// AlertOrchestrator.hpp - One alert-or-nothing decision per 1m bar close
// =============================================================================
// Order of evaluation:
//   Director (cached) -> Validator -> Trap (cached) -> VWAP retest bookkeeping
//   -> warm-up gate
//   -> trap active ? fade confirmation : (chop / director CHOP veto
//      -> Trigger -> Cooldown -> Confidence)
//
// Pure with respect to its inputs: the carried state goes in through
// PipelineState and comes back out in CycleResult. "Now" is an argument.
// =============================================================================

#include <optional>
#include <string>

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/ChopFilter.hpp"
#include "scalp/signal/ConfidenceScorer.hpp"
#include "scalp/signal/CooldownGate.hpp"
#include "scalp/signal/Director.hpp"
#include "scalp/signal/SignalTypes.hpp"
#include "scalp/signal/TrapDetector.hpp"
#include "scalp/signal/Trigger.hpp"
#include "scalp/signal/Validator.hpp"

namespace Scalp {

struct PipelineState {
    std::optional<DirectorResult> director;
    TrapModeState trap;
    CooldownState cooldown;
};

struct CycleResult {
    std::optional<Alert> alert;
    DirectorResult director;
    ValidatorResult validator;
    TrapModeState trap;
    CooldownState cooldown;
    ChopResult chop;
    TriggerResult trigger;
    SuppressReason suppress = SuppressReason::NONE;
    std::string suppressText;

    PipelineState nextState() const {
        PipelineState s;
        s.director = director;
        s.trap = trap;
        s.cooldown = cooldown;
        return s;
    }
};

class AlertOrchestrator {
public:
    explicit AlertOrchestrator(const ScalpConfig& cfg);

    CycleResult evaluate(const CandleSeries& bars1m, const CandleSeries& bars2m,
                         const CandleSeries& bars5m, const PipelineState& previous,
                         int64_t candleIndex, int64_t now_ms) const;

    const ScalpConfig& config() const { return cfg_; }

private:
    double atrOrDefault(const CandleSeries& bars1m) const;
    void suppress(CycleResult& r, SuppressReason reason, std::string text) const;

    ScalpConfig cfg_;
    Director director_;
    Validator validator_;
    ChopFilter chop_;
    TrapDetector trap_;
    Trigger trigger_;
    ConfidenceScorer scorer_;
    CooldownGate cooldown_;
};

} // namespace Scalp
