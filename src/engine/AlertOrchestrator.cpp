#include "scalp/engine/AlertOrchestrator.hpp"

#include <cstdio>
#include <utility>

#include "scalp/indicators/Atr.hpp"
#include "scalp/indicators/Vwap.hpp"

using namespace Scalp;

AlertOrchestrator::AlertOrchestrator(const ScalpConfig& cfg)
    : cfg_(cfg),
      director_(cfg.director),
      validator_(cfg.validator),
      chop_(cfg.chop),
      trap_(cfg.trap),
      trigger_(cfg.trigger, cfg.validator, cfg.validator.adxTrend),
      scorer_(cfg.trigger.strongBias, cfg.trigger.rvolThreshold,
              cfg.validator.adxTrend, cfg.risk.pushConfidence),
      cooldown_(cfg.cooldown) {}

double AlertOrchestrator::atrOrDefault(const CandleSeries& bars1m) const {
    const double atr = lastOr(computeAtr(bars1m, cfg_.risk.atrPeriod), 0.0);
    return atr > 0.0 ? atr : 1.0;
}

void AlertOrchestrator::suppress(CycleResult& r, SuppressReason reason, std::string text) const {
    r.alert.reset();
    r.suppress = reason;
    r.suppressText = std::move(text);
}

CycleResult AlertOrchestrator::evaluate(const CandleSeries& bars1m, const CandleSeries& bars2m,
                                        const CandleSeries& bars5m, const PipelineState& previous,
                                        int64_t candleIndex, int64_t now_ms) const {
    CycleResult r;
    char buf[160];

    r.director = director_.evaluate(bars5m, now_ms, previous.director);
    r.validator = validator_.evaluate(bars2m, bars1m, r.director);
    r.trap = trap_.evaluate(bars1m, candleIndex, previous.trap);

    // ---- VWAP retest bookkeeping ----
    const VwapResult vw = computeVwap(bars1m);
    const double price = bars1m.empty() ? 0.0 : bars1m.back().close;
    r.cooldown = cooldown_.noteVwapRetest(previous.cooldown, price, vw.vwap);

    // ---- Warm-up ----
    if (bars1m.size() < static_cast<size_t>(cfg_.trigger.minBars) ||
        bars2m.size() < static_cast<size_t>(cfg_.validator.minBars) ||
        bars5m.size() < static_cast<size_t>(cfg_.director.minBars)) {
        snprintf(buf, sizeof(buf), "Warming up: 1m=%zu 2m=%zu 5m=%zu bars",
                 bars1m.size(), bars2m.size(), bars5m.size());
        suppress(r, SuppressReason::WARMUP, buf);
        return r;
    }

    // ---- Trap mode overrides everything else ----
    if (r.trap.active) {
        const FadeCheck fade = trap_.confirmFade(bars1m, r.trap, vw.vwap);
        if (!fade.confirmed) {
            snprintf(buf, sizeof(buf), "Trap %s active until candle %lld",
                     trap_type_str(r.trap.type), static_cast<long long>(r.trap.expiresAt));
            suppress(r, SuppressReason::TRAP_PENDING, buf);
            return r;
        }

        const double atr = atrOrDefault(bars1m);
        const bool isLong = fade.direction == Direction::LONG;

        Alert a;
        a.type = isLong ? AlertType::TRAP_FADE_LONG : AlertType::TRAP_FADE_SHORT;
        a.id = std::string("trap-fade-") + direction_str(fade.direction) + "-" + std::to_string(now_ms);
        a.ts_ms = now_ms;
        a.confidence = cfg_.trap.fadeConfidence;
        a.shouldPush = true;
        a.director = r.director.state;
        a.validator = ValidatorState::NEUTRAL;
        a.triggerReason = fade.reason;
        a.explanation = std::string("Director: ") + director_state_str(r.director.state) +
                        " | Validator: n/a | Trigger: " + fade.reason;
        a.entryPrice = price;
        a.stopLoss = isLong ? r.trap.wickLow - cfg_.risk.fadeStopAtr * atr
                            : r.trap.wickHigh + cfg_.risk.fadeStopAtr * atr;
        a.targetPrice = isLong ? price + cfg_.risk.fadeTargetAtr * atr
                               : price - cfg_.risk.fadeTargetAtr * atr;
        a.holdTime = "3-8 min";

        r.alert = a;
        r.trap.active = false;   // resolved by the fade
        r.cooldown = CooldownGate::afterAlert(fade.direction, now_ms);
        return r;
    }

    // ---- Chop veto ----
    r.chop = chop_.evaluate(bars5m, bars2m, bars1m, r.director);
    if (r.chop.isChop) {
        suppress(r, SuppressReason::CHOP_FILTER, r.chop.text);
        return r;
    }
    if (r.director.state == DirectorState::CHOP) {
        snprintf(buf, sizeof(buf), "Director CHOP (bias %d)", r.director.biasScore);
        suppress(r, SuppressReason::DIRECTOR_CHOP, buf);
        return r;
    }

    // ---- Trigger ----
    r.trigger = trigger_.evaluate(bars1m, r.director, r.validator, r.trap);
    if (!r.trigger.valid) {
        snprintf(buf, sizeof(buf), "Trigger not met: %d/9 checks (validator %s)",
                 r.trigger.checks.count(), validator_state_str(r.validator.state));
        suppress(r, SuppressReason::NO_TRIGGER, buf);
        return r;
    }

    // ---- Cooldown ----
    const GateDecision gate = cooldown_.check(r.trigger.direction, r.cooldown, now_ms);
    if (!gate.allowed) {
        suppress(r, gate.reason, gate.text);
        return r;
    }

    // ---- Confidence + levels ----
    ConfidenceInputs in;
    in.biasScore = r.director.biasScore;
    in.validator = r.validator.state;
    in.checks = r.trigger.checks;
    in.rvol = r.trigger.rvol;
    in.adx = r.trigger.adx;
    in.adxRising = r.trigger.adx > r.trigger.prevAdx;
    const int confidence = scorer_.score(in);

    const double atr = atrOrDefault(bars1m);
    const bool isLong = r.trigger.direction == Direction::LONG;

    snprintf(buf, sizeof(buf), "%s + RVOL %.1fx", isLong ? "VWAP hold" : "VWAP loss", r.trigger.rvol);

    Alert a;
    a.type = isLong ? AlertType::SQUEEZE_LONG : AlertType::SQUEEZE_SHORT;
    a.id = std::string("squeeze-") + direction_str(r.trigger.direction) + "-" + std::to_string(now_ms);
    a.ts_ms = now_ms;
    a.confidence = confidence;
    a.shouldPush = scorer_.shouldPush(confidence);
    a.director = r.director.state;
    a.validator = r.validator.state;
    a.triggerReason = buf;
    a.explanation = std::string("Director: ") + director_state_str(r.director.state) +
                    " | Validator: " + validator_state_str(r.validator.state) +
                    " | Trigger: " + a.triggerReason;
    a.entryPrice = price;
    a.stopLoss = isLong ? price - cfg_.risk.squeezeStopAtr * atr : price + cfg_.risk.squeezeStopAtr * atr;
    a.targetPrice = isLong ? price + cfg_.risk.squeezeTargetAtr * atr : price - cfg_.risk.squeezeTargetAtr * atr;
    a.holdTime = "5-15 min";

    r.alert = a;
    r.cooldown = CooldownGate::afterAlert(r.trigger.direction, now_ms);
    return r;
}
