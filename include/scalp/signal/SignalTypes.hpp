#pragma once
// =============================================================================
// SignalTypes.hpp - Stage results threaded through the scalp pipeline
// =============================================================================
// DirectorResult, TrapModeState and CooldownState are carried across cycles
// by the caller: the orchestrator takes the previous version in and hands the
// next one back. Everything else is rebuilt every cycle.
// =============================================================================

#include <cstdint>
#include <string>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

// =============================================================================
// DIRECTOR (5m)
// =============================================================================
struct DirectorVotes {
    int supertrend = 0;   // each vote is -1, 0 or +1
    int vwap = 0;
    int rsi = 0;
    int ewo = 0;
    int adx = 0;
    int ichimoku = 0;

    int sum() const { return supertrend + vwap + rsi + ewo + adx + ichimoku; }
};

struct DirectorResult {
    DirectorState state = DirectorState::CHOP;
    int biasScore = 0;            // [-6, 6]
    DirectorVotes votes;
    int64_t lockedUntil = 0;      // next 5m boundary, 0 = not computed
    int64_t computedAt = 0;
    bool insideCloud = false;
    bool adxConflict = false;     // DI direction disagreed with SuperTrend

    // Context for explanations
    double rsi = 50.0;
    double adx = 0.0;
    double vwap = 0.0;
};

// =============================================================================
// VALIDATOR (2m)
// =============================================================================
struct ValidatorChecks {
    bool vwap = false;
    bool supertrend = false;
    bool rsi = false;
    bool ewo = false;
    bool adx = false;

    bool all() const { return vwap && supertrend && rsi && ewo && adx; }
    int count() const { return int(vwap) + int(supertrend) + int(rsi) + int(ewo) + int(adx); }
};

struct ValidatorResult {
    ValidatorState state = ValidatorState::NEUTRAL;
    bool longValid = false;
    bool shortValid = false;
    ValidatorChecks longChecks;
    ValidatorChecks shortChecks;
    bool adxFromOneMinute = false;   // 2m history too short, 1m ADX used
};

// =============================================================================
// CHOP FILTER
// =============================================================================
struct ChopResult {
    bool isChop = false;
    ChopReason reason = ChopReason::NONE;
    std::string text;
};

// =============================================================================
// TRAP MODE (1m)
// =============================================================================
struct TrapModeState {
    bool active = false;
    TrapType type = TrapType::NONE;
    int64_t detectedAt = 0;           // candle index of the trap bar
    int64_t expiresAt = 0;            // candle index; active while index < expiresAt
    double wickHigh = 0.0;
    double wickLow = 0.0;
    Candle trapCandle;
    std::string level;                // key level that was tagged
};

struct FadeCheck {
    bool confirmed = false;
    Direction direction = Direction::NONE;
    std::string reason;
};

// =============================================================================
// TRIGGER (1m)
// =============================================================================
struct TriggerChecks {
    bool vwapHysteresis = false;
    bool supertrend = false;
    bool rvol = false;
    bool adx = false;
    bool rsi = false;
    bool ewo = false;
    bool notInCloud = false;
    bool pivot = false;
    bool bollinger = false;

    bool all() const {
        return vwapHysteresis && supertrend && rvol && adx && rsi &&
               ewo && notInCloud && pivot && bollinger;
    }
    int count() const {
        return int(vwapHysteresis) + int(supertrend) + int(rvol) + int(adx) + int(rsi) +
               int(ewo) + int(notInCloud) + int(pivot) + int(bollinger);
    }
};

struct TriggerResult {
    bool valid = false;
    Direction direction = Direction::NONE;
    TriggerChecks checks;       // the side that fired, or the side the director leans to

    // Measured values, reused by the confidence scorer and alert text
    double rvol = 1.0;
    double adx = 0.0;
    double prevAdx = 0.0;
    double rsi = 50.0;
    double vwap = 0.0;
};

// =============================================================================
// COOLDOWN
// =============================================================================
struct CooldownState {
    Direction lastDirection = Direction::NONE;
    int64_t lastAlertTs = 0;
    bool vwapRetestSinceLastAlert = false;
    bool sameDirectionBlocked = false;
};

struct GateDecision {
    bool allowed = true;
    SuppressReason reason = SuppressReason::NONE;
    std::string text;
};

// =============================================================================
// ALERT
// =============================================================================
struct Alert {
    std::string id;
    AlertType type = AlertType::SQUEEZE_LONG;
    int64_t ts_ms = 0;
    int confidence = 0;
    bool shouldPush = false;
    DirectorState director = DirectorState::CHOP;
    ValidatorState validator = ValidatorState::NEUTRAL;
    std::string triggerReason;
    std::string explanation;
    double entryPrice = 0.0;
    double stopLoss = 0.0;
    double targetPrice = 0.0;
    std::string holdTime;

    Direction direction() const { return alert_direction(type); }
};

} // namespace Scalp
