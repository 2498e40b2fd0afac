// =============================================================================
// ScalpEnums.hpp - UNIFIED ENUM DEFINITIONS
// =============================================================================
// PURPOSE: Single source of truth for every closed label the engine emits.
//
// Downstream consumers switch on these instead of comparing strings. Each
// enum has a *_str() helper for logs and the JSON codec.
// DO NOT DUPLICATE ENUMS ELSEWHERE
// =============================================================================
#pragma once

#include <cstdint>

namespace Scalp {

// =============================================================================
// TIMEFRAME
// =============================================================================
enum class Timeframe : uint8_t {
    M1 = 1,
    M2 = 2,
    M5 = 5
};

inline int64_t timeframe_ms(Timeframe tf) {
    return static_cast<int64_t>(tf) * 60LL * 1000LL;
}

inline const char* timeframe_str(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return "1m";
        case Timeframe::M2: return "2m";
        case Timeframe::M5: return "5m";
        default:            return "UNKNOWN";
    }
}

// =============================================================================
// PIPELINE STATES
// =============================================================================
enum class DirectorState : uint8_t {
    CHOP = 0,
    BULL = 1,
    BEAR = 2
};

inline const char* director_state_str(DirectorState s) {
    switch (s) {
        case DirectorState::CHOP: return "CHOP";
        case DirectorState::BULL: return "BULL";
        case DirectorState::BEAR: return "BEAR";
        default:                  return "UNKNOWN";
    }
}

enum class ValidatorState : uint8_t {
    NEUTRAL = 0,
    BULL    = 1,
    BEAR    = 2
};

inline const char* validator_state_str(ValidatorState s) {
    switch (s) {
        case ValidatorState::NEUTRAL: return "NEUTRAL";
        case ValidatorState::BULL:    return "BULL";
        case ValidatorState::BEAR:    return "BEAR";
        default:                      return "UNKNOWN";
    }
}

enum class Direction : uint8_t {
    NONE  = 0,
    LONG  = 1,
    SHORT = 2
};

inline const char* direction_str(Direction d) {
    switch (d) {
        case Direction::NONE:  return "NONE";
        case Direction::LONG:  return "LONG";
        case Direction::SHORT: return "SHORT";
        default:               return "UNKNOWN";
    }
}

enum class TrapType : uint8_t {
    NONE      = 0,
    UP_WICK   = 1,   // spike up rejected, bearish
    DOWN_WICK = 2    // spike down rejected, bullish
};

inline const char* trap_type_str(TrapType t) {
    switch (t) {
        case TrapType::NONE:      return "NONE";
        case TrapType::UP_WICK:   return "UP_WICK";
        case TrapType::DOWN_WICK: return "DOWN_WICK";
        default:                  return "UNKNOWN";
    }
}

enum class AlertType : uint8_t {
    SQUEEZE_LONG    = 0,
    SQUEEZE_SHORT   = 1,
    TRAP_FADE_LONG  = 2,
    TRAP_FADE_SHORT = 3
};

inline const char* alert_type_str(AlertType t) {
    switch (t) {
        case AlertType::SQUEEZE_LONG:    return "SQUEEZE_LONG";
        case AlertType::SQUEEZE_SHORT:   return "SQUEEZE_SHORT";
        case AlertType::TRAP_FADE_LONG:  return "TRAP_FADE_LONG";
        case AlertType::TRAP_FADE_SHORT: return "TRAP_FADE_SHORT";
        default:                         return "UNKNOWN";
    }
}

inline Direction alert_direction(AlertType t) {
    return (t == AlertType::SQUEEZE_LONG || t == AlertType::TRAP_FADE_LONG)
        ? Direction::LONG : Direction::SHORT;
}

inline bool is_squeeze(AlertType t) {
    return t == AlertType::SQUEEZE_LONG || t == AlertType::SQUEEZE_SHORT;
}

// =============================================================================
// SUPPRESS REASON - why a cycle produced no alert
// =============================================================================
enum class SuppressReason : uint8_t {
    NONE                   = 0,
    WARMUP                 = 1,   // not enough 1m history
    TRAP_PENDING           = 2,   // trap active, fade not confirmed
    CHOP_FILTER            = 3,   // chop veto fired
    DIRECTOR_CHOP          = 4,   // director has no bias
    NO_TRIGGER             = 5,   // trigger conditions not met
    OPPOSITE_COOLDOWN      = 6,   // opposite direction inside cooldown window
    SAME_DIRECTION_BLOCKED = 7    // same direction, no VWAP retest yet
};

inline const char* suppress_reason_str(SuppressReason r) {
    switch (r) {
        case SuppressReason::NONE:                   return "NONE";
        case SuppressReason::WARMUP:                 return "WARMUP";
        case SuppressReason::TRAP_PENDING:           return "TRAP_PENDING";
        case SuppressReason::CHOP_FILTER:            return "CHOP_FILTER";
        case SuppressReason::DIRECTOR_CHOP:          return "DIRECTOR_CHOP";
        case SuppressReason::NO_TRIGGER:             return "NO_TRIGGER";
        case SuppressReason::OPPOSITE_COOLDOWN:      return "OPPOSITE_COOLDOWN";
        case SuppressReason::SAME_DIRECTION_BLOCKED: return "SAME_DIRECTION_BLOCKED";
        default:                                     return "UNKNOWN";
    }
}

enum class ChopReason : uint8_t {
    NONE           = 0,
    INSIDE_CLOUD   = 1,
    ADX_FALLING_5M = 2,
    ADX_FALLING_2M = 3,
    VWAP_WHIPSAW   = 4,
    BAND_SQUEEZE   = 5
};

inline const char* chop_reason_str(ChopReason r) {
    switch (r) {
        case ChopReason::NONE:           return "NONE";
        case ChopReason::INSIDE_CLOUD:   return "INSIDE_CLOUD";
        case ChopReason::ADX_FALLING_5M: return "ADX_FALLING_5M";
        case ChopReason::ADX_FALLING_2M: return "ADX_FALLING_2M";
        case ChopReason::VWAP_WHIPSAW:   return "VWAP_WHIPSAW";
        case ChopReason::BAND_SQUEEZE:   return "BAND_SQUEEZE";
        default:                         return "UNKNOWN";
    }
}

// =============================================================================
// INDICATOR LABELS
// =============================================================================
enum class TrendSignal : uint8_t {
    HOLD = 0,
    BUY  = 1,
    SELL = 2
};

inline const char* trend_signal_str(TrendSignal s) {
    switch (s) {
        case TrendSignal::HOLD: return "HOLD";
        case TrendSignal::BUY:  return "BUY";
        case TrendSignal::SELL: return "SELL";
        default:                return "UNKNOWN";
    }
}

enum class TrendDirection : uint8_t {
    NEUTRAL = 0,
    BULLISH = 1,
    BEARISH = 2
};

inline const char* trend_direction_str(TrendDirection d) {
    switch (d) {
        case TrendDirection::NEUTRAL: return "NEUTRAL";
        case TrendDirection::BULLISH: return "BULLISH";
        case TrendDirection::BEARISH: return "BEARISH";
        default:                      return "UNKNOWN";
    }
}

enum class TrendStrength : uint8_t {
    NO_TREND    = 0,   // ADX < 15
    WEAK        = 1,   // 15..25
    MODERATE    = 2,   // 25..40
    STRONG      = 3,   // 40..50
    VERY_STRONG = 4    // >= 50
};

inline const char* trend_strength_str(TrendStrength s) {
    switch (s) {
        case TrendStrength::NO_TREND:    return "NO_TREND";
        case TrendStrength::WEAK:        return "WEAK";
        case TrendStrength::MODERATE:    return "MODERATE";
        case TrendStrength::STRONG:      return "STRONG";
        case TrendStrength::VERY_STRONG: return "VERY_STRONG";
        default:                         return "UNKNOWN";
    }
}

enum class VwapPosition : uint8_t {
    AT_VWAP     = 0,
    ABOVE_VWAP  = 1,
    ABOVE_UPPER = 2,
    BELOW_VWAP  = 3,
    BELOW_LOWER = 4
};

inline const char* vwap_position_str(VwapPosition p) {
    switch (p) {
        case VwapPosition::AT_VWAP:     return "AT_VWAP";
        case VwapPosition::ABOVE_VWAP:  return "ABOVE_VWAP";
        case VwapPosition::ABOVE_UPPER: return "ABOVE_UPPER";
        case VwapPosition::BELOW_VWAP:  return "BELOW_VWAP";
        case VwapPosition::BELOW_LOWER: return "BELOW_LOWER";
        default:                        return "UNKNOWN";
    }
}

enum class RunSignal : uint8_t {
    HOLD         = 0,
    UPWARD_RUN   = 1,
    DOWNWARD_RUN = 2
};

inline const char* run_signal_str(RunSignal s) {
    switch (s) {
        case RunSignal::HOLD:         return "HOLD";
        case RunSignal::UPWARD_RUN:   return "UPWARD_RUN";
        case RunSignal::DOWNWARD_RUN: return "DOWNWARD_RUN";
        default:                      return "UNKNOWN";
    }
}

enum class CandleBias : uint8_t {
    NEUTRAL = 0,
    UP      = 1,
    DOWN    = 2
};

inline const char* candle_bias_str(CandleBias b) {
    switch (b) {
        case CandleBias::NEUTRAL: return "NEUTRAL";
        case CandleBias::UP:      return "UP";
        case CandleBias::DOWN:    return "DOWN";
        default:                  return "UNKNOWN";
    }
}

enum class BounceSignal : uint8_t {
    NONE        = 0,
    STRONG_BUY  = 1,
    BUY         = 2,
    SELL        = 3,
    STRONG_SELL = 4
};

inline const char* bounce_signal_str(BounceSignal s) {
    switch (s) {
        case BounceSignal::NONE:        return "NONE";
        case BounceSignal::STRONG_BUY:  return "STRONG_BUY";
        case BounceSignal::BUY:         return "BUY";
        case BounceSignal::SELL:        return "SELL";
        case BounceSignal::STRONG_SELL: return "STRONG_SELL";
        default:                        return "UNKNOWN";
    }
}

// =============================================================================
// SESSION
// =============================================================================
enum class CycleStatus : uint8_t {
    RAN           = 0,
    BUSY          = 1,   // another cycle in flight, dropped
    DUPLICATE_BAR = 2,   // latest 1m bar already processed
    NO_DATA       = 3    // no closed 1m bar yet
};

inline const char* cycle_status_str(CycleStatus s) {
    switch (s) {
        case CycleStatus::RAN:           return "RAN";
        case CycleStatus::BUSY:          return "BUSY";
        case CycleStatus::DUPLICATE_BAR: return "DUPLICATE_BAR";
        case CycleStatus::NO_DATA:       return "NO_DATA";
        default:                         return "UNKNOWN";
    }
}

} // namespace Scalp
