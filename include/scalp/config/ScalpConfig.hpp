#pragma once
// =============================================================================
// ScalpConfig.hpp - Pipeline thresholds
// =============================================================================
// Defaults are the production scalp settings. Any key present in the INI
// overrides its default; see config/scalp.ini for the full list.
// =============================================================================

#include <cstdint>
#include <string>

#include "scalp/config/ConfigLoader.hpp"

namespace Scalp {

// =============================================================================
// DIRECTOR (5m)
// =============================================================================
struct DirectorConfig {
    int    minBars            = 52;
    int    supertrendPeriod   = 10;
    double supertrendMult     = 3.0;
    int    rsiPeriod          = 14;
    double rsiBull            = 55.0;
    double rsiBear            = 45.0;
    int    ewoShort           = 5;
    int    ewoLong            = 35;
    int    adxPeriod          = 14;
    double adxTrend           = 18.0;
    int    tenkan             = 9;
    int    kijun              = 26;
    int    senkouB            = 52;
    int    biasThreshold      = 3;
    int    lockMinutes        = 5;
};

// =============================================================================
// VALIDATOR (2m)
// =============================================================================
struct ValidatorConfig {
    int    minBars            = 30;
    int    supertrendPeriod   = 7;
    double supertrendMult     = 2.5;
    int    rsiPeriod          = 14;
    double rsiLong            = 52.0;
    double rsiShort           = 48.0;
    int    ewoShort           = 5;
    int    ewoLong            = 35;
    int    adxPeriod          = 14;
    int    adxMinBars         = 20;
    double adxTrend           = 18.0;
};

// =============================================================================
// TRIGGER (1m)
// =============================================================================
struct TriggerConfig {
    int    minBars            = 30;
    int    vwapHysteresis     = 2;     // closes that must sit on the VWAP side
    int    rvolLookback       = 20;
    double rvolThreshold      = 1.7;
    int    bbPeriod           = 20;
    double bbMult             = 2.0;
    double bbExpansion        = 1.1;
    int    bbExpansionBars    = 4;     // compare against width this many bars back
    int    strongBias         = 4;     // |biasScore| that earns the bias points
};

// =============================================================================
// CHOP FILTER
// =============================================================================
struct ChopConfig {
    int    adxPeriod          = 14;
    double adxThreshold       = 16.0;
    int    adxMinBars         = 20;
    int    vwapCrossLookback  = 10;
    int    vwapCrossMax       = 3;
    double bandwidthPct       = 0.01;
    double vwapProximity      = 0.001;
};

// =============================================================================
// TRAP MODE
// =============================================================================
struct TrapConfig {
    int    lookback           = 20;
    double volumeMult         = 2.0;
    double rangeMult          = 1.6;
    double levelTolerance     = 0.001;
    double wickPct            = 0.30;
    int    durationCandles    = 3;
    int    fadeConfidence     = 75;
    double fadeRsi            = 50.0;
};

// =============================================================================
// COOLDOWN
// =============================================================================
struct CooldownConfig {
    int64_t oppositeMs        = 180000;
    double  retestProximity   = 0.001;
};

// =============================================================================
// RISK (levels attached to an alert)
// =============================================================================
struct RiskConfig {
    int    atrPeriod          = 14;
    double squeezeStopAtr     = 0.5;
    double squeezeTargetAtr   = 1.0;
    double fadeStopAtr        = 0.3;
    double fadeTargetAtr      = 0.8;
    int    pushConfidence     = 72;
};

// =============================================================================
// SESSION
// =============================================================================
struct SessionConfig {
    std::string symbol        = "UNKNOWN";
    int    historySize        = 50;
    int    staleAfterBars     = 3;
};

struct LoggingConfig {
    bool   logSuppressed      = false;
    bool   logAlerts          = true;
};

// =============================================================================
// ScalpConfig - everything above, loadable from INI
// =============================================================================
struct ScalpConfig {
    DirectorConfig  director;
    ValidatorConfig validator;
    TriggerConfig   trigger;
    ChopConfig      chop;
    TrapConfig      trap;
    CooldownConfig  cooldown;
    RiskConfig      risk;
    SessionConfig   session;
    LoggingConfig   logging;

    // Defaults overridden by whatever the loader holds
    static ScalpConfig fromLoader(const ConfigLoader& cfg);

    // Convenience: load an INI file, defaults for anything missing.
    // Returns false (and leaves out at defaults) when the file is unreadable.
    static bool fromFile(const std::string& path, ScalpConfig& out);

    bool isValid() const;
    void print() const;
};

} // namespace Scalp
