#include "scalp/config/ScalpConfig.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

using namespace Scalp;

ScalpConfig ScalpConfig::fromLoader(const ConfigLoader& cfg) {
    ScalpConfig c;

    DirectorConfig& d = c.director;
    d.minBars          = cfg.getInt("director", "min_bars", d.minBars);
    d.supertrendPeriod = cfg.getInt("director", "supertrend_period", d.supertrendPeriod);
    d.supertrendMult   = cfg.getDouble("director", "supertrend_mult", d.supertrendMult);
    d.rsiPeriod        = cfg.getInt("director", "rsi_period", d.rsiPeriod);
    d.rsiBull          = cfg.getDouble("director", "rsi_bull", d.rsiBull);
    d.rsiBear          = cfg.getDouble("director", "rsi_bear", d.rsiBear);
    d.ewoShort         = cfg.getInt("director", "ewo_short", d.ewoShort);
    d.ewoLong          = cfg.getInt("director", "ewo_long", d.ewoLong);
    d.adxPeriod        = cfg.getInt("director", "adx_period", d.adxPeriod);
    d.adxTrend         = cfg.getDouble("director", "adx_trend", d.adxTrend);
    d.tenkan           = cfg.getInt("director", "ichimoku_tenkan", d.tenkan);
    d.kijun            = cfg.getInt("director", "ichimoku_kijun", d.kijun);
    d.senkouB          = cfg.getInt("director", "ichimoku_senkou_b", d.senkouB);
    d.biasThreshold    = cfg.getInt("director", "bias_threshold", d.biasThreshold);
    d.lockMinutes      = cfg.getInt("director", "lock_minutes", d.lockMinutes);

    ValidatorConfig& v = c.validator;
    v.minBars          = cfg.getInt("validator", "min_bars", v.minBars);
    v.supertrendPeriod = cfg.getInt("validator", "supertrend_period", v.supertrendPeriod);
    v.supertrendMult   = cfg.getDouble("validator", "supertrend_mult", v.supertrendMult);
    v.rsiPeriod        = cfg.getInt("validator", "rsi_period", v.rsiPeriod);
    v.rsiLong          = cfg.getDouble("validator", "rsi_long", v.rsiLong);
    v.rsiShort         = cfg.getDouble("validator", "rsi_short", v.rsiShort);
    v.ewoShort         = cfg.getInt("validator", "ewo_short", v.ewoShort);
    v.ewoLong          = cfg.getInt("validator", "ewo_long", v.ewoLong);
    v.adxPeriod        = cfg.getInt("validator", "adx_period", v.adxPeriod);
    v.adxMinBars       = cfg.getInt("validator", "adx_min_bars", v.adxMinBars);
    v.adxTrend         = cfg.getDouble("validator", "adx_trend", v.adxTrend);

    TriggerConfig& t = c.trigger;
    t.minBars          = cfg.getInt("trigger", "min_bars", t.minBars);
    t.vwapHysteresis   = cfg.getInt("trigger", "vwap_hysteresis", t.vwapHysteresis);
    t.rvolLookback     = cfg.getInt("trigger", "rvol_lookback", t.rvolLookback);
    t.rvolThreshold    = cfg.getDouble("trigger", "rvol_threshold", t.rvolThreshold);
    t.bbPeriod         = cfg.getInt("trigger", "bb_period", t.bbPeriod);
    t.bbMult           = cfg.getDouble("trigger", "bb_mult", t.bbMult);
    t.bbExpansion      = cfg.getDouble("trigger", "bb_expansion", t.bbExpansion);
    t.bbExpansionBars  = cfg.getInt("trigger", "bb_expansion_bars", t.bbExpansionBars);
    t.strongBias       = cfg.getInt("trigger", "strong_bias", t.strongBias);

    ChopConfig& ch = c.chop;
    ch.adxPeriod         = cfg.getInt("chop", "adx_period", ch.adxPeriod);
    ch.adxThreshold      = cfg.getDouble("chop", "adx_threshold", ch.adxThreshold);
    ch.adxMinBars        = cfg.getInt("chop", "adx_min_bars", ch.adxMinBars);
    ch.vwapCrossLookback = cfg.getInt("chop", "vwap_cross_lookback", ch.vwapCrossLookback);
    ch.vwapCrossMax      = cfg.getInt("chop", "vwap_cross_max", ch.vwapCrossMax);
    ch.bandwidthPct      = cfg.getDouble("chop", "bandwidth_pct", ch.bandwidthPct);
    ch.vwapProximity     = cfg.getDouble("chop", "vwap_proximity", ch.vwapProximity);

    TrapConfig& tr = c.trap;
    tr.lookback        = cfg.getInt("trap", "lookback", tr.lookback);
    tr.volumeMult      = cfg.getDouble("trap", "volume_mult", tr.volumeMult);
    tr.rangeMult       = cfg.getDouble("trap", "range_mult", tr.rangeMult);
    tr.levelTolerance  = cfg.getDouble("trap", "level_tolerance", tr.levelTolerance);
    tr.wickPct         = cfg.getDouble("trap", "wick_pct", tr.wickPct);
    tr.durationCandles = cfg.getInt("trap", "duration_candles", tr.durationCandles);
    tr.fadeConfidence  = cfg.getInt("trap", "fade_confidence", tr.fadeConfidence);
    tr.fadeRsi         = cfg.getDouble("trap", "fade_rsi", tr.fadeRsi);

    CooldownConfig& cd = c.cooldown;
    cd.oppositeMs      = cfg.getInt64("cooldown", "opposite_ms", cd.oppositeMs);
    cd.retestProximity = cfg.getDouble("cooldown", "retest_proximity", cd.retestProximity);

    RiskConfig& r = c.risk;
    r.atrPeriod        = cfg.getInt("risk", "atr_period", r.atrPeriod);
    r.squeezeStopAtr   = cfg.getDouble("risk", "squeeze_stop_atr", r.squeezeStopAtr);
    r.squeezeTargetAtr = cfg.getDouble("risk", "squeeze_target_atr", r.squeezeTargetAtr);
    r.fadeStopAtr      = cfg.getDouble("risk", "fade_stop_atr", r.fadeStopAtr);
    r.fadeTargetAtr    = cfg.getDouble("risk", "fade_target_atr", r.fadeTargetAtr);
    r.pushConfidence   = cfg.getInt("risk", "push_confidence", r.pushConfidence);

    SessionConfig& s = c.session;
    s.symbol           = cfg.get("session", "symbol", s.symbol);
    s.historySize      = cfg.getInt("session", "history_size", s.historySize);
    s.staleAfterBars   = cfg.getInt("session", "stale_after_bars", s.staleAfterBars);

    c.logging.logSuppressed = cfg.getBool("logging", "log_suppressed", c.logging.logSuppressed);
    c.logging.logAlerts     = cfg.getBool("logging", "log_alerts", c.logging.logAlerts);

    return c;
}

bool ScalpConfig::fromFile(const std::string& path, ScalpConfig& out) {
    ConfigLoader loader;
    if (!loader.load(path)) {
        out = ScalpConfig{};
        return false;
    }
    out = fromLoader(loader);
    std::cout << "[ScalpConfig] Loaded " << loader.size() << " keys from "
              << loader.getConfigPath() << "\n";
    return true;
}

bool ScalpConfig::isValid() const {
    auto fail = [](const char* msg) {
        std::cerr << "[ScalpConfig] ERROR: " << msg << "\n";
        return false;
    };

    if (director.supertrendPeriod <= 0 || director.rsiPeriod <= 0 ||
        director.adxPeriod <= 0 || director.ewoShort <= 0 ||
        director.tenkan <= 0 || director.kijun <= 0 || director.senkouB <= 0)
        return fail("director periods must be positive");
    if (director.ewoShort >= director.ewoLong)
        return fail("director ewo_short must be below ewo_long");
    if (director.rsiBear >= director.rsiBull)
        return fail("director rsi_bear must be below rsi_bull");
    if (director.minBars < director.senkouB)
        return fail("director min_bars must cover ichimoku_senkou_b");
    if (director.biasThreshold <= 0 || director.biasThreshold > 6)
        return fail("director bias_threshold must be in 1..6");
    if (director.lockMinutes <= 0)
        return fail("director lock_minutes must be positive");

    if (validator.minBars <= 0 || validator.supertrendPeriod <= 0 ||
        validator.rsiPeriod <= 0 || validator.adxPeriod <= 0 || validator.ewoShort <= 0)
        return fail("validator periods must be positive");
    if (validator.ewoShort >= validator.ewoLong)
        return fail("validator ewo_short must be below ewo_long");
    if (validator.rsiShort >= validator.rsiLong)
        return fail("validator rsi_short must be below rsi_long");

    if (trigger.minBars <= 0 || trigger.rvolLookback <= 0 || trigger.bbPeriod <= 0)
        return fail("trigger periods must be positive");
    if (trigger.vwapHysteresis < 1)
        return fail("trigger vwap_hysteresis must be at least 1");
    if (trigger.minBars < std::max(2, trigger.vwapHysteresis))
        return fail("trigger min_bars must cover vwap_hysteresis and the previous bar");
    if (trigger.rvolThreshold <= 0.0 || trigger.bbExpansion <= 0.0)
        return fail("trigger thresholds must be positive");
    if (trigger.bbExpansionBars < 1)
        return fail("trigger bb_expansion_bars must be at least 1");

    if (chop.adxPeriod <= 0 || chop.vwapCrossLookback < 2 || chop.vwapCrossMax <= 0)
        return fail("chop lookbacks must be positive");
    if (chop.bandwidthPct <= 0.0 || chop.vwapProximity <= 0.0)
        return fail("chop ratios must be positive");

    if (trap.lookback < 2 || trap.durationCandles <= 0)
        return fail("trap lookback/duration must be positive");
    if (trap.volumeMult <= 0.0 || trap.rangeMult <= 0.0)
        return fail("trap multipliers must be positive");
    if (trap.wickPct <= 0.0 || trap.wickPct >= 1.0)
        return fail("trap wick_pct must be in (0,1)");
    if (trap.fadeConfidence < 0 || trap.fadeConfidence > 100)
        return fail("trap fade_confidence must be in 0..100");

    if (cooldown.oppositeMs < 0 || cooldown.retestProximity <= 0.0)
        return fail("cooldown window/proximity invalid");

    if (risk.atrPeriod <= 0)
        return fail("risk atr_period must be positive");
    if (risk.squeezeStopAtr <= 0.0 || risk.squeezeTargetAtr <= 0.0 ||
        risk.fadeStopAtr < 0.0 || risk.fadeTargetAtr <= 0.0)
        return fail("risk ATR multiples invalid");
    if (risk.pushConfidence < 0 || risk.pushConfidence > 100)
        return fail("risk push_confidence must be in 0..100");

    if (session.historySize <= 0 || session.staleAfterBars <= 0)
        return fail("session history_size/stale_after_bars must be positive");

    return true;
}

void ScalpConfig::print() const {
    std::cout << "\n=== ScalpConfig ===\n";
    printf("  Symbol:        %s\n", session.symbol.c_str());
    printf("  Director:      ST(%d,%.1f) RSI%d %.0f/%.0f EWO(%d,%d) ADX%d>=%.0f Ichi(%d,%d,%d) |score|>=%d lock=%dm\n",
           director.supertrendPeriod, director.supertrendMult, director.rsiPeriod,
           director.rsiBull, director.rsiBear, director.ewoShort, director.ewoLong,
           director.adxPeriod, director.adxTrend, director.tenkan, director.kijun,
           director.senkouB, director.biasThreshold, director.lockMinutes);
    printf("  Validator:     min=%d ST(%d,%.1f) RSI %.0f/%.0f ADX>=%.0f (min %d bars)\n",
           validator.minBars, validator.supertrendPeriod, validator.supertrendMult,
           validator.rsiLong, validator.rsiShort, validator.adxTrend, validator.adxMinBars);
    printf("  Trigger:       min=%d hyst=%d RVOL(%d)>=%.2f BB(%d,%.1f) x%.2f/%d bars\n",
           trigger.minBars, trigger.vwapHysteresis, trigger.rvolLookback,
           trigger.rvolThreshold, trigger.bbPeriod, trigger.bbMult,
           trigger.bbExpansion, trigger.bbExpansionBars);
    printf("  Chop:          ADX<%.0f falling, crosses>=%d/%d, bw<%.3f near %.4f\n",
           chop.adxThreshold, chop.vwapCrossMax, chop.vwapCrossLookback,
           chop.bandwidthPct, chop.vwapProximity);
    printf("  Trap:          vol x%.1f range x%.1f tol %.4f wick %.0f%% for %d candles, fade conf %d\n",
           trap.volumeMult, trap.rangeMult, trap.levelTolerance, trap.wickPct * 100.0,
           trap.durationCandles, trap.fadeConfidence);
    printf("  Cooldown:      opposite %llds, retest within %.4f\n",
           static_cast<long long>(cooldown.oppositeMs / 1000), cooldown.retestProximity);
    printf("  Risk:          ATR%d squeeze %.2f/%.2f fade %.2f/%.2f push>=%d\n",
           risk.atrPeriod, risk.squeezeStopAtr, risk.squeezeTargetAtr,
           risk.fadeStopAtr, risk.fadeTargetAtr, risk.pushConfidence);
    printf("  Session:       history=%d stale after %d bars\n",
           session.historySize, session.staleAfterBars);
    printf("  Logging:       suppressed=%s alerts=%s\n",
           logging.logSuppressed ? "YES" : "NO", logging.logAlerts ? "YES" : "NO");
    std::cout << "===================\n\n";
}
