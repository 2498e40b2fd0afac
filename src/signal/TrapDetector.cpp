#include "scalp/signal/TrapDetector.hpp"

#include "scalp/indicators/Bollinger.hpp"
#include "scalp/indicators/PivotPoints.hpp"
#include "scalp/indicators/Rsi.hpp"

using namespace Scalp;

namespace {
constexpr int BB_PERIOD = 20;
constexpr double BB_MULT = 2.0;
constexpr int RSI_PERIOD = 14;
}

TrapDetector::TrapDetector(const TrapConfig& cfg)
    : cfg_(cfg) {}

TrapModeState TrapDetector::evaluate(const CandleSeries& bars1m, int64_t candleIndex,
                                     const TrapModeState& previous) const {
    if (previous.active && candleIndex < previous.expiresAt) {
        return previous;
    }

    TrapModeState none;
    const size_t lb = static_cast<size_t>(cfg_.lookback);
    if (bars1m.size() < lb + 1) return none;

    const Candle& cur = bars1m.back();
    const size_t start = bars1m.size() - 1 - lb;

    double sumVol = 0.0, sumRange = 0.0;
    for (size_t i = start; i < bars1m.size() - 1; ++i) {
        sumVol += bars1m[i].volume;
        sumRange += bars1m[i].range();
    }
    const double avgVol = sumVol / cfg_.lookback;
    const double avgRange = sumRange / cfg_.lookback;

    const bool volumeSpike = avgVol > 0.0 && cur.volume >= cfg_.volumeMult * avgVol;
    const bool rangeSpike = cur.range() > 0.0 && cur.range() >= cfg_.rangeMult * avgRange;
    if (!volumeSpike || !rangeSpike) return none;

    // ---- Key levels ----
    const PivotLevels pv = computePivots(bars1m[bars1m.size() - 2]);
    const BollingerResult bb = computeBollinger(tail(bars1m, lb + 1), BB_PERIOD, BB_MULT);

    struct Level { const char* name; double value; };
    const Level levels[] = {
        {"R1", pv.r1}, {"R2", pv.r2}, {"R3", pv.r3},
        {"S1", pv.s1}, {"S2", pv.s2}, {"S3", pv.s3},
        {"BB_UPPER", lastOr(bb.upper, 0.0)}, {"BB_LOWER", lastOr(bb.lower, 0.0)}
    };

    const char* tagged = nullptr;
    for (const auto& l : levels) {
        if (tagsLevel(cur.high, l.value, cfg_.levelTolerance) ||
            tagsLevel(cur.low, l.value, cfg_.levelTolerance)) {
            tagged = l.name;
            break;
        }
    }
    if (!tagged) return none;

    // ---- Rejection wick ----
    const double upperPct = safeDiv(cur.upperWick(), cur.range(), 0.0);
    const double lowerPct = safeDiv(cur.lowerWick(), cur.range(), 0.0);

    TrapType type = TrapType::NONE;
    if (upperPct >= cfg_.wickPct && cur.red())        type = TrapType::UP_WICK;
    else if (lowerPct >= cfg_.wickPct && cur.green()) type = TrapType::DOWN_WICK;
    if (type == TrapType::NONE) return none;

    TrapModeState t;
    t.active = true;
    t.type = type;
    t.detectedAt = candleIndex;
    t.expiresAt = candleIndex + cfg_.durationCandles;
    t.wickHigh = cur.high;
    t.wickLow = cur.low;
    t.trapCandle = cur;
    t.level = tagged;
    return t;
}

FadeCheck TrapDetector::confirmFade(const CandleSeries& bars1m, const TrapModeState& trap,
                                    double vwap) const {
    FadeCheck f;
    if (!trap.active || bars1m.size() < 2) return f;

    const Candle& cur = bars1m[bars1m.size() - 1];
    const Candle& prev = bars1m[bars1m.size() - 2];
    const double rsi = lastOr(computeRsi(bars1m, RSI_PERIOD), 50.0);

    if (trap.type == TrapType::UP_WICK) {
        const bool belowVwap = cur.close < vwap && prev.close < vwap;
        const bool lowerHigh = cur.high < prev.high;
        if (belowVwap && lowerHigh && rsi < cfg_.fadeRsi && cur.red()) {
            f.confirmed = true;
            f.direction = Direction::SHORT;
            f.reason = "Liquidity trap + VWAP reject";
        }
    } else if (trap.type == TrapType::DOWN_WICK) {
        const bool aboveVwap = cur.close > vwap && prev.close > vwap;
        const bool higherLow = cur.low > prev.low;
        if (aboveVwap && higherLow && rsi >= cfg_.fadeRsi && cur.green()) {
            f.confirmed = true;
            f.direction = Direction::LONG;
            f.reason = "Liquidity trap + VWAP reject";
        }
    }
    return f;
}
