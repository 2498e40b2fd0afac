#pragma once
// =============================================================================
// PivotPoints.hpp - Standard floor pivots and level proximity
// =============================================================================

#include <cmath>
#include <string>

#include "scalp/core/Candle.hpp"
#include "scalp/core/ScalpEnums.hpp"

namespace Scalp {

struct PivotLevels {
    double pivot = 0.0;
    double r1 = 0.0, r2 = 0.0, r3 = 0.0;
    double s1 = 0.0, s2 = 0.0, s3 = 0.0;
    bool valid = false;
};

// From a single prior bar
PivotLevels computePivots(const Candle& prior);

struct LevelProximity {
    bool atSupport = false;
    bool atResistance = false;
    std::string level = "S3";     // nearest level name (S3..P..R3)
    double distance = 0.0;        // absolute points
    BounceSignal bounce = BounceSignal::NONE;
};

// Nearest pivot level to price. At support with RSI < 35 is STRONG_BUY,
// < 45 BUY; at resistance with RSI > 65 STRONG_SELL, > 55 SELL.
LevelProximity checkSupportResistance(double price, const PivotLevels& levels,
                                      double rsi, double thresholdPoints = 5.0);

// |price - level| / level <= tolerancePct
inline bool tagsLevel(double price, double level, double tolerancePct) {
    if (level <= 0.0) return false;
    return std::abs(price - level) / level <= tolerancePct;
}

} // namespace Scalp
