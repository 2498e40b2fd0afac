#include "scalp/indicators/PivotPoints.hpp"

#include <cmath>

namespace Scalp {

PivotLevels computePivots(const Candle& prior) {
    PivotLevels p;
    const double h = prior.high, l = prior.low, c = prior.close;
    p.pivot = (h + l + c) / 3.0;
    p.r1 = 2.0 * p.pivot - l;
    p.s1 = 2.0 * p.pivot - h;
    p.r2 = p.pivot + (h - l);
    p.s2 = p.pivot - (h - l);
    p.r3 = h + 2.0 * (p.pivot - l);
    p.s3 = l - 2.0 * (h - p.pivot);
    p.valid = h > 0.0 && l > 0.0;
    return p;
}

LevelProximity checkSupportResistance(double price, const PivotLevels& lv,
                                      double rsi, double thresholdPoints) {
    struct Named { const char* name; double value; };
    const Named levels[] = {
        {"S3", lv.s3}, {"S2", lv.s2}, {"S1", lv.s1}, {"P", lv.pivot},
        {"R1", lv.r1}, {"R2", lv.r2}, {"R3", lv.r3}
    };

    LevelProximity r;
    const Named* best = &levels[0];
    double bestDist = std::abs(price - levels[0].value);
    for (const auto& l : levels) {
        const double d = std::abs(price - l.value);
        if (d < bestDist) {
            bestDist = d;
            best = &l;
        }
    }

    r.level = best->name;
    r.distance = bestDist;
    r.atSupport = best->name[0] == 'S' && bestDist <= thresholdPoints;
    r.atResistance = best->name[0] == 'R' && bestDist <= thresholdPoints;

    if (r.atSupport && rsi < 35.0)          r.bounce = BounceSignal::STRONG_BUY;
    else if (r.atSupport && rsi < 45.0)     r.bounce = BounceSignal::BUY;
    else if (r.atResistance && rsi > 65.0)  r.bounce = BounceSignal::STRONG_SELL;
    else if (r.atResistance && rsi > 55.0)  r.bounce = BounceSignal::SELL;
    return r;
}

} // namespace Scalp
