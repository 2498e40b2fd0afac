#include "scalp/indicators/Vwap.hpp"

#include "scalp/indicators/MovingAverage.hpp"

namespace Scalp {

double VwapCalculator::stdDev() const {
    return populationStdDev(typical_, getVwap());
}

VwapResult computeVwap(const CandleSeries& bars) {
    VwapResult r;
    if (bars.empty()) return r;

    VwapCalculator calc;
    for (const auto& b : bars) calc.onBar(b);

    r.vwap = calc.getVwap();
    r.stdDev = calc.stdDev();
    r.upperBand = r.vwap + 2.0 * r.stdDev;
    r.lowerBand = r.vwap - 2.0 * r.stdDev;

    // Outside the bands reads as stretched, so the run signal points back
    const double price = bars.back().close;
    if (price > r.upperBand) {
        r.position = VwapPosition::ABOVE_UPPER;
        r.signal = RunSignal::DOWNWARD_RUN;
    } else if (price < r.lowerBand) {
        r.position = VwapPosition::BELOW_LOWER;
        r.signal = RunSignal::UPWARD_RUN;
    } else if (price > r.vwap) {
        r.position = VwapPosition::ABOVE_VWAP;
        r.signal = RunSignal::UPWARD_RUN;
    } else if (price < r.vwap) {
        r.position = VwapPosition::BELOW_VWAP;
        r.signal = RunSignal::DOWNWARD_RUN;
    }
    return r;
}

} // namespace Scalp
