#include "scalp/indicators/Bollinger.hpp"

#include <cmath>

namespace Scalp {

BollingerResult computeBollinger(const CandleSeries& bars, int period, double k) {
    BollingerResult r;
    if (period <= 0 || bars.size() < static_cast<size_t>(period)) return r;

    const size_t p = static_cast<size_t>(period);
    const size_t count = bars.size() - p + 1;
    r.upper.reserve(count);
    r.middle.reserve(count);
    r.lower.reserve(count);
    r.danger.reserve(count);

    for (size_t i = p - 1; i < bars.size(); ++i) {
        double sum = 0.0;
        for (size_t j = i + 1 - p; j <= i; ++j) sum += bars[j].close;
        const double mid = sum / period;

        double sq = 0.0;
        for (size_t j = i + 1 - p; j <= i; ++j) {
            const double d = bars[j].close - mid;
            sq += d * d;
        }
        const double sd = std::sqrt(sq / period);

        const double up = mid + k * sd;
        const double lo = mid - k * sd;
        r.upper.push_back(up);
        r.middle.push_back(mid);
        r.lower.push_back(lo);

        const double close = bars[i].close;
        r.danger.push_back(close >= up * 0.98 || close <= lo * 1.02);
    }
    return r;
}

} // namespace Scalp
