#include "scalp/indicators/MovingAverage.hpp"

#include <algorithm>
#include <cmath>

namespace Scalp {

std::vector<double> sma(const std::vector<double>& values, int period) {
    std::vector<double> out;
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return out;

    const size_t p = static_cast<size_t>(period);
    out.reserve(values.size() - p + 1);
    double sum = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        if (i >= p) sum -= values[i - p];
        if (i + 1 >= p) out.push_back(sum / period);
    }
    return out;
}

std::vector<double> ema(const std::vector<double>& values, int period) {
    std::vector<double> out;
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return out;

    const size_t p = static_cast<size_t>(period);
    const double k = 2.0 / (period + 1.0);

    double seed = 0.0;
    for (size_t i = 0; i < p; ++i) seed += values[i];
    double prev = seed / period;

    out.reserve(values.size() - p + 1);
    out.push_back(prev);
    for (size_t i = p; i < values.size(); ++i) {
        prev = (values[i] - prev) * k + prev;
        out.push_back(prev);
    }
    return out;
}

std::vector<double> rollingMean(const std::vector<double>& values, int period) {
    return sma(values, period);
}

std::vector<double> trueRanges(const CandleSeries& bars) {
    std::vector<double> tr;
    if (bars.size() < 2) return tr;
    tr.reserve(bars.size() - 1);
    for (size_t i = 1; i < bars.size(); ++i) {
        const double prevClose = bars[i - 1].close;
        tr.push_back(std::max({bars[i].high - bars[i].low,
                               std::abs(bars[i].high - prevClose),
                               std::abs(bars[i].low - prevClose)}));
    }
    return tr;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double populationStdDev(const std::vector<double>& values, double mu) {
    if (values.empty()) return 0.0;
    double sq = 0.0;
    for (double v : values) sq += (v - mu) * (v - mu);
    return std::sqrt(sq / static_cast<double>(values.size()));
}

} // namespace Scalp
