#pragma once
// =============================================================================
// Candle.hpp - OHLCV bar and series helpers
// =============================================================================
// Bars are owned by the caller. Everything in the engine reads them through
// const references and never mutates a series.
// =============================================================================

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Scalp {

struct Candle {
    int64_t ts_ms = 0;     // bar open time, ms since epoch
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    double range() const { return high - low; }
    double body() const { return std::abs(close - open); }
    double upperWick() const { return high - std::max(open, close); }
    double lowerWick() const { return std::min(open, close) - low; }
    double typical() const { return (high + low + close) / 3.0; }
    double hl2() const { return (high + low) * 0.5; }

    bool green() const { return close > open; }
    bool red() const { return close < open; }
};

using CandleSeries = std::vector<Candle>;

// Last n bars (the whole series when n >= size)
inline CandleSeries tail(const CandleSeries& bars, size_t n) {
    if (n >= bars.size()) return bars;
    return CandleSeries(bars.end() - static_cast<std::ptrdiff_t>(n), bars.end());
}

// Bars [from, to)
inline CandleSeries slice(const CandleSeries& bars, size_t from, size_t to) {
    to = std::min(to, bars.size());
    if (from >= to) return {};
    return CandleSeries(bars.begin() + static_cast<std::ptrdiff_t>(from),
                        bars.begin() + static_cast<std::ptrdiff_t>(to));
}

inline std::vector<double> closes(const CandleSeries& bars) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& b : bars) out.push_back(b.close);
    return out;
}

// ---- Series accessors with a neutral fallback ----
// k counts from the end: 0 = last, 1 = the one before, ...
inline double backOr(const std::vector<double>& v, size_t k, double fallback) {
    if (k >= v.size()) return fallback;
    double x = v[v.size() - 1 - k];
    return std::isfinite(x) ? x : fallback;
}

inline double lastOr(const std::vector<double>& v, double fallback) {
    return backOr(v, 0, fallback);
}

inline double prevOr(const std::vector<double>& v, double fallback) {
    return backOr(v, 1, fallback);
}

// Division with a sentinel for a zero or non-finite result
inline double safeDiv(double num, double den, double fallback) {
    if (den == 0.0) return fallback;
    double r = num / den;
    return std::isfinite(r) ? r : fallback;
}

} // namespace Scalp
