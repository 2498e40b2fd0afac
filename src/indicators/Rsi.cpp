#include "scalp/indicators/Rsi.hpp"

namespace Scalp {

std::vector<double> computeRsi(const CandleSeries& bars, int period) {
    std::vector<double> out;
    if (period <= 0 || bars.size() <= static_cast<size_t>(period)) return out;

    const size_t p = static_cast<size_t>(period);
    out.reserve(bars.size() - p);

    // RSI at bar i uses the changes into bars i-p+1 .. i
    for (size_t i = p; i < bars.size(); ++i) {
        double gain = 0.0, loss = 0.0;
        for (size_t k = i - p + 1; k <= i; ++k) {
            const double ch = bars[k].close - bars[k - 1].close;
            if (ch > 0) gain += ch;
            else        loss -= ch;
        }
        const double avgGain = gain / period;
        const double avgLoss = loss / period;
        if (avgLoss == 0.0) {
            out.push_back(100.0);
        } else {
            out.push_back(100.0 - 100.0 / (1.0 + avgGain / avgLoss));
        }
    }
    return out;
}

} // namespace Scalp
