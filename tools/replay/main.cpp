// =============================================================================
// scalp_replay - feed a 1m candle file through a ScalpSession bar by bar
// =============================================================================
// usage: scalp_replay <candles.json> [config.ini]
//
// 2m and 5m series are aggregated from the 1m input. "Now" for each cycle is
// the close time of the 1m bar just replayed. Alerts print as one JSON line
// each on stdout; the summary follows at the end.
// =============================================================================

#include <cstdio>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/core/BarAggregator.hpp"
#include "scalp/engine/ScalpSession.hpp"
#include "scalp/io/JsonCodec.hpp"

using namespace Scalp;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: scalp_replay <candles.json> [config.ini]\n";
        return 1;
    }

    ScalpConfig cfg;
    if (argc >= 3 && !ScalpConfig::fromFile(argv[2], cfg)) {
        std::cerr << "[REPLAY] ERROR: cannot load config " << argv[2] << "\n";
        return 1;
    }
    if (!cfg.isValid()) {
        return 1;
    }
    cfg.print();

    CandleSeries all;
    try {
        all = candlesFromFile(argv[1]);
    } catch (const std::runtime_error& e) {
        std::cerr << "[REPLAY] ERROR: " << e.what() << "\n";
        return 1;
    }
    printf("[REPLAY] %zu 1m bars from %s\n", all.size(), argv[1]);

    const CandleSeries all2m = aggregateBars(all, Timeframe::M2);
    const CandleSeries all5m = aggregateBars(all, Timeframe::M5);

    ScalpSession session(cfg);
    std::map<std::string, int> byType;
    session.setOnAlert([&byType](const Alert& a) {
        byType[alert_type_str(a.type)]++;
        std::cout << alertToLine(a) << "\n";
    });

    const int64_t oneMin = timeframe_ms(Timeframe::M1);
    size_t i2 = 0, i5 = 0;
    for (size_t i = 0; i < all.size(); ++i) {
        const int64_t now = all[i].ts_ms + oneMin;

        // Higher timeframes: everything opened at or before now; the session
        // drops the still-forming bucket by close time
        while (i2 < all2m.size() && all2m[i2].ts_ms < now) ++i2;
        while (i5 < all5m.size() && all5m[i5].ts_ms < now) ++i5;

        session.updateSeries(Timeframe::M1, CandleSeries(all.begin(), all.begin() + i + 1), now);
        session.updateSeries(Timeframe::M2, CandleSeries(all2m.begin(), all2m.begin() + i2), now);
        session.updateSeries(Timeframe::M5, CandleSeries(all5m.begin(), all5m.begin() + i5), now);
        session.onBarClose(now);
    }

    const int64_t end = all.empty() ? 0 : all.back().ts_ms + oneMin;
    const SessionSummary s = session.summary(end);

    printf("\n[REPLAY] ==== SUMMARY ====\n");
    printf("[REPLAY] cycles=%llu alerts=%llu dropped=%llu\n",
           static_cast<unsigned long long>(s.cycles),
           static_cast<unsigned long long>(s.alerts),
           static_cast<unsigned long long>(s.dropped));
    for (const auto& kv : byType) {
        printf("[REPLAY]   %-16s %d\n", kv.first.c_str(), kv.second);
    }
    std::cout << "[REPLAY] final " << summaryToJson(s).dump() << "\n";
    if (!all5m.empty()) {
        std::cout << "[REPLAY] 5m " << snapshotToJson(computeSnapshot(all5m)).dump() << "\n";
    }
    return 0;
}
