#pragma once
// =============================================================================
// ScalpSession.hpp - Caller side of the pipeline for one symbol
// =============================================================================
// Bar aggregators push whole series per timeframe (any thread). The bar
// clock calls onBarClose(now) once per closed 1m bar. Cycles are
// single-flight: an overlapping call is dropped and counted.
//
// Threading:
//   updateSeries()       any thread, series_mtx_
//   setOnAlert()/...     any thread, cb_mtx_
//   onBarClose()         single-flight, state_mtx_ for published state
//   reset()              takes the single-flight slot; refused mid-cycle
//   summary()/history()  any thread, state_mtx_
// Callbacks run on the cycle's thread with no lock held.
// =============================================================================

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/engine/AlertOrchestrator.hpp"
#include "scalp/engine/SingleFlight.hpp"

namespace Scalp {

struct SessionSummary {
    DirectorState director = DirectorState::CHOP;
    int biasScore = 0;
    bool insideCloud = false;
    bool trapActive = false;
    TrapType trapType = TrapType::NONE;
    bool oppositeCooldownActive = false;
    int64_t cooldownRemainingSec = 0;
    Direction lastDirection = Direction::NONE;
    int64_t candleIndex = 0;
    uint64_t cycles = 0;
    uint64_t alerts = 0;
    uint64_t dropped = 0;
};

class ScalpSession {
public:
    using AlertCallback = std::function<void(const Alert&)>;

    explicit ScalpSession(const ScalpConfig& cfg);

    // Replace the last-known series for a timeframe. Stamps the update time.
    void updateSeries(Timeframe tf, CandleSeries bars, int64_t now_ms);

    void setOnAlert(AlertCallback cb);
    void setOnPushAlert(AlertCallback cb);

    // One evaluation cycle at wall-clock now
    CycleStatus onBarClose(int64_t now_ms);

    // Clears the alert currently on display; history is kept
    void dismiss();
    // Clears pipeline state, history, counters and series. Returns false
    // and changes nothing while a cycle is in flight.
    bool reset();

    SessionSummary summary(int64_t now_ms) const;
    std::vector<Alert> history() const;              // newest first
    std::optional<Alert> currentAlert() const;
    std::optional<CycleResult> lastCycle() const;
    bool isStale(Timeframe tf) const;
    int64_t lastUpdate(Timeframe tf) const;
    int64_t candleIndex() const;
    uint64_t cycles() const;
    uint64_t droppedCycles() const { return flight_.dropped(); }

    const ScalpConfig& config() const { return cfg_; }

private:
    static size_t slot(Timeframe tf);

    // Bars whose close time (ts + tf) is at or before now
    static CandleSeries closedBars(const CandleSeries& bars, Timeframe tf, int64_t now_ms);

    bool computeStale(const CandleSeries& closed, Timeframe tf, int64_t now_ms) const;
    void logCycle(const CycleResult& r, int64_t now_ms) const;

    ScalpConfig cfg_;
    AlertOrchestrator orchestrator_;
    SingleFlight flight_;

    mutable std::mutex series_mtx_;
    std::array<CandleSeries, 3> series_;
    std::array<int64_t, 3> updatedAt_{{0, 0, 0}};

    mutable std::mutex state_mtx_;
    PipelineState state_;
    std::optional<CycleResult> last_;
    std::optional<Alert> current_;
    std::deque<Alert> history_;
    std::array<bool, 3> stale_{{false, false, false}};
    int64_t candleIndex_ = 0;
    int64_t lastProcessedTs_ = -1;
    uint64_t cycles_ = 0;
    uint64_t alerts_ = 0;

    std::mutex cb_mtx_;
    AlertCallback onAlert_;
    AlertCallback onPushAlert_;
};

} // namespace Scalp
