#include "scalp/engine/ScalpSession.hpp"

#include <cstdio>
#include <utility>

using namespace Scalp;

namespace {
constexpr Timeframe kFrames[3] = {Timeframe::M1, Timeframe::M2, Timeframe::M5};
}

ScalpSession::ScalpSession(const ScalpConfig& cfg)
    : cfg_(cfg),
      orchestrator_(cfg) {}

size_t ScalpSession::slot(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1: return 0;
        case Timeframe::M2: return 1;
        case Timeframe::M5: return 2;
        default:            return 0;
    }
}

void ScalpSession::updateSeries(Timeframe tf, CandleSeries bars, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(series_mtx_);
    series_[slot(tf)] = std::move(bars);
    updatedAt_[slot(tf)] = now_ms;
}

void ScalpSession::setOnAlert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mtx_);
    onAlert_ = std::move(cb);
}

void ScalpSession::setOnPushAlert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mtx_);
    onPushAlert_ = std::move(cb);
}

CandleSeries ScalpSession::closedBars(const CandleSeries& bars, Timeframe tf, int64_t now_ms) {
    const int64_t len = timeframe_ms(tf);
    size_t keep = bars.size();
    while (keep > 0 && bars[keep - 1].ts_ms + len > now_ms) --keep;
    if (keep == bars.size()) return bars;
    return CandleSeries(bars.begin(), bars.begin() + static_cast<std::ptrdiff_t>(keep));
}

bool ScalpSession::computeStale(const CandleSeries& closed, Timeframe tf, int64_t now_ms) const {
    if (closed.empty()) return true;
    const int64_t len = timeframe_ms(tf);
    const int64_t newestClose = closed.back().ts_ms + len;
    return newestClose < now_ms - static_cast<int64_t>(cfg_.session.staleAfterBars) * len;
}

CycleStatus ScalpSession::onBarClose(int64_t now_ms) {
    SingleFlight::Ticket ticket = flight_.tryAcquire();
    if (!ticket) {
        printf("[SCALP] WARN: %s cycle at %lld dropped, previous cycle still running (dropped=%llu)\n",
               cfg_.session.symbol.c_str(), static_cast<long long>(now_ms),
               static_cast<unsigned long long>(flight_.dropped()));
        return CycleStatus::BUSY;
    }

    std::array<CandleSeries, 3> bars;
    {
        std::lock_guard<std::mutex> lock(series_mtx_);
        for (size_t i = 0; i < 3; ++i) {
            bars[i] = closedBars(series_[i], kFrames[i], now_ms);
        }
    }

    if (bars[0].empty()) return CycleStatus::NO_DATA;

    PipelineState prev;
    int64_t index = 0;
    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        if (bars[0].back().ts_ms == lastProcessedTs_) return CycleStatus::DUPLICATE_BAR;

        for (size_t i = 0; i < 3; ++i) {
            const bool stale = computeStale(bars[i], kFrames[i], now_ms);
            if (stale && !stale_[i]) {
                printf("[SCALP] WARN: %s %s feed stale, reusing last-known bars (%zu)\n",
                       cfg_.session.symbol.c_str(), timeframe_str(kFrames[i]), bars[i].size());
            } else if (!stale && stale_[i]) {
                printf("[SCALP] %s %s feed recovered\n",
                       cfg_.session.symbol.c_str(), timeframe_str(kFrames[i]));
            }
            stale_[i] = stale;
        }

        lastProcessedTs_ = bars[0].back().ts_ms;
        index = ++candleIndex_;
        prev = state_;
    }

    CycleResult r = orchestrator_.evaluate(bars[0], bars[1], bars[2], prev, index, now_ms);
    logCycle(r, now_ms);

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        state_ = r.nextState();
        ++cycles_;
        if (r.alert) {
            ++alerts_;
            current_ = r.alert;
            history_.push_front(*r.alert);
            while (history_.size() > static_cast<size_t>(cfg_.session.historySize)) {
                history_.pop_back();
            }
        }
        last_ = r;
    }

    if (r.alert) {
        AlertCallback onAlert, onPush;
        {
            std::lock_guard<std::mutex> lock(cb_mtx_);
            onAlert = onAlert_;
            onPush = onPushAlert_;
        }
        if (onAlert) onAlert(*r.alert);
        if (r.alert->shouldPush && onPush) onPush(*r.alert);
    }
    return CycleStatus::RAN;
}

void ScalpSession::logCycle(const CycleResult& r, int64_t now_ms) const {
    if (r.alert) {
        if (!cfg_.logging.logAlerts) return;
        const Alert& a = *r.alert;
        printf("[SCALP] ALERT %s %s conf=%d%s entry=%.2f stop=%.2f target=%.2f hold=%s | %s\n",
               cfg_.session.symbol.c_str(), alert_type_str(a.type), a.confidence,
               a.shouldPush ? " PUSH" : "", a.entryPrice, a.stopLoss, a.targetPrice,
               a.holdTime.c_str(), a.explanation.c_str());
        return;
    }
    if (cfg_.logging.logSuppressed) {
        printf("[SCALP] %s t=%lld suppressed %s: %s\n",
               cfg_.session.symbol.c_str(), static_cast<long long>(now_ms),
               suppress_reason_str(r.suppress), r.suppressText.c_str());
    }
}

void ScalpSession::dismiss() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    current_.reset();
}

bool ScalpSession::reset() {
    SingleFlight::Ticket ticket = flight_.tryAcquire(false);
    if (!ticket) {
        printf("[SCALP] WARN: %s reset refused, cycle in flight\n", cfg_.session.symbol.c_str());
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(series_mtx_);
        for (auto& s : series_) s.clear();
        updatedAt_ = {{0, 0, 0}};
    }
    std::lock_guard<std::mutex> lock(state_mtx_);
    state_ = PipelineState{};
    last_.reset();
    current_.reset();
    history_.clear();
    stale_ = {{false, false, false}};
    candleIndex_ = 0;
    lastProcessedTs_ = -1;
    cycles_ = 0;
    alerts_ = 0;
    flight_.resetCounters();
    printf("[SCALP] %s session reset\n", cfg_.session.symbol.c_str());
    return true;
}

SessionSummary ScalpSession::summary(int64_t now_ms) const {
    SessionSummary s;
    CooldownGate gate(cfg_.cooldown);

    std::lock_guard<std::mutex> lock(state_mtx_);
    if (state_.director) {
        s.director = state_.director->state;
        s.biasScore = state_.director->biasScore;
        s.insideCloud = state_.director->insideCloud;
    }
    s.trapActive = state_.trap.active;
    s.trapType = state_.trap.active ? state_.trap.type : TrapType::NONE;
    s.lastDirection = state_.cooldown.lastDirection;
    s.cooldownRemainingSec = gate.oppositeRemainingSec(state_.cooldown, now_ms);
    s.oppositeCooldownActive = s.cooldownRemainingSec > 0;
    s.candleIndex = candleIndex_;
    s.cycles = cycles_;
    s.alerts = alerts_;
    s.dropped = flight_.dropped();
    return s;
}

std::vector<Alert> ScalpSession::history() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return std::vector<Alert>(history_.begin(), history_.end());
}

std::optional<Alert> ScalpSession::currentAlert() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return current_;
}

std::optional<CycleResult> ScalpSession::lastCycle() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return last_;
}

bool ScalpSession::isStale(Timeframe tf) const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return stale_[slot(tf)];
}

int64_t ScalpSession::lastUpdate(Timeframe tf) const {
    std::lock_guard<std::mutex> lock(series_mtx_);
    return updatedAt_[slot(tf)];
}

int64_t ScalpSession::candleIndex() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return candleIndex_;
}

uint64_t ScalpSession::cycles() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return cycles_;
}
