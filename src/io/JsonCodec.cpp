#include "scalp/io/JsonCodec.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Scalp {

json alertToJson(const Alert& a) {
    return json{
        {"id", a.id},
        {"type", alert_type_str(a.type)},
        {"direction", direction_str(a.direction())},
        {"timestamp", a.ts_ms},
        {"confidence", a.confidence},
        {"shouldPush", a.shouldPush},
        {"director", director_state_str(a.director)},
        {"validator", validator_state_str(a.validator)},
        {"triggerReason", a.triggerReason},
        {"explanation", a.explanation},
        {"entryPrice", a.entryPrice},
        {"stopLoss", a.stopLoss},
        {"targetPrice", a.targetPrice},
        {"holdTime", a.holdTime}
    };
}

json directorToJson(const DirectorResult& d) {
    return json{
        {"state", director_state_str(d.state)},
        {"biasScore", d.biasScore},
        {"breakdown", {
            {"superTrend", d.votes.supertrend},
            {"vwap", d.votes.vwap},
            {"rsi", d.votes.rsi},
            {"ewo", d.votes.ewo},
            {"adx", d.votes.adx},
            {"ichimoku", d.votes.ichimoku}
        }},
        {"lockedUntil", d.lockedUntil},
        {"insideCloud", d.insideCloud},
        {"adxConflict", d.adxConflict}
    };
}

json snapshotToJson(const IndicatorSnapshot& s) {
    return json{
        {"bars", s.bars},
        {"timestamp", s.ts_ms},
        {"close", s.close},
        {"rsi", s.rsi},
        {"adx", {
            {"value", s.adx},
            {"plusDI", s.plusDI},
            {"minusDI", s.minusDI},
            {"direction", trend_direction_str(s.adxDirection)},
            {"strength", trend_strength_str(s.adxStrength)}
        }},
        {"superTrend", {
            {"trend", s.supertrendTrend},
            {"signal", trend_signal_str(s.supertrendSignal)}
        }},
        {"ewo", {
            {"value", s.ewo},
            {"signal", trend_signal_str(s.ewoSignal)}
        }},
        {"bollinger", {
            {"upper", s.bbUpper},
            {"middle", s.bbMiddle},
            {"lower", s.bbLower}
        }},
        {"vwap", {
            {"value", s.vwap},
            {"upperBand", s.vwapUpper},
            {"lowerBand", s.vwapLower},
            {"position", vwap_position_str(s.vwapPosition)}
        }},
        {"atr", {
            {"value", s.atr},
            {"slope", s.atrSlope},
            {"expanding", s.atrExpanding}
        }},
        {"ichimoku", {
            {"tenkan", s.tenkan},
            {"kijun", s.kijun},
            {"spanA", s.spanA},
            {"spanB", s.spanB},
            {"cloudTop", s.cloudTop},
            {"cloudBottom", s.cloudBottom},
            {"insideCloud", s.insideCloud}
        }},
        {"rvol", s.rvol}
    };
}

json summaryToJson(const SessionSummary& s) {
    return json{
        {"director", director_state_str(s.director)},
        {"biasScore", s.biasScore},
        {"insideCloud", s.insideCloud},
        {"trapActive", s.trapActive},
        {"trapType", trap_type_str(s.trapType)},
        {"oppositeCooldownActive", s.oppositeCooldownActive},
        {"cooldownRemainingSec", s.cooldownRemainingSec},
        {"lastDirection", direction_str(s.lastDirection)},
        {"candleIndex", s.candleIndex},
        {"cycles", s.cycles},
        {"alerts", s.alerts},
        {"dropped", s.dropped}
    };
}

std::string alertToLine(const Alert& a) {
    return alertToJson(a).dump();
}

namespace {

const json* findField(const json& obj, const char* longKey, const char* shortKey) {
    auto it = obj.find(longKey);
    if (it != obj.end()) return &*it;
    it = obj.find(shortKey);
    if (it != obj.end()) return &*it;
    return nullptr;
}

double numberField(const json& obj, size_t idx, const char* longKey, const char* shortKey,
                   bool required, double fallback) {
    const json* v = findField(obj, longKey, shortKey);
    if (!v || v->is_null()) {
        if (!required) return fallback;
        std::ostringstream msg;
        msg << "candle[" << idx << "]: missing '" << longKey << "'";
        throw std::runtime_error(msg.str());
    }
    if (!v->is_number()) {
        std::ostringstream msg;
        msg << "candle[" << idx << "]: '" << longKey << "' is not a number";
        throw std::runtime_error(msg.str());
    }
    return v->get<double>();
}

} // namespace

CandleSeries candlesFromJson(const json& doc) {
    const json* arr = &doc;
    if (doc.is_object()) {
        auto it = doc.find("candles");
        if (it == doc.end()) throw std::runtime_error("candles: object has no 'candles' array");
        arr = &*it;
    }
    if (!arr->is_array()) throw std::runtime_error("candles: expected a JSON array");

    CandleSeries out;
    out.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        const json& e = (*arr)[i];
        if (!e.is_object()) {
            std::ostringstream msg;
            msg << "candle[" << i << "]: expected an object";
            throw std::runtime_error(msg.str());
        }

        Candle c;
        const double t = numberField(e, i, "time", "t", true, 0.0);
        // 2^63: doubles at or past it do not convert
        if (!(t >= -9223372036854775808.0 && t < 9223372036854775808.0)) {
            std::ostringstream msg;
            msg << "candle[" << i << "]: 'time' out of range";
            throw std::runtime_error(msg.str());
        }
        c.ts_ms  = static_cast<int64_t>(t);
        c.open   = numberField(e, i, "open", "o", true, 0.0);
        c.high   = numberField(e, i, "high", "h", true, 0.0);
        c.low    = numberField(e, i, "low", "l", true, 0.0);
        c.close  = numberField(e, i, "close", "c", true, 0.0);
        c.volume = numberField(e, i, "volume", "v", false, 0.0);

        if (c.high < c.low) {
            std::ostringstream msg;
            msg << "candle[" << i << "]: high below low";
            throw std::runtime_error(msg.str());
        }
        if (!out.empty() && c.ts_ms <= out.back().ts_ms) {
            std::ostringstream msg;
            msg << "candle[" << i << "]: timestamp " << c.ts_ms << " not after " << out.back().ts_ms;
            throw std::runtime_error(msg.str());
        }
        out.push_back(c);
    }
    return out;
}

CandleSeries candlesFromString(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("candles: parse error: ") + e.what());
    }
    return candlesFromJson(doc);
}

CandleSeries candlesFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("candles: cannot open " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    return candlesFromString(buf.str());
}

} // namespace Scalp
