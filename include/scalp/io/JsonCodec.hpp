#pragma once
// =============================================================================
// JsonCodec.hpp - JSON at the presentation boundary
// =============================================================================
// Alerts, director results, indicator snapshots and session summaries out;
// candle arrays in. Enum fields are written as their *_str() labels and
// timestamps as integer milliseconds.
//
// Input accepted:
//   [ {"time":..,"open":..,"high":..,"low":..,"close":..,"volume":..}, ... ]
//   [ {"t":..,"o":..,"h":..,"l":..,"c":..,"v":..}, ... ]
//   { "candles": [ ... ] }
// Malformed input throws std::runtime_error naming the offending element.
// =============================================================================

#include <string>

#include <nlohmann/json.hpp>

#include "scalp/engine/ScalpSession.hpp"
#include "scalp/indicators/IndicatorSnapshot.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

using json = nlohmann::json;

json alertToJson(const Alert& a);
json directorToJson(const DirectorResult& d);
json snapshotToJson(const IndicatorSnapshot& s);
json summaryToJson(const SessionSummary& s);

// Single-line form for logs and the replay tool
std::string alertToLine(const Alert& a);

CandleSeries candlesFromJson(const json& doc);
CandleSeries candlesFromString(const std::string& text);
CandleSeries candlesFromFile(const std::string& path);

} // namespace Scalp
