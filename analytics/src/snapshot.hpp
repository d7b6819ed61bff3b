#pragma once

#include "types.hpp"
#include "config.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Snapshot layout:
// {
//   "interval": "1h",               (optional, falls back to config)
//   "limit": 50,                    (optional)
//   "symbols": {
//     "BTCUSDT": {
//       "spot":    { "klines": [[openTime, "o", "h", "l", "c", "v", closeTime, "qv", ...], ...],
//                    "depth":  { "bids": [["price", "qty"], ...], "asks": [...] } },
//       "futures": { ... }
//     }
//   }
// }
// Kline rows follow the exchange's array layout; numbers may be JSON numbers or decimal strings.
// Everything malformed is reported as InvalidInput.
AnalysisRequest parse_snapshot(const nlohmann::json& j, const Config& config);

AnalysisRequest load_snapshot_file(const std::string& path, const Config& config);

RawBar parse_kline_row(const nlohmann::json& row);
DepthLevel parse_depth_level(const nlohmann::json& level);
