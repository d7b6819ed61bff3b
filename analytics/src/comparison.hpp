#pragma once

#include "types.hpp"
#include <vector>

// Spot vs futures diffs for one symbol, from results already computed per market
ComparisonResult compare_markets(const std::vector<Bar>& spot_bars,
                                 const std::vector<Bar>& futures_bars,
                                 const TrendResult& spot_trend,
                                 const TrendResult& futures_trend);
