#pragma once

#include "types.hpp"
#include <vector>

class BarNormalizer {
public:
    // Assumed share of volume bought on a bullish bar (mirrored on a bearish one)
    static constexpr double kDominantShare = 0.6;

    // Drops the trailing (still forming) bar and enriches the rest.
    // Throws InvalidInput on empty input, non-positive or non-finite prices,
    // negative or non-finite volumes and out-of-order timestamps.
    std::vector<Bar> normalize(const std::vector<RawBar>& raw) const;

    // Buy/sell split, net inflow and price change for a single bar
    static Bar enrich(const RawBar& raw);

private:
    static void validate(const RawBar& raw, size_t index);
};
