#pragma once

#include "types.hpp"
#include <vector>

class DepthAggregator {
public:
    // depth_limit caps the levels read per side; 0 reads every level
    explicit DepthAggregator(int depth_limit = 0);

    // Throws InvalidInput when either side is empty or a level is malformed
    // (price not positive and finite, quantity not finite and >= 0)
    OrderBookStats aggregate(const std::vector<DepthLevel>& bids,
                             const std::vector<DepthLevel>& asks) const;

private:
    int depth_limit_;
};
