#include "bar_normalizer.hpp"
#include <cmath>
#include <fmt/format.h>

std::vector<Bar> BarNormalizer::normalize(const std::vector<RawBar>& raw) const {
    if (raw.empty()) {
        throw InvalidInput("No bars to normalize");
    }

    for (size_t i = 0; i < raw.size(); ++i) {
        validate(raw[i], i);
        if (i > 0 && raw[i].open_time <= raw[i - 1].open_time) {
            throw InvalidInput(fmt::format("Bar {} is not after bar {} (open time {} <= {})",
                                           i, i - 1, raw[i].open_time, raw[i - 1].open_time));
        }
    }

    // The last bar is still forming
    std::vector<Bar> bars;
    bars.reserve(raw.size() - 1);
    for (size_t i = 0; i + 1 < raw.size(); ++i) {
        bars.push_back(enrich(raw[i]));
    }
    return bars;
}

Bar BarNormalizer::enrich(const RawBar& raw) {
    Bar bar;
    bar.open_time = raw.open_time;
    bar.close_time = raw.close_time;
    bar.open = raw.open;
    bar.high = raw.high;
    bar.low = raw.low;
    bar.close = raw.close;
    bar.volume = raw.volume;
    bar.quote_volume = raw.quote_volume;

    if (raw.close >= raw.open) {
        bar.buy_volume = raw.volume * kDominantShare;
        bar.sell_volume = raw.volume - bar.buy_volume;
    } else {
        bar.sell_volume = raw.volume * kDominantShare;
        bar.buy_volume = raw.volume - bar.sell_volume;
    }

    bar.net_inflow = (bar.buy_volume - bar.sell_volume) * raw.close;
    bar.price_change_pct = (raw.close - raw.open) / raw.open * 100.0;
    return bar;
}

void BarNormalizer::validate(const RawBar& raw, size_t index) {
    // Negated comparisons so NaN fails too
    if (!(raw.open > 0.0) || !(raw.high > 0.0) || !(raw.low > 0.0) || !(raw.close > 0.0) ||
        !std::isfinite(raw.open) || !std::isfinite(raw.high) ||
        !std::isfinite(raw.low) || !std::isfinite(raw.close)) {
        throw InvalidInput(fmt::format("Bar {} has a non-positive or non-finite price (o={} h={} l={} c={})",
                                       index, raw.open, raw.high, raw.low, raw.close));
    }
    if (!(raw.volume >= 0.0) || !(raw.quote_volume >= 0.0) ||
        !std::isfinite(raw.volume) || !std::isfinite(raw.quote_volume)) {
        throw InvalidInput(fmt::format("Bar {} has a negative or non-finite volume ({} / {})",
                                       index, raw.volume, raw.quote_volume));
    }
    if (raw.close_time <= raw.open_time) {
        throw InvalidInput(fmt::format("Bar {} closes at {} before it opens at {}",
                                       index, raw.close_time, raw.open_time));
    }
}
