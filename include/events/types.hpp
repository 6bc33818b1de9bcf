// Events module - candle data type
#pragma once

#include <cstddef>
#include <cstdint>

namespace smc {

// OHLCV candle. index is the position in the loaded series (0..N-1),
// ts is the candle open time in unix seconds.
struct Candle {
    size_t index{0};
    uint64_t ts{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};

    bool is_bullish() const { return close > open; }
    bool is_bearish() const { return close < open; }
    double range() const { return high - low; }
};

} // namespace smc
