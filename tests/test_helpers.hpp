// Candle builders shared by the unit tests
#pragma once

#include <cstdint>
#include <vector>

#include "events/types.hpp"

namespace smc {
namespace testing {

constexpr uint64_t T0 = 1700000000ULL;   // 2023-11-14 22:13:20 UTC
constexpr uint64_t STEP = 3600ULL;

inline Candle make_candle(size_t i, double o, double h, double l, double c, uint64_t step = STEP) {
    Candle k;
    k.index = i;
    k.ts = T0 + i * step;
    k.open = o;
    k.high = h;
    k.low = l;
    k.close = c;
    k.volume = 1.0;
    return k;
}

// Candles with open == close == mid and a fixed half-range around each mid
inline std::vector<Candle> from_mids(const std::vector<double>& mids, double half_range = 0.5) {
    std::vector<Candle> out;
    out.reserve(mids.size());
    for (size_t i = 0; i < mids.size(); ++i) {
        out.push_back(make_candle(i, mids[i], mids[i] + half_range, mids[i] - half_range, mids[i]));
    }
    return out;
}

// Flat series at price p
inline std::vector<Candle> flat(size_t n, double p = 100.0, double half_range = 0.5) {
    return from_mids(std::vector<double>(n, p), half_range);
}

inline void set_ohlc(Candle& c, double o, double h, double l, double cl) {
    c.open = o;
    c.high = h;
    c.low = l;
    c.close = cl;
}

} // namespace testing
} // namespace smc
