// Average true range over a trailing window
#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

#include "core/errors.hpp"
#include "events/types.hpp"

namespace smc {
namespace structure {

// True range of candle i (first candle: high - low)
template <typename T>
inline T true_range(const std::vector<Candle>& candles, size_t i) {
    const Candle& c = candles[i];
    T tr = static_cast<T>(c.high - c.low);
    if (i > 0) {
        const double pc = candles[i - 1].close;
        tr = std::max(tr, static_cast<T>(std::abs(c.high - pc)));
        tr = std::max(tr, static_cast<T>(std::abs(c.low - pc)));
    }
    return tr;
}

// atr[i] = mean true range over [max(0, i - period + 1), i].
// Partial windows at the start of the series average what is available,
// so every candle has a usable value.
template <typename T>
std::vector<T> atr_series(const std::vector<Candle>& candles, int period) {
    require_positive(period, "atr_period");
    const size_t n = candles.size();
    const size_t p = static_cast<size_t>(period);

    std::vector<T> tr(n);
    for (size_t i = 0; i < n; ++i) tr[i] = true_range<T>(candles, i);

    std::vector<T> out(n, T(0));
    T sum{0};
    for (size_t i = 0; i < n; ++i) {
        sum += tr[i];
        if (i >= p) sum -= tr[i - p];
        const size_t w = std::min(i + 1, p);
        out[i] = sum / static_cast<T>(w);
    }
    return out;
}

} // namespace structure
} // namespace smc
