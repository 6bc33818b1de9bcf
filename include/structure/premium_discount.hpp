// Premium / discount partition of the latest dealing range
#pragma once

#include <algorithm>
#include <vector>

#include "core/errors.hpp"
#include "events/types.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

template <typename T>
class PremiumDiscountDetector {
public:
    static constexpr double OTE_LOW = 0.62;
    static constexpr double OTE_HIGH = 0.79;

    // Range = latest swing high and latest swing low (by ts). Zones in order:
    // equilibrium, premium, discount, OTE. Empty for a missing or inverted range.
    static std::vector<PremiumDiscountZone<T>> detect(const std::vector<Candle>& candles,
                                                      const std::vector<SwingPoint<T>>& highs,
                                                      const std::vector<SwingPoint<T>>& lows,
                                                      T equilibrium_band = T(0)) {
        require_non_negative(equilibrium_band, "equilibrium_band");
        std::vector<PremiumDiscountZone<T>> out;
        if (candles.empty() || highs.empty() || lows.empty()) return out;

        auto by_ts = [](const SwingPoint<T>& a, const SwingPoint<T>& b) {
            if (a.ts != b.ts) return a.ts < b.ts;
            return a.index < b.index;
        };
        const SwingPoint<T>& hi = *std::max_element(highs.begin(), highs.end(), by_ts);
        const SwingPoint<T>& lo = *std::max_element(lows.begin(), lows.end(), by_ts);
        if (!(hi.price > lo.price)) return out;

        const T range = hi.price - lo.price;
        const T eq = lo.price + range / T(2);
        const T half_band = equilibrium_band * range / T(2);
        const uint64_t start_ts = std::min(hi.ts, lo.ts);
        const uint64_t end_ts = candles.back().ts;

        auto zone = [&](ZoneKind kind, T top, T bottom) {
            PremiumDiscountZone<T> z;
            z.kind = kind;
            z.start_ts = start_ts;
            z.end_ts = end_ts;
            z.top = top;
            z.bottom = bottom;
            return z;
        };

        out.push_back(zone(ZoneKind::Equilibrium, eq + half_band, eq - half_band));
        out.push_back(zone(ZoneKind::Premium, hi.price, eq));
        out.push_back(zone(ZoneKind::Discount, eq, lo.price));
        out.push_back(zone(ZoneKind::OTE, lo.price + static_cast<T>(OTE_HIGH) * range,
                           lo.price + static_cast<T>(OTE_LOW) * range));
        return out;
    }
};

} // namespace structure
} // namespace smc
