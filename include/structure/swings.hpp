// Swing point detection and HH/HL/LH/LL classification
#pragma once

#include <algorithm>
#include <optional>
#include <vector>

#include "core/common.hpp"
#include "core/errors.hpp"
#include "events/types.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

template <typename T>
class SwingDetector {
public:
    SwingDetector(int lookback_left, int lookback_right)
        : left_(lookback_left), right_(lookback_right) {
        require_positive(lookback_left, "lookback_left");
        require_positive(lookback_right, "lookback_right");
    }

    int lookback_left() const { return left_; }
    int lookback_right() const { return right_; }

    // Minimum series length for any swing to exist
    size_t min_candles() const { return static_cast<size_t>(left_ + right_ + 1); }

    // Candle i is a swing high iff high[i] >= every high in [i-left, i+right].
    // A later candidate with the same price inside the right window of an
    // already emitted swing is skipped (earliest wins). Symmetric for lows.
    SwingSet<T> detect(const std::vector<Candle>& candles) const {
        SwingSet<T> out;
        const size_t n = candles.size();
        if (n < min_candles()) return out;

        const size_t L = static_cast<size_t>(left_);
        const size_t R = static_cast<size_t>(right_);
        std::optional<size_t> last_high;
        std::optional<size_t> last_low;

        for (size_t i = L; i + R < n; ++i) {
            const Candle& c = candles[i];

            bool is_high = true;
            bool is_low = true;
            for (size_t j = 1; j <= L && (is_high || is_low); ++j) {
                if (candles[i - j].high > c.high) is_high = false;
                if (candles[i - j].low < c.low) is_low = false;
            }
            for (size_t j = 1; j <= R && (is_high || is_low); ++j) {
                if (candles[i + j].high > c.high) is_high = false;
                if (candles[i + j].low < c.low) is_low = false;
            }

            if (is_high && !(last_high && i - *last_high <= R &&
                             same_price(c.high, candles[*last_high].high))) {
                out.highs.push_back(make_point(i, c, static_cast<T>(c.high), SwingKind::High));
                last_high = i;
            }
            if (is_low && !(last_low && i - *last_low <= R &&
                            same_price(c.low, candles[*last_low].low))) {
                out.lows.push_back(make_point(i, c, static_cast<T>(c.low), SwingKind::Low));
                last_low = i;
            }
        }
        return out;
    }

    // Merge highs and lows by time and tag each against the previous swing of
    // the same kind. The first high and first low stay unclassified. An equal
    // high counts as a lower high, an equal low as a higher low.
    static std::vector<SwingPoint<T>> classify(const std::vector<SwingPoint<T>>& highs,
                                               const std::vector<SwingPoint<T>>& lows) {
        std::vector<SwingPoint<T>> merged;
        merged.reserve(highs.size() + lows.size());
        merged.insert(merged.end(), highs.begin(), highs.end());
        merged.insert(merged.end(), lows.begin(), lows.end());
        std::stable_sort(merged.begin(), merged.end(), [](const SwingPoint<T>& a, const SwingPoint<T>& b) {
            if (a.ts != b.ts) return a.ts < b.ts;
            if (a.index != b.index) return a.index < b.index;
            return a.kind == SwingKind::High && b.kind == SwingKind::Low;
        });

        std::optional<T> prev_high;
        std::optional<T> prev_low;
        for (auto& sp : merged) {
            if (sp.kind == SwingKind::High) {
                if (prev_high) {
                    const bool higher = sp.price > *prev_high && !same_price(sp.price, *prev_high);
                    sp.role = higher ? SwingRole::HH : SwingRole::LH;
                } else {
                    sp.role.reset();
                }
                prev_high = sp.price;
            } else {
                if (prev_low) {
                    const bool lower = sp.price < *prev_low && !same_price(sp.price, *prev_low);
                    sp.role = lower ? SwingRole::LL : SwingRole::HL;
                } else {
                    sp.role.reset();
                }
                prev_low = sp.price;
            }
        }
        return merged;
    }

    static std::vector<SwingPoint<T>> classify(const SwingSet<T>& set) {
        return classify(set.highs, set.lows);
    }

private:
    SwingPoint<T> make_point(size_t i, const Candle& c, T price, SwingKind kind) const {
        SwingPoint<T> sp;
        sp.index = i;
        sp.ts = c.ts;
        sp.price = price;
        sp.kind = kind;
        sp.confirmed_index = i + static_cast<size_t>(right_);
        return sp;
    }

    int left_;
    int right_;
};

} // namespace structure
} // namespace smc
