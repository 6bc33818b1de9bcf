// Fair value gap (three-candle imbalance) detection and fill tracking
#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

#include "core/errors.hpp"
#include "events/types.hpp"
#include "structure/atr.hpp"
#include "structure/transitions.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

template <typename T>
class FVGDetector {
public:
    FVGDetector(T min_gap_size, bool use_auto_threshold, int atr_period = 14, T atr_multiplier = T(0.25))
        : min_gap_size_(min_gap_size),
          use_auto_threshold_(use_auto_threshold),
          atr_period_(atr_period),
          atr_multiplier_(atr_multiplier) {
        // the fixed threshold is only optional when ATR supplies one
        if (use_auto_threshold) {
            require_non_negative(min_gap_size, "fvg_min_gap_size");
        } else {
            require_positive(min_gap_size, "fvg_min_gap_size");
        }
        require_positive(atr_period, "atr_period");
        require_positive(atr_multiplier, "fvg_atr_multiplier");
    }

    bool use_auto_threshold() const { return use_auto_threshold_; }

    // Every complete window (i-1, i, i+1). Bullish when the third candle's low
    // clears the first candle's high, bearish when the third candle's high is
    // below the first candle's low. Gaps come out untouched (level 0).
    std::vector<FairValueGap<T>> detect(const std::vector<Candle>& candles) const {
        std::vector<FairValueGap<T>> out;
        const size_t n = candles.size();
        if (n < 3) return out;

        std::vector<T> atr;
        if (use_auto_threshold_) atr = atr_series<T>(candles, atr_period_);

        for (size_t i = 1; i + 1 < n; ++i) {
            const Candle& a = candles[i - 1];
            const Candle& b = candles[i + 1];
            const T threshold = use_auto_threshold_ ? atr_multiplier_ * atr[i + 1] : min_gap_size_;

            FairValueGap<T> gap;
            gap.start_index = i - 1;
            gap.end_index = i + 1;
            gap.ts = candles[i].ts;

            if (b.low > a.high) {
                gap.kind = Direction::Bullish;
                gap.top = static_cast<T>(b.low);
                gap.bottom = static_cast<T>(a.high);
            } else if (b.high < a.low) {
                gap.kind = Direction::Bearish;
                gap.top = static_cast<T>(a.low);
                gap.bottom = static_cast<T>(b.high);
            } else {
                continue;
            }
            if (!(gap.size() > threshold)) continue;
            out.push_back(gap);
        }
        return out;
    }

    // Replay candles after each gap: level = floor(4 * retraced fraction),
    // 4 once the far edge is reached. Levels only increase.
    std::vector<FairValueGap<T>> update_mitigation(const std::vector<Candle>& candles,
                                                   const std::vector<FairValueGap<T>>& gaps,
                                                   TransitionLogger<T>* log = nullptr) const {
        std::vector<FairValueGap<T>> out;
        out.reserve(gaps.size());
        for (const auto& src : gaps) {
            FairValueGap<T> gap = src;
            gap.mitigation_level = 0;
            const T size = gap.size();

            for (size_t i = gap.end_index + 1; i < candles.size() && gap.mitigation_level < 4; ++i) {
                const Candle& c = candles[i];
                int level = 0;
                if (gap.kind == Direction::Bullish) {
                    const T lo = static_cast<T>(c.low);
                    if (lo <= gap.bottom) {
                        level = 4;
                    } else if (lo < gap.top && size > T(0)) {
                        level = static_cast<int>(std::floor(static_cast<double>((gap.top - lo) / size) * 4.0));
                    }
                } else {
                    const T hi = static_cast<T>(c.high);
                    if (hi >= gap.top) {
                        level = 4;
                    } else if (hi > gap.bottom && size > T(0)) {
                        level = static_cast<int>(std::floor(static_cast<double>((hi - gap.bottom) / size) * 4.0));
                    }
                }
                level = std::min(level, 4);
                if (level > gap.mitigation_level) {
                    const int from = gap.mitigation_level;
                    gap.mitigation_level = level;
                    if (log) log->log_fvg(gap, i, c, from);
                }
            }
            out.push_back(gap);
        }
        return out;
    }

private:
    T min_gap_size_;
    bool use_auto_threshold_;
    int atr_period_;
    T atr_multiplier_;
};

} // namespace structure
} // namespace smc
