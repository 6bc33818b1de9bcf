// Market structure detection (BOS / CHOCH)
#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "events/types.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

// What has to trade beyond a pivot for it to count as broken
enum class BreakMode { Close, Wick };

inline const char* to_string(BreakMode m) {
    return m == BreakMode::Close ? "close" : "wick";
}

// Prevailing bias after a sequence of events (direction of the last one)
template <typename T>
Bias current_bias(const std::vector<StructureEvent<T>>& events) {
    if (events.empty()) return Bias::Neutral;
    return events.back().direction == Direction::Bullish ? Bias::Bullish : Bias::Bearish;
}

template <typename T>
class MarketStructureDetector {
public:
    explicit MarketStructureDetector(BreakMode mode = BreakMode::Close, int choch_confirmation = 0)
        : mode_(mode), choch_confirmation_(choch_confirmation) {
        require_non_negative(choch_confirmation, "choch_confirmation_candles");
    }

    // Forward scan over candles. The reference high/low is the most recently
    // confirmed swing of that kind that has not been broken yet. A break in
    // the direction of the prevailing bias is a BOS; any other break (opposite
    // bias, or no bias yet) is a CHOCH and flips the bias. A broken reference
    // is consumed; at most one event per candle, bullish checked first.
    std::vector<StructureEvent<T>> detect(const std::vector<Candle>& candles,
                                          const std::vector<SwingPoint<T>>& swings) const {
        std::vector<StructureEvent<T>> events;

        std::vector<SwingPoint<T>> highs;
        std::vector<SwingPoint<T>> lows;
        for (const auto& sp : swings) {
            (sp.kind == SwingKind::High ? highs : lows).push_back(sp);
        }
        if (highs.size() < 2 || lows.size() < 2) return events;

        auto by_confirmation = [](const SwingPoint<T>& a, const SwingPoint<T>& b) {
            if (a.confirmed_index != b.confirmed_index) return a.confirmed_index < b.confirmed_index;
            return a.index < b.index;
        };
        std::stable_sort(highs.begin(), highs.end(), by_confirmation);
        std::stable_sort(lows.begin(), lows.end(), by_confirmation);

        const size_t n = candles.size();
        size_t next_high = 0;
        size_t next_low = 0;
        std::optional<SwingPoint<T>> ref_high;
        std::optional<SwingPoint<T>> ref_low;
        Bias bias = Bias::Neutral;

        for (size_t i = 0; i < n; ++i) {
            while (next_high < highs.size() && highs[next_high].confirmed_index < i) {
                ref_high = highs[next_high++];
            }
            while (next_low < lows.size() && lows[next_low].confirmed_index < i) {
                ref_low = lows[next_low++];
            }

            const Candle& c = candles[i];
            bool fired = false;

            if (ref_high && breaks_above(c, ref_high->price)) {
                const StructureKind kind = bias == Bias::Bullish ? StructureKind::BOS : StructureKind::CHOCH;
                if (kind == StructureKind::BOS || confirmed(candles, i, ref_high->price, Direction::Bullish)) {
                    events.push_back(make_event(candles, i, kind, Direction::Bullish, *ref_high, lows));
                    bias = Bias::Bullish;
                    ref_high.reset();
                    fired = true;
                }
            }

            if (!fired && ref_low && breaks_below(c, ref_low->price)) {
                const StructureKind kind = bias == Bias::Bearish ? StructureKind::BOS : StructureKind::CHOCH;
                if (kind == StructureKind::BOS || confirmed(candles, i, ref_low->price, Direction::Bearish)) {
                    events.push_back(make_event(candles, i, kind, Direction::Bearish, *ref_low, highs));
                    bias = Bias::Bearish;
                    ref_low.reset();
                }
            }
        }
        return events;
    }

    BreakMode mode() const { return mode_; }
    int choch_confirmation() const { return choch_confirmation_; }

private:
    bool breaks_above(const Candle& c, T level) const {
        const T px = static_cast<T>(mode_ == BreakMode::Close ? c.close : c.high);
        return px > level;
    }

    bool breaks_below(const Candle& c, T level) const {
        const T px = static_cast<T>(mode_ == BreakMode::Close ? c.close : c.low);
        return px < level;
    }

    // A CHOCH needs choch_confirmation_ following closes beyond the level
    bool confirmed(const std::vector<Candle>& candles, size_t i, T level, Direction dir) const {
        if (choch_confirmation_ == 0) return true;
        const size_t k = static_cast<size_t>(choch_confirmation_);
        if (i + k >= candles.size()) return false;
        for (size_t j = 1; j <= k; ++j) {
            const T close = static_cast<T>(candles[i + j].close);
            if (dir == Direction::Bullish ? !(close > level) : !(close < level)) return false;
        }
        return true;
    }

    // Impulse origin: most recent opposite swing already known at the break
    static std::optional<size_t> impulse_origin(const std::vector<SwingPoint<T>>& opposite, size_t i) {
        std::optional<size_t> best;
        for (const auto& sp : opposite) {
            if (sp.index < i && sp.confirmed_index <= i) {
                if (!best || sp.index > *best) best = sp.index;
            }
        }
        return best;
    }

    static StructureEvent<T> make_event(const std::vector<Candle>& candles, size_t i,
                                        StructureKind kind, Direction dir,
                                        const SwingPoint<T>& pivot,
                                        const std::vector<SwingPoint<T>>& opposite) {
        StructureEvent<T> ev;
        ev.kind = kind;
        ev.direction = dir;
        ev.break_index = i;
        ev.break_ts = candles[i].ts;
        ev.break_price = pivot.price;
        ev.pivot_index = pivot.index;
        ev.pivot_ts = pivot.ts;
        ev.impulse_origin_index = impulse_origin(opposite, i);
        if (kind == StructureKind::BOS) {
            ev.description = dir == Direction::Bullish ? "Higher High" : "Lower Low";
        } else {
            ev.description = dir == Direction::Bullish ? "Trend shift to bullish" : "Trend shift to bearish";
        }
        return ev;
    }

    BreakMode mode_;
    int choch_confirmation_;
};

} // namespace structure
} // namespace smc
