// Order block detection and lifecycle replay
#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <vector>

#include "core/errors.hpp"
#include "events/types.hpp"
#include "structure/atr.hpp"
#include "structure/transitions.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

template <typename T>
class OrderBlockDetector {
public:
    explicit OrderBlockDetector(int lookback_window, T min_range_atr = T(0), int atr_period = 14)
        : lookback_window_(lookback_window), min_range_atr_(min_range_atr), atr_period_(atr_period) {
        require_positive(lookback_window, "ob_lookback_window");
        require_non_negative(min_range_atr, "ob_min_range_atr");
        require_positive(atr_period, "atr_period");
    }

    int lookback_window() const { return lookback_window_; }

    // One zone per structure event: the last candle opposite to the break
    // direction before the break. Blocks come out in event order, all Active.
    std::vector<OrderBlock<T>> detect(const std::vector<Candle>& candles,
                                      const std::vector<StructureEvent<T>>& events,
                                      const std::vector<Candle>* ltf_candles = nullptr,
                                      const std::vector<LiquidityZone<T>>* liquidity = nullptr) const {
        std::vector<OrderBlock<T>> out;
        if (candles.empty() || events.empty()) return out;

        std::vector<T> atr;
        if (min_range_atr_ > T(0)) atr = atr_series<T>(candles, atr_period_);

        std::set<size_t> used;
        const size_t window = static_cast<size_t>(lookback_window_);

        for (const auto& ev : events) {
            if (ev.break_index == 0 || ev.break_index >= candles.size()) continue;
            const size_t floor_idx = ev.break_index > window ? ev.break_index - window : 0;

            std::optional<size_t> origin;
            for (size_t k = ev.break_index; k-- > floor_idx;) {
                const Candle& c = candles[k];
                const bool opposite = ev.direction == Direction::Bullish ? c.is_bearish() : c.is_bullish();
                if (!opposite) continue;
                if (!atr.empty() && static_cast<T>(c.range()) < min_range_atr_ * atr[k]) continue;
                origin = k;
                break;
            }
            if (!origin || used.count(*origin)) continue;
            used.insert(*origin);

            const Candle& c = candles[*origin];
            OrderBlock<T> ob;
            ob.kind = ev.direction;
            ob.candle_index = *origin;
            ob.ts = c.ts;
            ob.high = static_cast<T>(c.high);
            ob.low = static_cast<T>(c.low);
            ob.mid = (ob.high + ob.low) / T(2);
            ob.lookback_candles = ev.break_index - *origin;
            ob.break_index = ev.break_index;
            ob.structure_kind = ev.kind;

            if (ltf_candles && !ltf_candles->empty()) refine(candles, *ltf_candles, ob);
            if (liquidity) ob.liquidity_swept = swept_before(candles, *liquidity, ob);

            out.push_back(std::move(ob));
        }
        return out;
    }

    // Replay every candle after the break from a fresh Active state.
    // Active -> Touched -> Partial -> Mitigated, never backwards; a mitigated
    // block that price re-enters from the far side and rejects is a breaker.
    std::vector<OrderBlock<T>> update_states(const std::vector<Candle>& candles,
                                             const std::vector<OrderBlock<T>>& obs,
                                             TransitionLogger<T>* log = nullptr) const {
        std::vector<OrderBlock<T>> out;
        out.reserve(obs.size());
        for (const auto& src : obs) {
            OrderBlock<T> ob = src;
            ob.state = OBState::Active;
            ob.mitigation_level = 0;
            ob.mitigated_index.reset();
            ob.is_breaker = false;
            ob.breaker_index.reset();

            const bool bull = ob.kind == Direction::Bullish;
            const T range = ob.range();

            for (size_t i = ob.break_index + 1; i < candles.size(); ++i) {
                const Candle& c = candles[i];
                const T hi = static_cast<T>(c.high);
                const T lo = static_cast<T>(c.low);
                const T close = static_cast<T>(c.close);
                // reached from the approach side; a candle gapping past the
                // far boundary counts as full penetration
                const bool reached = bull ? lo <= ob.high : hi >= ob.low;

                if (ob.state == OBState::Mitigated) {
                    if (ob.is_breaker) break;
                    // far side: below a bullish block, above a bearish one
                    const bool rejected = bull ? (hi >= ob.low && close < ob.low)
                                               : (lo <= ob.high && close > ob.high);
                    if (rejected) {
                        ob.is_breaker = true;
                        ob.breaker_index = i;
                        if (log) log->log_ob(ob, i, c, OBState::Mitigated, true);
                    }
                    continue;
                }
                if (!reached) continue;

                const OBState from = ob.state;
                OBState next = OBState::Touched;
                if (bull ? close < ob.low : close > ob.high) {
                    next = OBState::Mitigated;
                } else if (bull ? close < ob.mid : close > ob.mid) {
                    next = OBState::Partial;
                }
                if (next > ob.state) ob.state = next;

                int level = 4;
                if (range > T(0)) {
                    T pen = bull ? (ob.high - lo) / range : (hi - ob.low) / range;
                    pen = std::min(std::max(pen, T(0)), T(1));
                    level = static_cast<int>(std::floor(static_cast<double>(pen) * 4.0));
                }
                if (ob.state == OBState::Mitigated) level = 4;
                ob.mitigation_level = std::max(ob.mitigation_level, std::min(level, 4));

                if (ob.state == OBState::Mitigated && from != OBState::Mitigated) ob.mitigated_index = i;
                if (ob.state != from && log) log->log_ob(ob, i, c, from, false);
            }
            out.push_back(std::move(ob));
        }
        return out;
    }

private:
    // Tighten the zone to the lower-timeframe candle that made the extreme
    // inside the higher-timeframe candle's interval.
    static void refine(const std::vector<Candle>& htf, const std::vector<Candle>& ltf, OrderBlock<T>& ob) {
        uint64_t interval = 0;
        const size_t k = ob.candle_index;
        if (k + 1 < htf.size() && htf[k + 1].ts > htf[k].ts) {
            interval = htf[k + 1].ts - htf[k].ts;
        } else if (k > 0 && htf[k].ts > htf[k - 1].ts) {
            interval = htf[k].ts - htf[k - 1].ts;
        }
        if (interval == 0) return;

        const Candle* best = nullptr;
        for (const auto& c : ltf) {
            if (c.ts < ob.ts || c.ts >= ob.ts + interval) continue;
            if (static_cast<T>(c.low) > ob.high || static_cast<T>(c.high) < ob.low) continue;
            if (!best) {
                best = &c;
            } else if (ob.kind == Direction::Bullish ? c.low < best->low : c.high > best->high) {
                best = &c;
            }
        }
        if (!best) return;

        ob.high = std::min(ob.high, static_cast<T>(best->high));
        ob.low = std::max(ob.low, static_cast<T>(best->low));
        ob.mid = (ob.high + ob.low) / T(2);
        ob.refined = true;
    }

    // Most recent opposite-side pool taken out on the way into the block
    std::optional<T> swept_before(const std::vector<Candle>& candles,
                                  const std::vector<LiquidityZone<T>>& zones,
                                  const OrderBlock<T>& ob) const {
        const LiquiditySide want = ob.kind == Direction::Bullish ? LiquiditySide::SellSide
                                                                 : LiquiditySide::BuySide;
        const size_t k = ob.candle_index;
        const size_t window = static_cast<size_t>(lookback_window_);

        const LiquidityZone<T>* best = nullptr;
        for (const auto& z : zones) {
            if (z.side != want || z.source_index >= k || k - z.source_index > window) continue;
            bool pierced = false;
            for (size_t j = z.source_index + 1; j <= k && !pierced; ++j) {
                pierced = want == LiquiditySide::SellSide ? static_cast<T>(candles[j].low) < z.price
                                                          : static_cast<T>(candles[j].high) > z.price;
            }
            if (pierced && (!best || z.source_index > best->source_index)) best = &z;
        }
        if (!best) return std::nullopt;
        return best->price;
    }

    int lookback_window_;
    T min_range_atr_;
    int atr_period_;
};

} // namespace structure
} // namespace smc
