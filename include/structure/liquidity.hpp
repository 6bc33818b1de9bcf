// Resting liquidity zones and sweep detection
#pragma once

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "events/types.hpp"
#include "structure/atr.hpp"
#include "structure/sessions.hpp"
#include "structure/transitions.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

template <typename T>
class LiquidityDetector {
public:
    LiquidityDetector(T sweep_threshold_multiplier,
                      T eqh_eql_threshold_multiplier,
                      std::vector<SessionWindow> sessions = default_sessions(),
                      int atr_period = 14,
                      int64_t session_utc_offset_s = 0)
        : sweep_mult_(sweep_threshold_multiplier),
          eq_mult_(eqh_eql_threshold_multiplier),
          sessions_(std::move(sessions)),
          atr_period_(atr_period),
          utc_offset_s_(session_utc_offset_s) {
        require_positive(sweep_threshold_multiplier, "sweep_threshold_multiplier");
        require_positive(eqh_eql_threshold_multiplier, "eqh_eql_threshold_multiplier");
        require_positive(atr_period, "atr_period");
        for (const auto& s : sessions_) s.validate();
    }

    const std::vector<SessionWindow>& sessions() const { return sessions_; }

    // Zones from swing extremes, session extremes, equal-high/low clusters and
    // (when gaps are given) unfilled gap midpoints, each evaluated for a sweep.
    std::vector<LiquidityZone<T>> detect(const std::vector<Candle>& candles,
                                         const std::vector<SwingPoint<T>>& swing_highs,
                                         const std::vector<SwingPoint<T>>& swing_lows,
                                         const std::vector<FairValueGap<T>>* fvgs = nullptr,
                                         TransitionLogger<T>* log = nullptr) const {
        std::vector<LiquidityZone<T>> zones;
        const size_t n = candles.size();
        if (n == 0) return zones;

        const std::vector<T> atr = atr_series<T>(candles, atr_period_);

        for (const auto& sp : swing_highs) {
            if (sp.index < n) zones.push_back(make_zone(LiquiditySide::BuySide, LiquiditySubtype::Swing, sp.price, sp.ts, sp.index));
        }
        for (const auto& sp : swing_lows) {
            if (sp.index < n) zones.push_back(make_zone(LiquiditySide::SellSide, LiquiditySubtype::Swing, sp.price, sp.ts, sp.index));
        }

        add_session_zones(candles, zones);
        add_clusters(swing_highs, atr, LiquiditySubtype::EQH, zones);
        add_clusters(swing_lows, atr, LiquiditySubtype::EQL, zones);

        if (fvgs) {
            for (const auto& g : *fvgs) {
                if (g.filled() || g.end_index >= n) continue;
                const LiquiditySide side = g.kind == Direction::Bullish ? LiquiditySide::SellSide
                                                                        : LiquiditySide::BuySide;
                zones.push_back(make_zone(side, LiquiditySubtype::FvgMid, g.mid(), g.ts, g.end_index));
            }
        }

        for (auto& z : zones) evaluate_sweep(candles, atr, z, log);

        std::stable_sort(zones.begin(), zones.end(), [](const LiquidityZone<T>& a, const LiquidityZone<T>& b) {
            return std::make_tuple(a.source_index, static_cast<int>(a.side), static_cast<int>(a.subtype), a.price) <
                   std::make_tuple(b.source_index, static_cast<int>(b.side), static_cast<int>(b.subtype), b.price);
        });
        return zones;
    }

private:
    static LiquidityZone<T> make_zone(LiquiditySide side, LiquiditySubtype subtype, T price, uint64_t ts, size_t source) {
        LiquidityZone<T> z;
        z.side = side;
        z.subtype = subtype;
        z.price = price;
        z.ts = ts;
        z.source_index = source;
        return z;
    }

    // One high/low pair per session occurrence; ties keep the earliest candle
    void add_session_zones(const std::vector<Candle>& candles, std::vector<LiquidityZone<T>>& zones) const {
        for (const auto& w : sessions_) {
            std::map<int64_t, std::pair<size_t, size_t>> per_day;   // day -> (high idx, low idx)
            for (size_t i = 0; i < candles.size(); ++i) {
                const SessionClock clk = session_clock(candles[i].ts, utc_offset_s_);
                if (!w.contains(clk.minute)) continue;
                const int64_t day = session_day(w, clk);
                auto it = per_day.find(day);
                if (it == per_day.end()) {
                    per_day.emplace(day, std::make_pair(i, i));
                    continue;
                }
                if (candles[i].high > candles[it->second.first].high) it->second.first = i;
                if (candles[i].low < candles[it->second.second].low) it->second.second = i;
            }
            for (const auto& kv : per_day) {
                const Candle& hi = candles[kv.second.first];
                const Candle& lo = candles[kv.second.second];
                auto zh = make_zone(LiquiditySide::BuySide, LiquiditySubtype::Session, static_cast<T>(hi.high), hi.ts, kv.second.first);
                auto zl = make_zone(LiquiditySide::SellSide, LiquiditySubtype::Session, static_cast<T>(lo.low), lo.ts, kv.second.second);
                zh.session = w.name;
                zl.session = w.name;
                zones.push_back(std::move(zh));
                zones.push_back(std::move(zl));
            }
        }
    }

    // Consecutive swings whose whole spread stays within eq_mult * ATR (ATR
    // taken at the newest member) form one equal-highs / equal-lows pool.
    void add_clusters(const std::vector<SwingPoint<T>>& swings, const std::vector<T>& atr,
                      LiquiditySubtype subtype, std::vector<LiquidityZone<T>>& zones) const {
        std::vector<SwingPoint<T>> sorted;
        for (const auto& sp : swings) {
            if (sp.index < atr.size()) sorted.push_back(sp);
        }
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const SwingPoint<T>& a, const SwingPoint<T>& b) { return a.index < b.index; });

        const bool highs = subtype == LiquiditySubtype::EQH;
        std::vector<const SwingPoint<T>*> cluster;
        T lo{0};
        T hi{0};

        auto flush = [&]() {
            if (cluster.size() >= 2) {
                const SwingPoint<T>& last = *cluster.back();
                auto z = make_zone(highs ? LiquiditySide::BuySide : LiquiditySide::SellSide,
                                   subtype, highs ? hi : lo, last.ts, last.index);
                for (const auto* m : cluster) z.related_indices.push_back(m->index);
                zones.push_back(std::move(z));
            }
            cluster.clear();
        };

        for (const auto& sp : sorted) {
            if (!cluster.empty()) {
                const T nlo = std::min(lo, sp.price);
                const T nhi = std::max(hi, sp.price);
                if (nhi - nlo <= eq_mult_ * atr[sp.index]) {
                    cluster.push_back(&sp);
                    lo = nlo;
                    hi = nhi;
                    continue;
                }
                flush();
            }
            cluster.push_back(&sp);
            lo = sp.price;
            hi = sp.price;
        }
        flush();
    }

    // A wick beyond price +/- sweep_mult * ATR, then a later candle closing
    // back on the origin side. The breach candle's own close does not count,
    // and a touch alone is not a sweep.
    void evaluate_sweep(const std::vector<Candle>& candles, const std::vector<T>& atr,
                        LiquidityZone<T>& z, TransitionLogger<T>* log) const {
        const bool buy = z.side == LiquiditySide::BuySide;
        for (size_t j = z.source_index + 1; j < candles.size(); ++j) {
            const T tol = sweep_mult_ * atr[j];
            const T extreme = static_cast<T>(buy ? candles[j].high : candles[j].low);
            const bool breached = buy ? extreme > z.price + tol : extreme < z.price - tol;
            if (!breached) continue;

            for (size_t k = j + 1; k < candles.size(); ++k) {
                const T close = static_cast<T>(candles[k].close);
                if (buy ? close < z.price : close > z.price) {
                    z.swept = true;
                    z.sweep_ts = candles[k].ts;
                    z.sweep_index = k;
                    if (log) log->log_sweep(z, j, extreme, k, candles[k]);
                    return;
                }
            }
            return;
        }
    }

    T sweep_mult_;
    T eq_mult_;
    std::vector<SessionWindow> sessions_;
    int atr_period_;
    int64_t utc_offset_s_;
};

} // namespace structure
} // namespace smc
