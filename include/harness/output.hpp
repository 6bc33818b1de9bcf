// JSON output writer for analysis results
#pragma once

#include <fstream>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "core/json_utils.hpp"
#include "core/numeric_types.hpp"
#include "harness/runner.hpp"
#include "structure/sessions.hpp"
#include "structure/types.hpp"

namespace json = boost::json;

namespace smc {
namespace harness {

using namespace structure;

template <typename T>
json::object swing_json(const SwingPoint<T>& s) {
    json::object o;
    o["index"] = static_cast<uint64_t>(s.index);
    o["ts"] = s.ts;
    o["price"] = real_to_json(s.price);
    o["kind"] = to_string(s.kind);
    if (s.role) {
        o["role"] = to_string(*s.role);
    } else {
        o["role"] = nullptr;
    }
    o["confirmed_index"] = static_cast<uint64_t>(s.confirmed_index);
    return o;
}

template <typename T>
json::object event_json(const StructureEvent<T>& e) {
    json::object o;
    o["kind"] = to_string(e.kind);
    o["direction"] = to_string(e.direction);
    o["break_index"] = static_cast<uint64_t>(e.break_index);
    o["break_ts"] = e.break_ts;
    o["break_price"] = real_to_json(e.break_price);
    o["pivot_index"] = static_cast<uint64_t>(e.pivot_index);
    o["pivot_ts"] = e.pivot_ts;
    o["impulse_origin_index"] = opt_index_json(e.impulse_origin_index);
    o["description"] = e.description;
    return o;
}

template <typename T>
json::object order_block_json(const OrderBlock<T>& b) {
    json::object o;
    o["kind"] = to_string(b.kind);
    o["candle_index"] = static_cast<uint64_t>(b.candle_index);
    o["ts"] = b.ts;
    o["high"] = real_to_json(b.high);
    o["low"] = real_to_json(b.low);
    o["mid"] = real_to_json(b.mid);
    o["state"] = to_string(b.state);
    o["mitigation_level"] = b.mitigation_level;
    o["liquidity_swept"] = b.liquidity_swept ? real_to_json(*b.liquidity_swept) : json::value(nullptr);
    o["lookback_candles"] = static_cast<uint64_t>(b.lookback_candles);
    o["is_breaker"] = b.is_breaker;
    o["break_index"] = static_cast<uint64_t>(b.break_index);
    o["structure_kind"] = to_string(b.structure_kind);
    o["mitigated_index"] = opt_index_json(b.mitigated_index);
    o["breaker_index"] = opt_index_json(b.breaker_index);
    o["refined"] = b.refined;
    return o;
}

template <typename T>
json::object fvg_json(const FairValueGap<T>& g) {
    json::object o;
    o["kind"] = to_string(g.kind);
    o["start_index"] = static_cast<uint64_t>(g.start_index);
    o["end_index"] = static_cast<uint64_t>(g.end_index);
    o["top"] = real_to_json(g.top);
    o["bottom"] = real_to_json(g.bottom);
    o["ts"] = g.ts;
    o["mitigation_level"] = g.mitigation_level;
    return o;
}

template <typename T>
json::object liquidity_json(const LiquidityZone<T>& z) {
    json::object o;
    o["kind"] = to_string(z.side);
    o["subtype"] = to_string(z.subtype);
    o["price"] = real_to_json(z.price);
    o["ts"] = z.ts;
    o["source_index"] = static_cast<uint64_t>(z.source_index);
    o["swept"] = z.swept;
    o["sweep_ts"] = z.sweep_ts ? json::value(*z.sweep_ts) : json::value(nullptr);
    o["sweep_index"] = opt_index_json(z.sweep_index);
    if (!z.session.empty()) o["session"] = z.session;
    if (!z.related_indices.empty()) {
        json::array rel;
        for (size_t idx : z.related_indices) rel.push_back(static_cast<uint64_t>(idx));
        o["related_indices"] = std::move(rel);
    }
    return o;
}

template <typename T>
json::object pd_zone_json(const PremiumDiscountZone<T>& z) {
    json::object o;
    o["kind"] = to_string(z.kind);
    o["start_ts"] = z.start_ts;
    o["end_ts"] = z.end_ts;
    o["top"] = real_to_json(z.top);
    o["bottom"] = real_to_json(z.bottom);
    return o;
}

template <typename V, typename F>
json::array map_json(const std::vector<V>& items, F f) {
    json::array arr;
    arr.reserve(items.size());
    for (const auto& it : items) arr.push_back(f(it));
    return arr;
}

// Parameters actually used by the run (defaults filled in)
template <typename T>
json::object effective_params_json(const AnalysisConfig<T>& c) {
    json::object o;
    o["timeframe"] = to_string(c.timeframe);
    o["lookback_left"] = c.lookback_left;
    o["lookback_right"] = c.lookback_right;
    o["ob_lookback_window"] = c.ob_lookback_window;
    o["ob_min_range_atr"] = real_to_json(c.ob_min_range_atr);
    o["fvg_min_gap_size"] = real_to_json(c.fvg_min_gap_size);
    o["use_auto_threshold"] = c.use_auto_threshold;
    o["fvg_atr_multiplier"] = real_to_json(c.fvg_atr_multiplier);
    o["atr_period"] = c.atr_period;
    o["sweep_threshold_multiplier"] = real_to_json(c.sweep_threshold_multiplier);
    o["eqh_eql_threshold_multiplier"] = real_to_json(c.eqh_eql_threshold_multiplier);
    o["include_fvg_liquidity"] = c.include_fvg_liquidity;
    json::array sessions;
    for (const auto& s : c.sessions) {
        json::object so;
        so["name"] = s.name;
        so["start"] = format_hhmm(s.start_min);
        so["end"] = format_hhmm(s.end_min);
        sessions.push_back(std::move(so));
    }
    o["sessions"] = std::move(sessions);
    o["session_utc_offset_s"] = c.session_utc_offset_s;
    o["break_mode"] = to_string(c.break_mode);
    o["choch_confirmation_candles"] = c.choch_confirmation_candles;
    o["equilibrium_band"] = real_to_json(c.equilibrium_band);
    return o;
}

// Counts per stage plus the closing bias
template <typename T>
json::object analysis_summary(const AnalysisResult<T>& r, size_t n_candles) {
    const auto& a = r.analysis;
    json::object summary;
    summary["candles"] = static_cast<uint64_t>(n_candles);
    summary["swing_highs"] = static_cast<uint64_t>(a.swings.highs.size());
    summary["swing_lows"] = static_cast<uint64_t>(a.swings.lows.size());

    uint64_t bos = 0;
    uint64_t choch = 0;
    for (const auto& e : a.structure) {
        (e.kind == StructureKind::BOS ? bos : choch) += 1;
    }
    summary["bos"] = bos;
    summary["choch"] = choch;
    summary["bias"] = to_string(a.bias);

    uint64_t ob_active = 0;
    uint64_t ob_mitigated = 0;
    uint64_t breakers = 0;
    for (const auto& b : a.order_blocks) {
        if (b.state == OBState::Mitigated) ++ob_mitigated; else ++ob_active;
        if (b.is_breaker) ++breakers;
    }
    summary["order_blocks"] = static_cast<uint64_t>(a.order_blocks.size());
    summary["order_blocks_unmitigated"] = ob_active;
    summary["order_blocks_mitigated"] = ob_mitigated;
    summary["breakers"] = breakers;

    uint64_t filled = 0;
    for (const auto& g : a.fvgs) {
        if (g.filled()) ++filled;
    }
    summary["fvgs"] = static_cast<uint64_t>(a.fvgs.size());
    summary["fvgs_filled"] = filled;

    uint64_t swept = 0;
    for (const auto& z : a.liquidity) {
        if (z.swept) ++swept;
    }
    summary["liquidity_zones"] = static_cast<uint64_t>(a.liquidity.size());
    summary["liquidity_swept"] = swept;
    summary["premium_discount_zones"] = static_cast<uint64_t>(a.premium_discount.size());
    summary["exec_ms"] = r.elapsed_ms;
    return summary;
}

// Output format for the entire run
template <typename T>
json::object build_output_json(
    const std::vector<AnalysisResult<T>>& results,
    size_t n_candles,
    const std::string& data_path,
    size_t n_threads,
    double candles_read_ms,
    double exec_ms
) {
    json::object meta;
    meta["candles_file"] = data_path;
    meta["candles"] = static_cast<uint64_t>(n_candles);
    meta["threads"] = static_cast<uint64_t>(n_threads);
    meta["real_type"] = NumTraits<T>::name;
    meta["candles_read_ms"] = candles_read_ms;
    meta["exec_ms"] = exec_ms;

    json::array runs;
    runs.reserve(results.size());

    for (const auto& r : results) {
        json::object run;

        json::object params;
        if (!r.tag.empty()) params["tag"] = r.tag;
        params["config"] = r.config.echo;
        params["effective"] = effective_params_json(r.config);
        run["params"] = std::move(params);

        run["success"] = r.success;
        if (!r.success) {
            run["error"] = r.error_msg;
            runs.push_back(std::move(run));
            continue;
        }

        const auto& a = r.analysis;
        run["result"] = analysis_summary(r, n_candles);
        run["swings"] = map_json(a.classified, [](const SwingPoint<T>& s) { return swing_json(s); });
        run["structure"] = map_json(a.structure, [](const StructureEvent<T>& e) { return event_json(e); });
        run["order_blocks"] = map_json(a.order_blocks, [](const OrderBlock<T>& b) { return order_block_json(b); });
        run["fvgs"] = map_json(a.fvgs, [](const FairValueGap<T>& g) { return fvg_json(g); });
        run["liquidity"] = map_json(a.liquidity, [](const LiquidityZone<T>& z) { return liquidity_json(z); });
        run["premium_discount"] = map_json(a.premium_discount,
                                           [](const PremiumDiscountZone<T>& z) { return pd_zone_json(z); });

        if (!r.transitions.empty()) {
            run["transitions"] = transitions_to_json(r.transitions);
        }

        runs.push_back(std::move(run));
    }

    json::object O;
    O["metadata"] = meta;
    O["runs"] = runs;
    return O;
}

// Write results to JSON file
template <typename T>
bool write_results_json(
    const std::string& output_path,
    const std::vector<AnalysisResult<T>>& results,
    size_t n_candles,
    const std::string& data_path,
    size_t n_threads,
    double candles_read_ms,
    double exec_ms
) {
    auto O = build_output_json(
        results, n_candles, data_path, n_threads,
        candles_read_ms, exec_ms
    );

    std::ofstream of(output_path);
    if (!of) {
        return false;
    }

    of << json::serialize(O) << '\n';
    return of.good();
}

} // namespace harness
} // namespace smc
