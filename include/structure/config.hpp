// Analysis configuration parsing
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/json.hpp>

#include "core/errors.hpp"
#include "core/json_utils.hpp"
#include "structure/market_structure.hpp"
#include "structure/sessions.hpp"
#include "structure/timeframe.hpp"

namespace smc {
namespace structure {

// Detector parameters for one analysis run. Zero lookbacks / window mean
// "derive from timeframe" (see apply_timeframe_defaults).
template <typename T>
struct AnalysisConfig {
    std::string tag;
    Timeframe timeframe{Timeframe::H1};

    int lookback_left{0};
    int lookback_right{0};
    int ob_lookback_window{0};
    T ob_min_range_atr{T(0)};

    T fvg_min_gap_size{T(0.0001)};
    bool use_auto_threshold{true};
    T fvg_atr_multiplier{T(0.25)};
    int atr_period{14};

    T sweep_threshold_multiplier{T(0.1)};
    T eqh_eql_threshold_multiplier{T(0.1)};
    bool include_fvg_liquidity{false};
    std::vector<SessionWindow> sessions = default_sessions();
    int64_t session_utc_offset_s{0};

    BreakMode break_mode{BreakMode::Close};
    int choch_confirmation_candles{0};

    T equilibrium_band{T(0)};

    // Echo back original JSON for params block (optional)
    boost::json::object echo{};

    void apply_timeframe_defaults() {
        if (lookback_left == 0) lookback_left = default_swing_lookback(timeframe);
        if (lookback_right == 0) lookback_right = default_swing_lookback(timeframe);
        if (ob_lookback_window == 0) ob_lookback_window = default_ob_lookback_window(timeframe);
    }

    void validate() const {
        require_positive(lookback_left, "lookback_left");
        require_positive(lookback_right, "lookback_right");
        require_positive(ob_lookback_window, "ob_lookback_window");
        require_non_negative(ob_min_range_atr, "ob_min_range_atr");
        if (use_auto_threshold) {
            require_non_negative(fvg_min_gap_size, "fvg_min_gap_size");
        } else {
            require_positive(fvg_min_gap_size, "fvg_min_gap_size");
        }
        require_positive(fvg_atr_multiplier, "fvg_atr_multiplier");
        require_positive(atr_period, "atr_period");
        require_positive(sweep_threshold_multiplier, "sweep_threshold_multiplier");
        require_positive(eqh_eql_threshold_multiplier, "eqh_eql_threshold_multiplier");
        require_non_negative(choch_confirmation_candles, "choch_confirmation_candles");
        require_non_negative(equilibrium_band, "equilibrium_band");
        if (equilibrium_band > T(1)) throw ConfigError("equilibrium_band must not exceed 1");
        for (const auto& s : sessions) s.validate();
    }
};

inline BreakMode parse_break_mode(const std::string& s) {
    if (s == "close") return BreakMode::Close;
    if (s == "wick" || s == "high_low") return BreakMode::Wick;
    throw ConfigError("unknown break_mode: " + s);
}

namespace detail {

inline std::vector<SessionWindow> parse_sessions(const boost::json::value& v) {
    std::vector<SessionWindow> out;
    if (v.is_bool()) {
        if (v.as_bool()) out = default_sessions();
        return out;
    }
    if (!v.is_array()) throw ConfigError("sessions must be an array or a bool");
    for (const auto& e : v.as_array()) {
        if (!e.is_object()) throw ConfigError("session entry must be an object");
        const auto& o = e.as_object();
        SessionWindow w;
        w.name = json_string(o, "name");
        w.start_min = parse_hhmm(json_string(o, "start"));
        w.end_min = parse_hhmm(json_string(o, "end"));
        out.push_back(std::move(w));
    }
    return out;
}

inline int parse_int_field(const boost::json::value& v, const char* name) {
    return static_cast<int>(json_int(v, name));
}

} // namespace detail

// Parse a single analysis entry.
// Entry format: { "tag": "...", "params": {...} } or the params directly.
template <typename T>
AnalysisConfig<T> parse_analysis_entry(const boost::json::object& entry) {
    using detail::parse_int_field;

    const boost::json::object& p = entry.contains("params") && entry.at("params").is_object()
        ? entry.at("params").as_object()
        : entry;

    AnalysisConfig<T> cfg;
    cfg.echo = p;

    if (auto* v = entry.if_contains("tag")) {
        if (v->is_string()) cfg.tag = v->as_string().c_str();
    }
    if (auto* v = p.if_contains("timeframe")) {
        if (!v->is_string()) throw ConfigError("timeframe must be a string");
        cfg.timeframe = parse_timeframe(v->as_string().c_str());
    }

    if (auto* v = p.if_contains("lookback")) {
        cfg.lookback_left = cfg.lookback_right = parse_int_field(*v, "lookback");
    }
    if (auto* v = p.if_contains("lookback_left")) cfg.lookback_left = parse_int_field(*v, "lookback_left");
    if (auto* v = p.if_contains("lookback_right")) cfg.lookback_right = parse_int_field(*v, "lookback_right");
    if (auto* v = p.if_contains("ob_lookback_window")) cfg.ob_lookback_window = parse_int_field(*v, "ob_lookback_window");
    if (auto* v = p.if_contains("ob_min_range_atr")) cfg.ob_min_range_atr = json_real<T>(*v, "ob_min_range_atr");

    if (auto* v = p.if_contains("fvg_min_gap_size")) cfg.fvg_min_gap_size = json_real<T>(*v, "fvg_min_gap_size");
    if (auto* v = p.if_contains("use_auto_threshold")) cfg.use_auto_threshold = json_bool(*v, "use_auto_threshold");
    if (auto* v = p.if_contains("fvg_atr_multiplier")) cfg.fvg_atr_multiplier = json_real<T>(*v, "fvg_atr_multiplier");
    if (auto* v = p.if_contains("atr_period")) cfg.atr_period = parse_int_field(*v, "atr_period");

    if (auto* v = p.if_contains("sweep_threshold_multiplier")) cfg.sweep_threshold_multiplier = json_real<T>(*v, "sweep_threshold_multiplier");
    if (auto* v = p.if_contains("eqh_eql_threshold_multiplier")) cfg.eqh_eql_threshold_multiplier = json_real<T>(*v, "eqh_eql_threshold_multiplier");
    if (auto* v = p.if_contains("include_fvg_liquidity")) cfg.include_fvg_liquidity = json_bool(*v, "include_fvg_liquidity");
    if (auto* v = p.if_contains("sessions")) cfg.sessions = detail::parse_sessions(*v);
    if (auto* v = p.if_contains("session_utc_offset_s")) cfg.session_utc_offset_s = json_int(*v, "session_utc_offset_s");
    if (auto* v = p.if_contains("session_utc_offset_hours")) {
        cfg.session_utc_offset_s = static_cast<int64_t>(json_real<double>(*v, "session_utc_offset_hours") * 3600.0);
    }

    if (auto* v = p.if_contains("break_mode")) {
        if (!v->is_string()) throw ConfigError("break_mode must be a string");
        cfg.break_mode = parse_break_mode(v->as_string().c_str());
    }
    if (auto* v = p.if_contains("choch_confirmation_candles")) {
        cfg.choch_confirmation_candles = parse_int_field(*v, "choch_confirmation_candles");
    }
    if (auto* v = p.if_contains("equilibrium_band")) cfg.equilibrium_band = json_real<T>(*v, "equilibrium_band");

    return cfg;
}

// Parse all analysis entries from a JSON document
// Supports formats:
// - { "analyses": [ {...}, {...} ] }
// - { ...single entry... }
// - [ {...}, {...} ]
template <typename T>
std::vector<AnalysisConfig<T>> parse_analysis_configs(const boost::json::value& root) {
    std::vector<const boost::json::object*> entries;
    if (root.is_object()) {
        const auto& obj = root.as_object();
        if (auto* a = obj.if_contains("analyses")) {
            if (!a->is_array()) throw std::runtime_error("Invalid config json: 'analyses' must be an array");
            for (const auto& v : a->as_array()) {
                if (!v.is_object()) throw std::runtime_error("Invalid config json: analysis entry must be an object");
                entries.push_back(&v.as_object());
            }
        } else {
            entries.push_back(&obj);
        }
    } else if (root.is_array()) {
        for (const auto& v : root.as_array()) {
            if (!v.is_object()) throw std::runtime_error("Invalid config json: analysis entry must be an object");
            entries.push_back(&v.as_object());
        }
    } else {
        throw std::runtime_error("Invalid config json root type");
    }

    std::vector<AnalysisConfig<T>> result;
    result.reserve(entries.size());
    for (const auto* e : entries) {
        result.push_back(parse_analysis_entry<T>(*e));
    }
    return result;
}

template <typename T>
std::vector<AnalysisConfig<T>> load_analysis_configs(const std::string& path) {
    const std::string s = read_file(path);
    boost::json::value root;
    try {
        root = boost::json::parse(s);
    } catch (const std::exception& e) {
        throw std::runtime_error("Cannot parse config json " + path + ": " + e.what());
    }
    return parse_analysis_configs<T>(root);
}

} // namespace structure
} // namespace smc
