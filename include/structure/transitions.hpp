// Lifecycle transition recording for --trace mode
// Order-block state changes, FVG fill progress and liquidity sweeps
#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <boost/json.hpp>

#include "events/types.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

namespace json = boost::json;

// Order block moved to a later state (or became a breaker)
template <typename T>
struct OBTransition {
    size_t ob_candle_index{0};
    size_t candle_index{0};
    uint64_t ts{0};
    OBState from{OBState::Active};
    OBState to{OBState::Active};
    int mitigation_level{0};
    bool breaker{false};
    T close{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "order_block";
        o["ob_candle_index"] = static_cast<uint64_t>(ob_candle_index);
        o["candle_index"] = static_cast<uint64_t>(candle_index);
        o["ts"] = ts;
        o["from"] = to_string(from);
        o["to"] = to_string(to);
        o["mitigation_level"] = mitigation_level;
        o["breaker"] = breaker;
        o["close"] = static_cast<double>(close);
        return o;
    }
};

// FVG mitigation level increased
template <typename T>
struct FVGTransition {
    size_t gap_start_index{0};
    size_t candle_index{0};
    uint64_t ts{0};
    int from_level{0};
    int to_level{0};
    T extreme{0};   // low (bullish gap) or high (bearish gap) that retraced

    json::object to_json() const {
        json::object o;
        o["type"] = "fvg";
        o["gap_start_index"] = static_cast<uint64_t>(gap_start_index);
        o["candle_index"] = static_cast<uint64_t>(candle_index);
        o["ts"] = ts;
        o["from_level"] = from_level;
        o["to_level"] = to_level;
        o["extreme"] = static_cast<double>(extreme);
        return o;
    }
};

// Liquidity level breached and rejected
template <typename T>
struct SweepTransition {
    LiquiditySide side{LiquiditySide::BuySide};
    LiquiditySubtype subtype{LiquiditySubtype::Swing};
    size_t source_index{0};
    size_t breach_index{0};
    size_t candle_index{0};   // close-back candle
    uint64_t ts{0};
    T price{0};
    T breach_extreme{0};

    json::object to_json() const {
        json::object o;
        o["type"] = "sweep";
        o["side"] = to_string(side);
        o["subtype"] = to_string(subtype);
        o["source_index"] = static_cast<uint64_t>(source_index);
        o["breach_index"] = static_cast<uint64_t>(breach_index);
        o["candle_index"] = static_cast<uint64_t>(candle_index);
        o["ts"] = ts;
        o["price"] = static_cast<double>(price);
        o["breach_extreme"] = static_cast<double>(breach_extreme);
        return o;
    }
};

// Variant for all transition types
template <typename T>
using Transition = std::variant<OBTransition<T>, FVGTransition<T>, SweepTransition<T>>;

template <typename T>
json::object transition_to_json(const Transition<T>& t) {
    return std::visit([](const auto& a) { return a.to_json(); }, t);
}

template <typename T>
json::array transitions_to_json(const std::vector<Transition<T>>& ts) {
    json::array arr;
    arr.reserve(ts.size());
    for (const auto& t : ts) {
        arr.push_back(transition_to_json(t));
    }
    return arr;
}

// TransitionLogger: records lifecycle transitions when enabled, noop otherwise.
// Detectors take an optional pointer; each call site owns its logger.
template <typename T>
class TransitionLogger {
public:
    TransitionLogger() = default;
    explicit TransitionLogger(bool enabled) : enabled_(enabled) {}

    bool enabled() const { return enabled_; }

    // Get recorded transitions (moves out)
    std::vector<Transition<T>> take_transitions() { return std::move(transitions_); }

    const std::vector<Transition<T>>& transitions() const { return transitions_; }

    void log_ob(const OrderBlock<T>& ob, size_t i, const Candle& c, OBState from, bool became_breaker) {
        if (!enabled_) return;
        OBTransition<T> t;
        t.ob_candle_index = ob.candle_index;
        t.candle_index = i;
        t.ts = c.ts;
        t.from = from;
        t.to = ob.state;
        t.mitigation_level = ob.mitigation_level;
        t.breaker = became_breaker;
        t.close = static_cast<T>(c.close);
        transitions_.push_back(std::move(t));
    }

    void log_fvg(const FairValueGap<T>& gap, size_t i, const Candle& c, int from_level) {
        if (!enabled_) return;
        FVGTransition<T> t;
        t.gap_start_index = gap.start_index;
        t.candle_index = i;
        t.ts = c.ts;
        t.from_level = from_level;
        t.to_level = gap.mitigation_level;
        t.extreme = static_cast<T>(gap.kind == Direction::Bullish ? c.low : c.high);
        transitions_.push_back(std::move(t));
    }

    void log_sweep(const LiquidityZone<T>& z, size_t breach_index, T breach_extreme, size_t i, const Candle& c) {
        if (!enabled_) return;
        SweepTransition<T> t;
        t.side = z.side;
        t.subtype = z.subtype;
        t.source_index = z.source_index;
        t.breach_index = breach_index;
        t.candle_index = i;
        t.ts = c.ts;
        t.price = z.price;
        t.breach_extreme = breach_extreme;
        transitions_.push_back(std::move(t));
    }

private:
    bool enabled_{false};
    std::vector<Transition<T>> transitions_;
};

} // namespace structure
} // namespace smc
