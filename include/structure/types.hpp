// Market-structure entity types (swings, breaks, zones)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace smc {
namespace structure {

// ============================================================================
// Closed tags
// ============================================================================

enum class SwingKind { High, Low };
enum class SwingRole { HH, HL, LH, LL };
enum class StructureKind { BOS, CHOCH };
enum class Direction { Bullish, Bearish };
enum class Bias { Neutral, Bullish, Bearish };

// Ordered: a zone only ever moves forward through these states
enum class OBState { Active = 0, Touched = 1, Partial = 2, Mitigated = 3 };

enum class LiquiditySide { BuySide, SellSide };
enum class LiquiditySubtype { Swing, Session, EQH, EQL, FvgMid };
enum class ZoneKind { Equilibrium, Premium, Discount, OTE };

inline const char* to_string(SwingKind k) {
    switch (k) {
        case SwingKind::High: return "high";
        case SwingKind::Low:  return "low";
    }
    return "?";
}

inline const char* to_string(SwingRole r) {
    switch (r) {
        case SwingRole::HH: return "HH";
        case SwingRole::HL: return "HL";
        case SwingRole::LH: return "LH";
        case SwingRole::LL: return "LL";
    }
    return "?";
}

inline const char* to_string(StructureKind k) {
    switch (k) {
        case StructureKind::BOS:   return "BOS";
        case StructureKind::CHOCH: return "CHOCH";
    }
    return "?";
}

inline const char* to_string(Direction d) {
    switch (d) {
        case Direction::Bullish: return "bullish";
        case Direction::Bearish: return "bearish";
    }
    return "?";
}

inline const char* to_string(Bias b) {
    switch (b) {
        case Bias::Neutral: return "neutral";
        case Bias::Bullish: return "bullish";
        case Bias::Bearish: return "bearish";
    }
    return "?";
}

inline const char* to_string(OBState s) {
    switch (s) {
        case OBState::Active:    return "active";
        case OBState::Touched:   return "touched";
        case OBState::Partial:   return "partial";
        case OBState::Mitigated: return "mitigated";
    }
    return "?";
}

inline const char* to_string(LiquiditySide s) {
    switch (s) {
        case LiquiditySide::BuySide:  return "buy_side";
        case LiquiditySide::SellSide: return "sell_side";
    }
    return "?";
}

inline const char* to_string(LiquiditySubtype s) {
    switch (s) {
        case LiquiditySubtype::Swing:   return "swing";
        case LiquiditySubtype::Session: return "session";
        case LiquiditySubtype::EQH:     return "eqh";
        case LiquiditySubtype::EQL:     return "eql";
        case LiquiditySubtype::FvgMid:  return "fvg_mid";
    }
    return "?";
}

inline const char* to_string(ZoneKind k) {
    switch (k) {
        case ZoneKind::Equilibrium: return "equilibrium";
        case ZoneKind::Premium:     return "premium";
        case ZoneKind::Discount:    return "discount";
        case ZoneKind::OTE:         return "ote";
    }
    return "?";
}

inline Direction opposite(Direction d) {
    return d == Direction::Bullish ? Direction::Bearish : Direction::Bullish;
}

// ============================================================================
// Entities
// ============================================================================

// Confirmed local extremum. confirmed_index is the first candle at which the
// right-hand window is complete (index + lookback_right).
template <typename T>
struct SwingPoint {
    size_t index{0};
    uint64_t ts{0};
    T price{0};
    SwingKind kind{SwingKind::High};
    std::optional<SwingRole> role{};
    size_t confirmed_index{0};
};

template <typename T>
struct SwingSet {
    std::vector<SwingPoint<T>> highs;
    std::vector<SwingPoint<T>> lows;

    bool empty() const { return highs.empty() && lows.empty(); }
};

// Directional break of the last relevant swing
template <typename T>
struct StructureEvent {
    StructureKind kind{StructureKind::BOS};
    Direction direction{Direction::Bullish};
    size_t break_index{0};
    uint64_t break_ts{0};
    T break_price{0};              // the pivot level that was broken
    size_t pivot_index{0};
    uint64_t pivot_ts{0};
    std::optional<size_t> impulse_origin_index{};
    std::string description;
};

template <typename T>
struct OrderBlock {
    Direction kind{Direction::Bullish};
    size_t candle_index{0};
    uint64_t ts{0};
    T high{0};
    T low{0};
    T mid{0};
    OBState state{OBState::Active};
    std::optional<T> liquidity_swept{};
    size_t lookback_candles{0};
    bool is_breaker{false};

    // Traceability back to the break that created the block
    size_t break_index{0};
    StructureKind structure_kind{StructureKind::BOS};

    int mitigation_level{0};       // 0..4, penetration depth quartiles
    std::optional<size_t> mitigated_index{};
    std::optional<size_t> breaker_index{};
    bool refined{false};           // zone tightened from lower-timeframe candles

    T range() const { return high - low; }
};

template <typename T>
struct FairValueGap {
    Direction kind{Direction::Bullish};
    size_t start_index{0};
    size_t end_index{0};
    T top{0};
    T bottom{0};
    uint64_t ts{0};                // middle candle
    int mitigation_level{0};       // 0 = untouched .. 4 = fully closed

    T size() const { return top - bottom; }
    T mid() const { return (top + bottom) / T(2); }
    bool filled(int threshold = 4) const { return mitigation_level >= threshold; }
};

template <typename T>
struct LiquidityZone {
    LiquiditySide side{LiquiditySide::BuySide};
    LiquiditySubtype subtype{LiquiditySubtype::Swing};
    T price{0};
    uint64_t ts{0};
    size_t source_index{0};
    bool swept{false};
    std::optional<uint64_t> sweep_ts{};
    std::optional<size_t> sweep_index{};
    std::string session;                 // session name for Session zones
    std::vector<size_t> related_indices; // cluster members for EQH/EQL
};

template <typename T>
struct PremiumDiscountZone {
    ZoneKind kind{ZoneKind::Equilibrium};
    uint64_t start_ts{0};
    uint64_t end_ts{0};
    T top{0};
    T bottom{0};
};

} // namespace structure
} // namespace smc
