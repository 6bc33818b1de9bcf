#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "structure/market_structure.hpp"
#include "test_helpers.hpp"

using namespace smc;
using namespace smc::structure;
using smc::testing::flat;
using smc::testing::set_ohlc;

namespace {

SwingPoint<double> swing(size_t idx, double price, SwingKind kind, size_t confirmed) {
    SwingPoint<double> sp;
    sp.index = idx;
    sp.ts = smc::testing::T0 + idx * smc::testing::STEP;
    sp.price = price;
    sp.kind = kind;
    sp.confirmed_index = confirmed;
    return sp;
}

std::vector<SwingPoint<double>> base_swings() {
    return {
        swing(2, 105, SwingKind::High, 4),
        swing(4, 95, SwingKind::Low, 6),
        swing(6, 104, SwingKind::High, 8),
        swing(8, 96, SwingKind::Low, 10),
    };
}

} // namespace

TEST(MarketStructure, BosThenImmediateLowBreakIsChoch) {
    auto c = flat(30);
    set_ohlc(c[11], 100, 104.8, 99.8, 104.5);   // breaks 104 from neutral
    set_ohlc(c[17], 104, 108.5, 103.5, 108);    // breaks 107 with bullish bias
    set_ohlc(c[19], 100, 100.2, 95.2, 95.5);    // breaks 96 before any new high

    auto swings = base_swings();
    swings.push_back(swing(13, 107, SwingKind::High, 15));

    MarketStructureDetector<double> det;
    auto ev = det.detect(c, swings);
    ASSERT_EQ(ev.size(), 3u);

    EXPECT_EQ(ev[0].kind, StructureKind::CHOCH);
    EXPECT_EQ(ev[0].direction, Direction::Bullish);
    EXPECT_EQ(ev[0].break_index, 11u);
    EXPECT_EQ(ev[0].pivot_index, 6u);
    EXPECT_EQ(ev[0].description, "Trend shift to bullish");

    EXPECT_EQ(ev[1].kind, StructureKind::BOS);
    EXPECT_EQ(ev[1].direction, Direction::Bullish);
    EXPECT_EQ(ev[1].break_index, 17u);
    EXPECT_DOUBLE_EQ(ev[1].break_price, 107.0);
    EXPECT_EQ(ev[1].pivot_index, 13u);
    ASSERT_TRUE(ev[1].impulse_origin_index.has_value());
    EXPECT_EQ(*ev[1].impulse_origin_index, 8u);
    EXPECT_EQ(ev[1].description, "Higher High");

    EXPECT_EQ(ev[2].kind, StructureKind::CHOCH);
    EXPECT_EQ(ev[2].direction, Direction::Bearish);
    EXPECT_EQ(ev[2].break_index, 19u);
    EXPECT_EQ(ev[2].pivot_index, 8u);
    ASSERT_TRUE(ev[2].impulse_origin_index.has_value());
    EXPECT_EQ(*ev[2].impulse_origin_index, 13u);
    EXPECT_EQ(ev[2].description, "Trend shift to bearish");

    EXPECT_EQ(current_bias(ev), Bias::Bearish);
}

TEST(MarketStructure, EventsAreTimeOrdered) {
    auto c = flat(30);
    set_ohlc(c[11], 100, 104.8, 99.8, 104.5);
    set_ohlc(c[19], 100, 100.2, 95.2, 95.5);
    auto ev = MarketStructureDetector<double>().detect(c, base_swings());
    for (size_t i = 1; i < ev.size(); ++i) EXPECT_LT(ev[i - 1].break_index, ev[i].break_index);
}

TEST(MarketStructure, SwingNotUsableBeforeConfirmation) {
    auto c = flat(30);
    set_ohlc(c[8], 100, 104.8, 99.8, 104.5);    // H2 (104) only confirmed at 8
    auto ev = MarketStructureDetector<double>().detect(c, base_swings());
    // reference at candle 8 is still H1 (105)
    EXPECT_TRUE(ev.empty());
}

TEST(MarketStructure, WickModeBreaksOnHigh) {
    auto c = flat(30);
    set_ohlc(c[11], 100, 104.8, 99.8, 103.0);   // wick above 104, close below

    EXPECT_TRUE(MarketStructureDetector<double>(BreakMode::Close).detect(c, base_swings()).empty());

    auto ev = MarketStructureDetector<double>(BreakMode::Wick).detect(c, base_swings());
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].break_index, 11u);
    EXPECT_EQ(ev[0].direction, Direction::Bullish);
}

TEST(MarketStructure, OneEventPerCandleBullishFirst) {
    auto c = flat(30);
    set_ohlc(c[11], 100, 106, 94, 100);          // outside bar through both references
    auto ev = MarketStructureDetector<double>(BreakMode::Wick).detect(c, base_swings());
    ASSERT_GE(ev.size(), 1u);
    EXPECT_EQ(ev[0].break_index, 11u);
    EXPECT_EQ(ev[0].direction, Direction::Bullish);
    for (size_t i = 1; i < ev.size(); ++i) EXPECT_NE(ev[i].break_index, 11u);
}

TEST(MarketStructure, ChochConfirmationKeepsReferenceUntilHeld) {
    auto c = flat(30);
    set_ohlc(c[11], 100, 104.8, 99.8, 104.5);    // closes back at 100 on 12
    set_ohlc(c[14], 100, 104.8, 99.8, 104.5);
    set_ohlc(c[15], 104.5, 104.9, 104.2, 104.6);

    auto ev = MarketStructureDetector<double>(BreakMode::Close, 1).detect(c, base_swings());
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].kind, StructureKind::CHOCH);
    EXPECT_EQ(ev[0].break_index, 14u);
    EXPECT_EQ(ev[0].pivot_index, 6u);
}

TEST(MarketStructure, TooFewSwingsYieldNoEvents) {
    auto c = flat(30);
    set_ohlc(c[11], 100, 110, 90, 109);
    std::vector<SwingPoint<double>> swings{
        swing(2, 105, SwingKind::High, 4),
        swing(4, 95, SwingKind::Low, 6),
        swing(6, 104, SwingKind::High, 8),
    };
    EXPECT_TRUE(MarketStructureDetector<double>().detect(c, swings).empty());
    EXPECT_EQ(current_bias(std::vector<StructureEvent<double>>{}), Bias::Neutral);
}

TEST(MarketStructure, NegativeConfirmationThrows) {
    EXPECT_THROW(MarketStructureDetector<double>(BreakMode::Close, -1), ConfigError);
}
