#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "structure/fvg.hpp"
#include "test_helpers.hpp"

using namespace smc;
using namespace smc::structure;
using smc::testing::make_candle;

namespace {

std::vector<Candle> bullish_gap_series() {
    return {
        make_candle(0, 100, 101, 99, 100.5),
        make_candle(1, 100.5, 104, 100.4, 103.8),
        make_candle(2, 103.8, 105, 102, 104.5),
    };
}

} // namespace

TEST(FVG, LiteralTripletHasNoGap) {
    std::vector<Candle> c{
        make_candle(0, 1.10, 1.102, 1.098, 1.101),
        make_candle(1, 1.101, 1.103, 1.099, 1.100),
        make_candle(2, 1.100, 1.105, 1.099, 1.104),
    };
    EXPECT_TRUE(FVGDetector<double>(0.0001, false).detect(c).empty());
    EXPECT_TRUE(FVGDetector<double>(0.0, true).detect(c).empty());
}

TEST(FVG, BullishGapInFinalWindow) {
    auto gaps = FVGDetector<double>(0.5, false).detect(bullish_gap_series());
    ASSERT_EQ(gaps.size(), 1u);
    const auto& g = gaps[0];
    EXPECT_EQ(g.kind, Direction::Bullish);
    EXPECT_EQ(g.start_index, 0u);
    EXPECT_EQ(g.end_index, 2u);
    EXPECT_DOUBLE_EQ(g.top, 102.0);
    EXPECT_DOUBLE_EQ(g.bottom, 101.0);
    EXPECT_EQ(g.ts, bullish_gap_series()[1].ts);
    EXPECT_EQ(g.mitigation_level, 0);
}

TEST(FVG, GapMustExceedFixedThreshold) {
    EXPECT_EQ(FVGDetector<double>(0.0001, false).detect(bullish_gap_series()).size(), 1u);
    EXPECT_TRUE(FVGDetector<double>(1.0, false).detect(bullish_gap_series()).empty());
}

TEST(FVG, BearishGap) {
    std::vector<Candle> c{
        make_candle(0, 100, 101, 99, 99.5),
        make_candle(1, 99.5, 99.6, 96, 96.2),
        make_candle(2, 96.2, 97, 95, 95.5),
    };
    auto gaps = FVGDetector<double>(0.0001, false).detect(c);
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0].kind, Direction::Bearish);
    EXPECT_DOUBLE_EQ(gaps[0].top, 99.0);
    EXPECT_DOUBLE_EQ(gaps[0].bottom, 97.0);
}

TEST(FVG, AutoThresholdScalesWithAtr) {
    // ATR at the third candle is (2 + 3.6 + 3) / 3
    EXPECT_EQ(FVGDetector<double>(0.0, true, 14, 0.25).detect(bullish_gap_series()).size(), 1u);
    EXPECT_TRUE(FVGDetector<double>(0.0, true, 14, 0.5).detect(bullish_gap_series()).empty());
}

TEST(FVG, MitigationLevelIsMonotonicAndBounded) {
    auto c = bullish_gap_series();
    c.push_back(make_candle(3, 104.5, 105, 101.8, 104));    // 20% retraced
    c.push_back(make_candle(4, 104, 104.5, 101.5, 103));    // 50%
    c.push_back(make_candle(5, 103, 104, 101.7, 103.5));    // shallower again
    c.push_back(make_candle(6, 103, 103.5, 100.9, 101.2));  // through the bottom

    FVGDetector<double> det(0.0001, false);
    auto gaps = det.detect(c);
    ASSERT_EQ(gaps.size(), 1u);

    int prev = 0;
    for (size_t n = 3; n <= c.size(); ++n) {
        std::vector<Candle> prefix(c.begin(), c.begin() + static_cast<long>(n));
        auto g = det.update_mitigation(prefix, gaps);
        ASSERT_EQ(g.size(), 1u);
        EXPECT_GE(g[0].mitigation_level, prev);
        EXPECT_LE(g[0].mitigation_level, 4);
        prev = g[0].mitigation_level;
    }

    TransitionLogger<double> log(true);
    auto done = det.update_mitigation(c, gaps, &log);
    EXPECT_EQ(done[0].mitigation_level, 4);
    EXPECT_TRUE(done[0].filled());
    ASSERT_EQ(log.transitions().size(), 2u);
    const auto& t0 = std::get<FVGTransition<double>>(log.transitions()[0]);
    const auto& t1 = std::get<FVGTransition<double>>(log.transitions()[1]);
    EXPECT_EQ(t0.to_level, 2);
    EXPECT_EQ(t0.candle_index, 4u);
    EXPECT_EQ(t1.from_level, 2);
    EXPECT_EQ(t1.to_level, 4);
    EXPECT_EQ(t1.candle_index, 6u);
}

TEST(FVG, ShortSeriesIsEmpty) {
    FVGDetector<double> det(0.0, true);
    EXPECT_TRUE(det.detect({}).empty());
    EXPECT_TRUE(det.detect({make_candle(0, 1, 2, 0, 1), make_candle(1, 5, 6, 4, 5)}).empty());
}

TEST(FVG, InvalidConfigThrows) {
    EXPECT_THROW(FVGDetector<double>(-0.1, false), ConfigError);
    EXPECT_THROW(FVGDetector<double>(0.0, true, 0), ConfigError);
    EXPECT_THROW(FVGDetector<double>(0.0, true, 14, 0.0), ConfigError);
    EXPECT_NO_THROW(FVGDetector<double>(0.0001, false));
}

TEST(FVG, FixedThresholdMustBePositive) {
    EXPECT_THROW(FVGDetector<double>(0.0, false), ConfigError);
    EXPECT_NO_THROW(FVGDetector<double>(0.0, true));
}
