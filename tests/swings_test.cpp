#include <gtest/gtest.h>

#include <cstdlib>

#include "core/errors.hpp"
#include "structure/swings.hpp"
#include "test_helpers.hpp"

using namespace smc;
using namespace smc::structure;
using smc::testing::from_mids;
using smc::testing::make_candle;

namespace {

// Peak at index 50, strictly rising before and strictly falling after
std::vector<Candle> single_peak(size_t n = 101) {
    std::vector<double> mids;
    for (size_t i = 0; i < n; ++i) {
        mids.push_back(100.0 - std::abs(static_cast<double>(i) - 50.0));
    }
    return from_mids(mids);
}

SwingPoint<double> swing(size_t idx, double price, SwingKind kind) {
    SwingPoint<double> sp;
    sp.index = idx;
    sp.ts = smc::testing::T0 + idx * smc::testing::STEP;
    sp.price = price;
    sp.kind = kind;
    sp.confirmed_index = idx + 2;
    return sp;
}

} // namespace

TEST(SwingDetector, SinglePeakEmitsExactlyOneHigh) {
    SwingDetector<double> det(5, 5);
    auto set = det.detect(single_peak());
    ASSERT_EQ(set.highs.size(), 1u);
    EXPECT_EQ(set.highs[0].index, 50u);
    EXPECT_EQ(set.highs[0].kind, SwingKind::High);
    EXPECT_DOUBLE_EQ(set.highs[0].price, 100.5);
    EXPECT_EQ(set.highs[0].confirmed_index, 55u);
    EXPECT_FALSE(set.highs[0].role.has_value());
    EXPECT_TRUE(set.lows.empty());
}

TEST(SwingDetector, EqualHighsKeepEarliest) {
    std::vector<Candle> c;
    const double highs[] = {1, 2, 5, 5, 2, 1, 1};
    for (size_t i = 0; i < 7; ++i) c.push_back(make_candle(i, highs[i], highs[i], highs[i] - 0.5, highs[i]));
    SwingDetector<double> det(2, 2);
    auto set = det.detect(c);
    ASSERT_EQ(set.highs.size(), 1u);
    EXPECT_EQ(set.highs[0].index, 2u);
}

TEST(SwingDetector, EqualHighsFarApartAreBothKept) {
    std::vector<double> mids{1, 2, 5, 2, 1, 2, 5, 2, 1};
    SwingDetector<double> det(2, 2);
    auto set = det.detect(from_mids(mids));
    ASSERT_EQ(set.highs.size(), 2u);
    EXPECT_EQ(set.highs[0].index, 2u);
    EXPECT_EQ(set.highs[1].index, 6u);
    ASSERT_EQ(set.lows.size(), 1u);
    EXPECT_EQ(set.lows[0].index, 4u);
}

TEST(SwingDetector, InsufficientDataIsEmpty) {
    SwingDetector<double> det(5, 5);
    EXPECT_EQ(det.min_candles(), 11u);
    EXPECT_TRUE(det.detect(from_mids(std::vector<double>(10, 1.0))).empty());
    EXPECT_TRUE(det.detect({}).empty());
}

TEST(SwingDetector, NonPositiveLookbackThrows) {
    EXPECT_THROW(SwingDetector<double>(0, 5), ConfigError);
    EXPECT_THROW(SwingDetector<double>(5, -1), ConfigError);
}

TEST(SwingDetector, DetectIsIdempotent) {
    SwingDetector<double> det(3, 3);
    std::vector<double> mids{5, 6, 7, 9, 7, 6, 4, 3, 4, 6, 8, 10, 8, 7, 5};
    auto c = from_mids(mids);
    auto a = det.classify(det.detect(c));
    auto b = det.classify(det.detect(c));
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].index, b[i].index);
        EXPECT_EQ(a[i].price, b[i].price);
        EXPECT_EQ(a[i].role, b[i].role);
    }
}

TEST(SwingClassify, RolesComparedWithSameKindOnly) {
    std::vector<SwingPoint<double>> highs{
        swing(5, 10, SwingKind::High), swing(15, 12, SwingKind::High),
        swing(25, 11, SwingKind::High), swing(35, 11, SwingKind::High)};
    std::vector<SwingPoint<double>> lows{
        swing(10, 5, SwingKind::Low), swing(20, 4, SwingKind::Low), swing(30, 6, SwingKind::Low)};

    auto merged = SwingDetector<double>::classify(highs, lows);
    ASSERT_EQ(merged.size(), 7u);

    const size_t order[] = {5, 10, 15, 20, 25, 30, 35};
    for (size_t i = 0; i < 7; ++i) EXPECT_EQ(merged[i].index, order[i]);

    EXPECT_FALSE(merged[0].role.has_value());              // first high
    EXPECT_FALSE(merged[1].role.has_value());              // first low
    EXPECT_EQ(merged[2].role, SwingRole::HH);
    EXPECT_EQ(merged[3].role, SwingRole::LL);
    EXPECT_EQ(merged[4].role, SwingRole::LH);
    EXPECT_EQ(merged[5].role, SwingRole::HL);
    EXPECT_EQ(merged[6].role, SwingRole::LH);              // equal high
}

TEST(SwingClassify, HighBeforeLowAtSameTimestamp) {
    std::vector<SwingPoint<double>> highs{swing(3, 10, SwingKind::High)};
    std::vector<SwingPoint<double>> lows{swing(3, 9, SwingKind::Low)};
    auto merged = SwingDetector<double>::classify(highs, lows);
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].kind, SwingKind::High);
    EXPECT_EQ(merged[1].kind, SwingKind::Low);
}
