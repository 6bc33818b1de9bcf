#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "events/loader.hpp"

using namespace smc;

namespace {

std::string write_temp(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() / ("smc_loader_" + name);
    std::ofstream out(path, std::ios::binary);
    out << body;
    return path.string();
}

} // namespace

TEST(ParseTimestamp, UnixSecondsAndMillis) {
    EXPECT_EQ(parse_timestamp("1700000000"), 1700000000ULL);
    EXPECT_EQ(parse_timestamp("1700000000000"), 1700000000ULL);
    EXPECT_EQ(parse_timestamp(" 1700000000.0 "), 1700000000ULL);
}

TEST(ParseTimestamp, CalendarForms) {
    EXPECT_EQ(parse_timestamp("2023-11-14 00:00:00"), 1699920000ULL);
    EXPECT_EQ(parse_timestamp("2023-11-14T07:30"), 1699920000ULL + 7 * 3600 + 30 * 60);
    EXPECT_EQ(parse_timestamp("2023.11.14 07:30"), 1699920000ULL + 7 * 3600 + 30 * 60);
    EXPECT_EQ(parse_timestamp("2023/11/14"), 1699920000ULL);
}

TEST(ParseTimestamp, GarbageIsZero) {
    EXPECT_EQ(parse_timestamp(""), 0ULL);
    EXPECT_EQ(parse_timestamp("yesterday"), 0ULL);
    EXPECT_EQ(parse_timestamp("2023-13-01"), 0ULL);
}

TEST(LoadCandles, JsonArraysSortedAndIndexed) {
    const auto path = write_temp("arrays.json",
        "[[1700003600, 2, 3, 1, 2.5, 10],"
        " [1700000000, 1, 2, 0.5, 1.5, 5],"
        " [1700007200, 2.5, 4, 2, 3.5]]");
    auto c = load_candles(path);
    ASSERT_EQ(c.size(), 3u);
    EXPECT_EQ(c[0].ts, 1700000000ULL);
    EXPECT_EQ(c[0].index, 0u);
    EXPECT_EQ(c[2].index, 2u);
    EXPECT_DOUBLE_EQ(c[1].close, 2.5);
    EXPECT_DOUBLE_EQ(c[2].volume, 0.0);
}

TEST(LoadCandles, JsonObjectsUnderCandlesKey) {
    const auto path = write_temp("objects.json",
        "{\"candles\": ["
        " {\"time\": \"2023-11-14 00:00\", \"open\": 1, \"high\": 2, \"low\": 0.5, \"close\": 1.5},"
        " {\"ts\": 1699923600000, \"open\": 1.5, \"high\": 2.5, \"low\": 1, \"close\": 2}"
        "]}");
    auto c = load_candles(path);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].ts, 1699920000ULL);
    EXPECT_EQ(c[1].ts, 1699923600ULL);
}

TEST(LoadCandles, KeepsMostRecent) {
    const auto path = write_temp("recent.json",
        "[[1,1,2,0,1],[2,1,2,0,1],[3,1,2,0,1],[4,1,2,0,1]]");
    auto c = load_candles(path, 2);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].ts, 3ULL);
    EXPECT_EQ(c[0].index, 0u);
}

TEST(LoadCandles, BadInputThrows) {
    EXPECT_THROW(load_candles("/nonexistent/smc_candles.json"), std::runtime_error);
    const auto path = write_temp("scalar.json", "42");
    EXPECT_THROW(load_candles(path), std::runtime_error);
}

TEST(LoadCandlesCsv, HeaderWithDatetime) {
    const auto path = write_temp("header.csv",
        "Time,Open,High,Low,Close,Volume\r\n"
        "2023-11-14 01:00:00,1.1,1.2,1.0,1.15,100\r\n"
        "2023-11-14 00:00:00,1.0,1.1,0.9,1.05,90\r\n");
    auto c = load_candles_csv(path);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].ts, 1699920000ULL);
    EXPECT_DOUBLE_EQ(c[1].close, 1.15);
    EXPECT_DOUBLE_EQ(c[1].volume, 100.0);
}

TEST(LoadCandlesCsv, HeaderlessMt4) {
    const auto path = write_temp("mt4.csv",
        "2023.11.14,00:00,1.0,1.1,0.9,1.05,90\n"
        "2023.11.14,01:00,1.05,1.2,1.0,1.15,80\n"
        "garbage,row\n");
    auto c = load_candles_csv(path);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[1].ts, 1699923600ULL);
    EXPECT_DOUBLE_EQ(c[1].high, 1.2);
}

TEST(LoadCandlesCsv, AutoDispatchOnExtension) {
    const auto path = write_temp("auto.csv", "ts,open,high,low,close\n1700000000,1,2,0.5,1.5\n");
    auto c = load_candles_auto(path);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].ts, 1700000000ULL);
}

TEST(LoadCandlesCsv, MissingColumnThrows) {
    const auto path = write_temp("missing.csv", "time,open,close\n1700000000,1,2\n");
    EXPECT_THROW(load_candles_csv(path), std::runtime_error);
}
