// Intraday session windows (kill zones) keyed by minute of day
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace smc {
namespace structure {

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int MINUTES_PER_DAY = 1440;

// [start_min, end_min] inclusive, minutes after midnight in session time.
// start > end wraps past midnight.
struct SessionWindow {
    std::string name;
    int start_min{0};
    int end_min{0};

    bool wraps() const { return start_min > end_min; }

    bool contains(int minute) const {
        if (!wraps()) return minute >= start_min && minute <= end_min;
        return minute >= start_min || minute <= end_min;
    }

    void validate() const {
        if (name.empty()) throw ConfigError("session name must not be empty");
        if (start_min < 0 || start_min >= MINUTES_PER_DAY || end_min < 0 || end_min >= MINUTES_PER_DAY) {
            throw ConfigError("session '" + name + "' bounds must be within 00:00..23:59");
        }
    }
};

// London and New York kill zones, UTC
inline std::vector<SessionWindow> default_sessions() {
    return {
        {"london", 7 * 60, 10 * 60},
        {"new_york", 13 * 60, 16 * 60},
    };
}

// "HH:MM" -> minutes after midnight
inline int parse_hhmm(const std::string& s) {
    const size_t colon = s.find(':');
    if (colon != 2 || s.size() != 5) {
        throw ConfigError("bad session time '" + s + "' (expected HH:MM)");
    }
    int h = 0;
    int m = 0;
    for (size_t i = 0; i < colon; ++i) {
        if (s[i] < '0' || s[i] > '9') throw ConfigError("bad session time '" + s + "'");
        h = h * 10 + (s[i] - '0');
    }
    for (size_t i = colon + 1; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') throw ConfigError("bad session time '" + s + "'");
        m = m * 10 + (s[i] - '0');
    }
    if (h > 23 || m > 59) throw ConfigError("bad session time '" + s + "'");
    return h * 60 + m;
}

inline std::string format_hhmm(int minutes) {
    std::string out(5, '0');
    out[0] = static_cast<char>('0' + minutes / 600);
    out[1] = static_cast<char>('0' + (minutes / 60) % 10);
    out[2] = ':';
    out[3] = static_cast<char>('0' + (minutes % 60) / 10);
    out[4] = static_cast<char>('0' + minutes % 10);
    return out;
}

// Position of a timestamp in session time
struct SessionClock {
    int64_t day{0};
    int minute{0};
};

inline SessionClock session_clock(uint64_t ts, int64_t utc_offset_s) {
    const int64_t local = static_cast<int64_t>(ts) + utc_offset_s;
    int64_t day = local / SECONDS_PER_DAY;
    int64_t rem = local % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
        --day;
    }
    return {day, static_cast<int>(rem / 60)};
}

// Day a session occurrence belongs to: the day it started on
inline int64_t session_day(const SessionWindow& w, const SessionClock& clk) {
    if (w.wraps() && clk.minute <= w.end_min) return clk.day - 1;
    return clk.day;
}

} // namespace structure
} // namespace smc
