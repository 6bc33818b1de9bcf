// Timeframes and the per-timeframe default windows
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"

namespace smc {
namespace structure {

enum class Timeframe { M1, M5, M15, M30, H1, H4, D1 };

inline const char* to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "M1";
        case Timeframe::M5:  return "M5";
        case Timeframe::M15: return "M15";
        case Timeframe::M30: return "M30";
        case Timeframe::H1:  return "H1";
        case Timeframe::H4:  return "H4";
        case Timeframe::D1:  return "D1";
    }
    return "?";
}

// Accepts "M5", "m5", "5m", "H1", "1h", "4h", "D1", "d", "1d"
inline Timeframe parse_timeframe(const std::string& raw) {
    std::string s = raw;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (s == "M1" || s == "1M") return Timeframe::M1;
    if (s == "M5" || s == "5M") return Timeframe::M5;
    if (s == "M15" || s == "15M") return Timeframe::M15;
    if (s == "M30" || s == "30M") return Timeframe::M30;
    if (s == "H1" || s == "1H") return Timeframe::H1;
    if (s == "H4" || s == "4H") return Timeframe::H4;
    if (s == "D1" || s == "D" || s == "1D") return Timeframe::D1;
    throw ConfigError("unknown timeframe: " + raw);
}

// Swing window in bars. Lower timeframes need more bars to span the same
// wall-clock structure.
inline int default_swing_lookback(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:
        case Timeframe::M5:  return 50;
        case Timeframe::M15:
        case Timeframe::M30: return 20;
        case Timeframe::H1:
        case Timeframe::H4:  return 10;
        case Timeframe::D1:  return 5;
    }
    return 20;
}

// Candles scanned back from a break when locating its order block
inline int default_ob_lookback_window(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return 100;
        case Timeframe::M5:  return 200;
        case Timeframe::M15: return 100;
        case Timeframe::M30: return 50;
        case Timeframe::H1:  return 30;
        case Timeframe::H4:  return 20;
        case Timeframe::D1:  return 15;
    }
    return 50;
}

} // namespace structure
} // namespace smc
