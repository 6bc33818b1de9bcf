// Events module - implementation (non-templated)
#include "events/loader.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace json = boost::json;

namespace smc {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out = s.substr(b, e - b);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        out.push_back(trim(token));
    }
    return out;
}

uint64_t normalize_unix(uint64_t ts) {
    if (ts > 10000000000ULL) ts /= 1000ULL; // ms->s
    return ts;
}

double to_d(const json::value& v) {
    if (v.is_double()) return v.as_double();
    if (v.is_int64())  return static_cast<double>(v.as_int64());
    if (v.is_uint64()) return static_cast<double>(v.as_uint64());
    if (v.is_string()) return std::strtod(v.as_string().c_str(), nullptr);
    return 0.0;
}

uint64_t to_ts(const json::value& v) {
    uint64_t ts = 0;
    if (v.is_uint64()) ts = v.as_uint64();
    else if (v.is_int64()) ts = static_cast<uint64_t>(v.as_int64());
    else if (v.is_double()) ts = static_cast<uint64_t>(v.as_double());
    else if (v.is_string()) return parse_timestamp(std::string(v.as_string().c_str()));
    return normalize_unix(ts);
}

} // namespace

uint64_t parse_timestamp(const std::string& raw) {
    const std::string token = trim(raw);
    if (token.empty()) return 0;

    // Pure digits: unix seconds or milliseconds
    const bool numeric = std::all_of(token.begin(), token.end(),
                                     [](unsigned char c) { return std::isdigit(c) || c == '.'; });
    if (numeric && std::count(token.begin(), token.end(), '.') <= 1) {
        return normalize_unix(static_cast<uint64_t>(std::strtod(token.c_str(), nullptr)));
    }

    // Calendar form: YYYY-MM-DD[ T]HH:MM[:SS] (also '.' or '/' date separators)
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char ds1 = 0, ds2 = 0;
    std::istringstream ss(token);
    ss >> year >> ds1 >> month >> ds2 >> day;
    if (!ss || (ds1 != '-' && ds1 != '.' && ds1 != '/') || ds1 != ds2) return 0;
    if (month < 1 || month > 12 || day < 1 || day > 31) return 0;

    char sep = 0;
    if (ss.get(sep) && (sep == ' ' || sep == 'T')) {
        char c1 = 0;
        ss >> hour >> c1 >> minute;
        if (!ss || c1 != ':') return 0;
        char c2 = 0;
        if (ss.get(c2) && c2 == ':') {
            ss >> second;
            if (!ss) second = 0;
        }
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    return secs > 0 ? static_cast<uint64_t>(secs) : 0;
}

void finalize_series(std::vector<Candle>& out, size_t max_candles) {
    std::stable_sort(out.begin(), out.end(), [](const Candle& a, const Candle& b) {
        return a.ts < b.ts;
    });
    if (max_candles > 0 && out.size() > max_candles) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(max_candles));
    }
    for (size_t i = 0; i < out.size(); ++i) {
        out[i].index = i;
    }
}

std::vector<Candle> load_candles(const std::string& path, size_t max_candles) {
    std::vector<Candle> out;

    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open candles file: " + path);

    std::ostringstream oss;
    oss << in.rdbuf();
    const std::string s = oss.str();

    json::value val = json::parse(s);
    const json::array* arr = nullptr;
    if (val.is_array()) {
        arr = &val.as_array();
    } else if (val.is_object()) {
        const auto& o = val.as_object();
        if (o.contains("candles") && o.at("candles").is_array())
            arr = &o.at("candles").as_array();
        else if (o.contains("data") && o.at("data").is_array())
            arr = &o.at("data").as_array();
    }
    if (!arr) {
        throw std::runtime_error(
            "Candles JSON must be an array of [ts,o,h,l,c,v] or object with 'candles'/'data' array");
    }
    out.reserve(arr->size());

    for (const auto& e : *arr) {
        Candle c{};
        if (e.is_array()) {
            const auto& a = e.as_array();
            if (a.size() < 5) continue;
            c.ts     = to_ts(a[0]);
            c.open   = to_d(a[1]);
            c.high   = to_d(a[2]);
            c.low    = to_d(a[3]);
            c.close  = to_d(a[4]);
            c.volume = a.size() >= 6 ? to_d(a[5]) : 0.0;
        } else if (e.is_object()) {
            const auto& o = e.as_object();
            if (auto* v = o.if_contains("ts")) c.ts = to_ts(*v);
            else if (auto* v = o.if_contains("time")) c.ts = to_ts(*v);
            else if (auto* v = o.if_contains("timestamp")) c.ts = to_ts(*v);
            if (auto* v = o.if_contains("open")) c.open = to_d(*v);
            if (auto* v = o.if_contains("high")) c.high = to_d(*v);
            if (auto* v = o.if_contains("low")) c.low = to_d(*v);
            if (auto* v = o.if_contains("close")) c.close = to_d(*v);
            if (auto* v = o.if_contains("volume")) c.volume = to_d(*v);
            if (c.high <= 0 && c.low <= 0) continue;
        } else {
            continue;
        }
        out.push_back(c);
    }

    finalize_series(out, max_candles);
    return out;
}

std::vector<Candle> load_candles_csv(const std::string& path, size_t max_candles) {
    std::vector<Candle> out;
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open candles file: " + path);

    std::string line;
    if (!std::getline(file, line)) return out;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // Column layout; defaults match the headerless "time,open,high,low,close,volume" form
    int c_date = -1, c_time = 0, c_open = 1, c_high = 2, c_low = 3, c_close = 4, c_vol = 5;

    const std::string first = lower(line);
    const bool has_header = first.find("open") != std::string::npos ||
                            first.find("close") != std::string::npos;
    bool pending_first_row = !has_header;

    if (has_header) {
        const auto cols = split_csv(first);
        std::map<std::string, int> pos;
        for (size_t k = 0; k < cols.size(); ++k) pos[cols[k]] = static_cast<int>(k);
        auto find = [&](std::initializer_list<const char*> names) {
            for (const char* n : names) {
                auto it = pos.find(n);
                if (it != pos.end()) return it->second;
            }
            return -1;
        };
        c_date  = find({"date"});
        c_time  = find({"time", "timestamp", "datetime", "ts"});
        c_open  = find({"open", "o"});
        c_high  = find({"high", "h"});
        c_low   = find({"low", "l"});
        c_close = find({"close", "c"});
        c_vol   = find({"volume", "tick_volume", "vol", "v"});
        if (c_time < 0 && c_date >= 0) {
            c_time = c_date;
            c_date = -1;
        }
        if (c_time < 0 || c_open < 0 || c_high < 0 || c_low < 0 || c_close < 0) {
            throw std::runtime_error("Missing required column (time/open/high/low/close) in " + path);
        }
    } else {
        // Headerless MT4 export: date,time,open,high,low,close,volume
        const auto cols = split_csv(line);
        if (cols.size() >= 7 && cols[1].find(':') != std::string::npos) {
            c_date = 0; c_time = 1; c_open = 2; c_high = 3; c_low = 4; c_close = 5; c_vol = 6;
        }
    }

    auto parse_row = [&](const std::string& row) {
        if (row.empty()) return;
        const auto cols = split_csv(row);
        const int need = std::max({c_time, c_open, c_high, c_low, c_close, c_date});
        if (static_cast<int>(cols.size()) <= need) return;

        Candle c{};
        if (c_date >= 0) {
            c.ts = parse_timestamp(cols[c_date] + " " + cols[c_time]);
        } else {
            c.ts = parse_timestamp(cols[c_time]);
        }
        if (c.ts == 0) return;
        try {
            c.open  = std::stod(cols[c_open]);
            c.high  = std::stod(cols[c_high]);
            c.low   = std::stod(cols[c_low]);
            c.close = std::stod(cols[c_close]);
            if (c_vol >= 0 && c_vol < static_cast<int>(cols.size()) && !cols[c_vol].empty()) {
                c.volume = std::stod(cols[c_vol]);
            }
        } catch (const std::exception&) {
            return;  // skip malformed numeric rows
        }
        out.push_back(c);
    };

    if (pending_first_row) parse_row(line);
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        parse_row(line);
    }

    finalize_series(out, max_candles);
    return out;
}

std::vector<Candle> load_candles_auto(const std::string& path, size_t max_candles) {
    const auto dot = path.find_last_of('.');
    if (dot != std::string::npos && lower(path.substr(dot)) == ".csv") {
        return load_candles_csv(path, max_candles);
    }
    return load_candles(path, max_candles);
}

} // namespace smc
