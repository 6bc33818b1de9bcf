// Boost.JSON helpers shared by config parsing and output
#pragma once

#include <boost/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "core/numeric_types.hpp"

namespace smc {

// ============================================================================
// Output (value -> JSON)
// ============================================================================

// Non-finite prices are written as null
template <typename T>
inline boost::json::value real_to_json(T v) {
    const double d = NumTraits<T>::to_double(v);
    if (!std::isfinite(d)) return nullptr;
    return d;
}

inline boost::json::value opt_index_json(const std::optional<size_t>& v) {
    if (!v) return nullptr;
    return static_cast<uint64_t>(*v);
}

// ============================================================================
// Config fields (JSON -> value). Numbers may also be given as strings.
// Anything else raises ConfigError naming the field.
// ============================================================================

template <typename T>
inline T json_real(const boost::json::value& v, const char* field) {
    if (v.is_double()) return static_cast<T>(v.as_double());
    if (v.is_int64())  return static_cast<T>(v.as_int64());
    if (v.is_uint64()) return static_cast<T>(v.as_uint64());
    if (v.is_string()) {
        const char* s = v.as_string().c_str();
        char* end = nullptr;
        const long double x = std::strtold(s, &end);
        if (end != s && *end == '\0') return static_cast<T>(x);
    }
    throw ConfigError(std::string(field) + " must be a number");
}

inline int64_t json_int(const boost::json::value& v, const char* field) {
    if (v.is_int64())  return v.as_int64();
    if (v.is_uint64()) return static_cast<int64_t>(v.as_uint64());
    if (v.is_double()) return static_cast<int64_t>(v.as_double());
    if (v.is_string()) {
        const char* s = v.as_string().c_str();
        char* end = nullptr;
        const long long x = std::strtoll(s, &end, 10);
        if (end != s && *end == '\0') return static_cast<int64_t>(x);
    }
    throw ConfigError(std::string(field) + " must be an integer");
}

inline bool json_bool(const boost::json::value& v, const char* field) {
    if (v.is_bool()) return v.as_bool();
    if (v.is_int64()) return v.as_int64() != 0;
    if (v.is_uint64()) return v.as_uint64() != 0;
    if (v.is_string()) {
        const std::string s(v.as_string().c_str());
        if (s == "true" || s == "1") return true;
        if (s == "false" || s == "0") return false;
    }
    throw ConfigError(std::string(field) + " must be a bool");
}

// Required string member
inline std::string json_string(const boost::json::object& obj, const char* key) {
    auto* v = obj.if_contains(key);
    if (!v) throw ConfigError(std::string("missing key: ") + key);
    if (!v->is_string()) throw ConfigError(std::string(key) + " must be a string");
    return std::string(v->as_string().c_str());
}

// ============================================================================
// Environment and files
// ============================================================================

// Unset or unparsable variables yield default_value
inline uint64_t env_u64(const char* key, uint64_t default_value) {
    const char* raw = std::getenv(key);
    if (!raw || !*raw) return default_value;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(raw, &end, 10);
    return *end == '\0' ? static_cast<uint64_t>(v) : default_value;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // namespace smc
