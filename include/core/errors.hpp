// Error types raised at the detector API boundary
#pragma once

#include <stdexcept>
#include <string>

namespace smc {

// Raised eagerly when a caller supplies a non-positive lookback, window,
// period or threshold. Insufficient data and invalid ranges are never
// errors: detectors return empty results for those.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument("config error: " + what) {}
};

// Throw ConfigError unless value > 0
template <typename V>
inline void require_positive(V value, const char* name) {
    if (!(value > V(0))) {
        throw ConfigError(std::string(name) + " must be positive");
    }
}

// Throw ConfigError if value < 0
template <typename V>
inline void require_non_negative(V value, const char* name) {
    if (value < V(0)) {
        throw ConfigError(std::string(name) + " must not be negative");
    }
}

} // namespace smc
