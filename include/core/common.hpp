// Shared helpers: console mutex and price comparison
#pragma once

#include <algorithm>
#include <cmath>
#include <mutex>

#include "core/numeric_types.hpp"

namespace smc {

// Serializes progress lines written from worker threads
inline std::mutex io_mu;

// True when a and b are within NumTraits<T>::tolerance of each other,
// relative to max(1, |a|, |b|)
template <typename T>
inline bool same_price(T a, T b) {
    const T scale = std::max<T>(T(1), std::max(std::abs(a), std::abs(b)));
    return std::abs(a - b) <= NumTraits<T>::tolerance * scale;
}

} // namespace smc
