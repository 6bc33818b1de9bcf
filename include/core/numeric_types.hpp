// Numeric traits for the price type selected at build time (float/double/long double)
#pragma once

namespace smc {

// name: reported in output metadata
// tolerance: relative tolerance used when two prices count as equal
template <typename T>
struct NumTraits;

template <>
struct NumTraits<float> {
    static constexpr const char* name = "float";
    static constexpr float tolerance = 1e-6f;
    static double to_double(float v) { return static_cast<double>(v); }
};

template <>
struct NumTraits<double> {
    static constexpr const char* name = "double";
    static constexpr double tolerance = 1e-9;
    static double to_double(double v) { return v; }
};

template <>
struct NumTraits<long double> {
    static constexpr const char* name = "long double";
    static constexpr long double tolerance = 1e-12L;
    static double to_double(long double v) { return static_cast<double>(v); }
};

} // namespace smc
