/**
 * @file num_string.h
 * @brief Helpers for canonical numeric string formatting required by some venues.
 */

#pragma once

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace tradegate::util {

inline std::string trim_trailing_zeros(std::string value) {
    auto dot = value.find('.');
    if (dot != std::string::npos) {
        auto last = value.find_last_not_of('0');
        if (last != std::string::npos) {
            value.erase(last + 1);
        }
        if (!value.empty() && value.back() == '.') {
            value.pop_back();
        }
    }
    if (value.empty() || value == "-0") return std::string{"0"};
    return value;
}

// Fixed-point rendering with trailing zeros removed ("1.50000000" -> "1.5", "2.000" -> "2").
inline std::string format_decimal(double value, int precision = 8) {
    if (!std::isfinite(value)) return std::string{"0"};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return trim_trailing_zeros(buf);
}

// Strict decimal parse: the whole string must be consumed and the value finite.
inline std::optional<double> parse_decimal(std::string_view s) {
    if (s.empty()) return std::nullopt;
    std::string tmp(s.begin(), s.end());
    char* end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end == tmp.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
    return v;
}

inline double round_to_decimals(double x, int decimals) {
    const double multiplier = std::pow(10.0, decimals);
    return std::round(x * multiplier) / multiplier;
}

// "1.25" at 6 decimals -> 1250000. Extra fractional digits are truncated (floor).
// nullopt for signs, exponents, garbage or u64 overflow.
inline std::optional<std::uint64_t> to_base_units(std::string_view s, int decimals) {
    if (s.empty() || decimals < 0 || decimals > 18) return std::nullopt;
    std::uint64_t value = 0;
    bool seen_dot = false;
    bool seen_digit = false;
    int frac_digits = 0;
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    for (char c : s) {
        if (c == '.') {
            if (seen_dot) return std::nullopt;
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') return std::nullopt;
        seen_digit = true;
        if (seen_dot && frac_digits == decimals) continue;
        if (value > (kMax - static_cast<std::uint64_t>(c - '0')) / 10) return std::nullopt;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (seen_dot) ++frac_digits;
    }
    if (!seen_digit) return std::nullopt;
    for (; frac_digits < decimals; ++frac_digits) {
        if (value > kMax / 10) return std::nullopt;
        value *= 10;
    }
    return value;
}

inline double from_base_units(std::uint64_t units, int decimals) {
    return static_cast<double>(units) / std::pow(10.0, decimals);
}

inline std::string to_lower_ascii(std::string_view s) {
    std::string out(s.begin(), s.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){
        if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
        return static_cast<char>(c);
    });
    return out;
}

inline std::string to_lower_hex_address(std::string_view s) {
    std::string out = to_lower_ascii(s);
    if (out.rfind("0x", 0) != 0) {
        out.insert(out.begin(), {'0','x'});
    }
    return out;
}

} // namespace tradegate::util
