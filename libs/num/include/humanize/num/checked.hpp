#pragma once
// =============================================================================
// Humanize - Checked Integer Arithmetic (C++20)
// Version: 1.0.0
// Overflow-aware multiply/add/cast over every standard integer type
// =============================================================================

#include "humanize/common/types.hpp"
#include <limits>
#include <utility>

namespace humanize::num {

// =============================================================================
// Arithmetic
// =============================================================================

// a * b, or nullopt when the product is not representable in T
template<Integral T>
[[nodiscard]] constexpr Optional<T> checked_mul(T a, T b) noexcept {
    if (a == 0 || b == 0) return T{0};

    constexpr T max = std::numeric_limits<T>::max();
    constexpr T min = std::numeric_limits<T>::min();

    if constexpr (std::is_unsigned_v<T>) {
        if (a > max / b) return nullopt;
    } else {
        if (a > 0) {
            if (b > 0) {
                if (a > max / b) return nullopt;
            } else {
                if (b < min / a) return nullopt;
            }
        } else {
            if (b > 0) {
                if (a < min / b) return nullopt;
            } else {
                if (a < max / b) return nullopt;
            }
        }
    }
    return static_cast<T>(a * b);
}

// a + b, or nullopt when the sum is not representable in T
template<Integral T>
[[nodiscard]] constexpr Optional<T> checked_add(T a, T b) noexcept {
    if constexpr (std::is_unsigned_v<T>) {
        if (a > std::numeric_limits<T>::max() - b) return nullopt;
    } else {
        if (b > 0 && a > std::numeric_limits<T>::max() - b) return nullopt;
        if (b < 0 && a < std::numeric_limits<T>::min() - b) return nullopt;
    }
    return static_cast<T>(a + b);
}

// base^exp by repeated checked multiplication
template<Integral T>
[[nodiscard]] constexpr Optional<T> checked_pow(T base, UInt32 exp) noexcept {
    T result = 1;
    for (UInt32 i = 0; i < exp; ++i) {
        auto next = checked_mul(result, base);
        if (!next) return nullopt;
        result = *next;
    }
    return result;
}

// =============================================================================
// Conversion
// =============================================================================

// Value-preserving conversion; nullopt when `from` does not fit in To
template<Integral To, Integral From>
[[nodiscard]] constexpr Optional<To> checked_cast(From from) noexcept {
    if (!std::in_range<To>(from)) return nullopt;
    return static_cast<To>(from);
}

} // namespace humanize::num
