#pragma once
// =============================================================================
// Humanize - RFC3339 Parsing (C++20)
// Version: 1.0.0
// =============================================================================

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"
#include "humanize/time/time.hpp"

namespace humanize::time {

// Byte positions and lengths of the accepted shapes
namespace rfc3339 {
    inline constexpr Size DATE_LENGTH = 10;        // 2006-01-02
    inline constexpr Size DATE_TIME_LENGTH = 19;   // 2006-01-02T15:04:05
    inline constexpr Size MAX_LENGTH = 35;         // ...T15:04:05.123456789+08:00
    inline constexpr Size MAX_FRACTION_DIGITS = 9;
}

namespace detail {

// Decimal value of a run of ASCII digits; nullopt on any other byte
[[nodiscard]] constexpr Optional<UInt32> parse_fixed_digits(StringView digits) noexcept {
    UInt32 value = 0;
    for (char c : digits) {
        if (!is_ascii_digit(c)) return nullopt;
        value = value * 10 + static_cast<UInt32>(c - '0');
    }
    return value;
}

struct Fraction {
    UInt32 nanos = 0;
    Size digits = 0;    // bytes consumed, at most MAX_FRACTION_DIGITS
};

// Leading digits of `text` as nanoseconds: ".5" is 500'000'000.
// Stops after the 9th digit.
[[nodiscard]] constexpr Fraction scan_fraction(StringView text) noexcept {
    Fraction frac;
    while (frac.digits < text.size() && frac.digits < rfc3339::MAX_FRACTION_DIGITS &&
           is_ascii_digit(text[frac.digits])) {
        frac.nanos = frac.nanos * 10 + static_cast<UInt32>(text[frac.digits] - '0');
        ++frac.digits;
    }
    for (Size i = frac.digits; i < rfc3339::MAX_FRACTION_DIGITS; ++i) frac.nanos *= 10;
    return frac;
}

} // namespace detail

/**
 * @brief Parse an RFC3339 timestamp
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD{T| }hh:mm:ss", optionally followed by
 * "." and 1-9 fraction digits, then an optional zone: "Z" or a whole-hour
 * offset "+HH:00"/"-HH:00" up to 12. No zone means UTC. Surrounding
 * whitespace is ignored.
 *
 * Errors, in the order they are checked:
 *   EMPTY_INPUT       - blank input
 *   TOO_SHORT         - fewer than 10 bytes, or 11 to 18
 *   TOO_LONG          - more than 35 bytes
 *   MALFORMED         - a separator is not where it belongs
 *   INVALID_VALUE     - a date or time field contains a non-digit
 *   MISSING_VALUE     - "." with no digits after it
 *   INVALID_TIMEZONE  - unrecognised zone suffix
 *   VALUE_OVERFLOW    - no such calendar date, or outside years 0..9999
 */
[[nodiscard]] Result<Time> parse_rfc3339(StringView text);

} // namespace humanize::time
