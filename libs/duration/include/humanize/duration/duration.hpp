#pragma once
// =============================================================================
// Humanize - Duration Parsing (C++20)
// Version: 1.0.0
// Parses elapsed-time literals such as "1h 30m" or "250ms"
// =============================================================================

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"

namespace humanize::duration {

// =============================================================================
// Constants
// =============================================================================

inline constexpr UInt32 NANOS_PER_SECOND = 1'000'000'000;
inline constexpr UInt32 NANOS_PER_MILLI = 1'000'000;
inline constexpr UInt32 NANOS_PER_MICRO = 1'000;

// =============================================================================
// TimeDuration
// =============================================================================

// Non-negative span of time. Wide enough for the whole 0000..9999 calendar
// range, which does not fit in 64-bit nanoseconds.
struct TimeDuration {
    UInt64 seconds = 0;
    UInt32 nanoseconds = 0;     // always < NANOS_PER_SECOND

    constexpr TimeDuration() = default;

    // Requires nanos < NANOS_PER_SECOND; see normalized() for a raw pair
    constexpr TimeDuration(UInt64 secs, UInt32 nanos) : seconds(secs), nanoseconds(nanos) {}

    // Carries whole seconds out of `nanos`; nullopt if the seconds overflow
    [[nodiscard]] static Optional<TimeDuration> normalized(UInt64 secs, UInt64 nanos);

    [[nodiscard]] static constexpr TimeDuration from_nanos(UInt64 nanos) {
        return {nanos / NANOS_PER_SECOND, static_cast<UInt32>(nanos % NANOS_PER_SECOND)};
    }
    [[nodiscard]] static constexpr TimeDuration from_micros(UInt64 micros) {
        return {micros / 1'000'000, static_cast<UInt32>(micros % 1'000'000) * NANOS_PER_MICRO};
    }
    [[nodiscard]] static constexpr TimeDuration from_millis(UInt64 millis) {
        return {millis / 1'000, static_cast<UInt32>(millis % 1'000) * NANOS_PER_MILLI};
    }
    [[nodiscard]] static constexpr TimeDuration from_secs(UInt64 secs) {
        return {secs, 0};
    }

    [[nodiscard]] constexpr bool is_zero() const { return seconds == 0 && nanoseconds == 0; }

    // nullopt when the span exceeds UInt64 nanoseconds (about 584 years)
    [[nodiscard]] Optional<UInt64> total_nanoseconds() const;

    // nullopt when the span exceeds std::chrono::nanoseconds (about 292 years)
    [[nodiscard]] Optional<Nanoseconds> to_chrono() const;

    [[nodiscard]] Optional<TimeDuration> checked_add(const TimeDuration& other) const;

    // "90s", "1.500000000s"
    [[nodiscard]] String to_string() const;

    [[nodiscard]] constexpr auto operator<=>(const TimeDuration&) const = default;
};

// =============================================================================
// Parsing
// =============================================================================

// Parses one or more <integer><unit> segments, optionally separated by
// whitespace, and sums them. Units: ns, us, ms, s, m, h, d. "0" alone is
// accepted without a unit.
//
// Errors: EMPTY_INPUT, MISSING_VALUE, MISSING_UNIT, INVALID_UNIT, VALUE_OVERFLOW
[[nodiscard]] Result<TimeDuration> parse_duration(StringView text);

// Nanoseconds per unit token, or INVALID_UNIT
[[nodiscard]] Result<UInt64> unit_nanos(StringView unit);

} // namespace humanize::duration
