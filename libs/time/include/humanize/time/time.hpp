#pragma once
// =============================================================================
// Humanize - Civil Time (C++20)
// Version: 1.0.0
// Proleptic Gregorian instants in [0000-01-02T00:00:00Z, 10000-01-01T00:00:00Z)
// =============================================================================

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"
#include "humanize/duration/duration.hpp"
#include "humanize/time/fixed_offset.hpp"

namespace humanize::time {

using duration::TimeDuration;

// =============================================================================
// Constants
// =============================================================================

inline constexpr UInt64 SECS_PER_MINUTE = 60;
inline constexpr UInt64 SECS_PER_HOUR = 60 * SECS_PER_MINUTE;
inline constexpr UInt64 SECS_PER_DAY = 24 * SECS_PER_HOUR;

inline constexpr UInt32 DAYS_PER_400_YEARS = 365 * 400 + 97;
inline constexpr UInt32 DAYS_PER_100_YEARS = 365 * 100 + 24;
inline constexpr UInt32 DAYS_PER_4_YEARS = 365 * 4 + 1;

// Seconds value of 10000-01-01T00:00:00Z; every Time is below it
inline constexpr UInt64 MAX_SECONDS = 315'569'433'600;

// Seconds value of 1970-01-01T00:00:00Z
inline constexpr UInt64 UNIX_EPOCH_SECONDS = 62'167'132'800;

inline constexpr UInt32 MAX_YEAR = 10000;
inline constexpr UInt32 MAX_NANOSECOND = 999'999'999;

// =============================================================================
// Calendar helpers
// =============================================================================

[[nodiscard]] constexpr bool is_leap_year(UInt32 year) noexcept {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

// 28..31, or 0 for a month outside 1..12
[[nodiscard]] UInt32 days_in_month(UInt32 year, UInt32 month) noexcept;

// =============================================================================
// Time
// =============================================================================

class Time {
private:
    UInt64 seconds_ = 0;    // since 0000-01-02T00:00:00Z; 0000-01-01 is day -1
    UInt32 nanos_ = 0;      // < 1'000'000'000

    constexpr Time(UInt64 seconds, UInt32 nanos) : seconds_(seconds), nanos_(nanos) {}

public:
    // 0000-01-02T00:00:00Z, the earliest representable instant
    constexpr Time() = default;

    // 1970-01-01T00:00:00Z
    [[nodiscard]] static constexpr Time unix_epoch() { return Time(UNIX_EPOCH_SECONDS, 0); }

    /**
     * @brief Build an instant from a civil date and time in the given offset
     *
     * Fails (nullopt) when any field is out of range, the day does not exist
     * in that month, the second is a leap second, or the resulting instant
     * falls outside [year 0, year 10000).
     */
    [[nodiscard]] static Optional<Time> from_civil(UInt32 year, UInt32 month, UInt32 day,
                                                   UInt32 hour, UInt32 minute, UInt32 second,
                                                   UInt32 nanosecond, FixedOffset offset);

    // RFC3339 text; same as parse_rfc3339()
    [[nodiscard]] static Result<Time> parse(StringView text);

    [[nodiscard]] constexpr UInt64 seconds() const { return seconds_; }
    [[nodiscard]] constexpr UInt32 nanos() const { return nanos_; }

    // Elapsed time from `earlier` to this instant; nullopt if `earlier` is later
    [[nodiscard]] Optional<TimeDuration> since(const Time& earlier) const;

    // Elapsed time since 1970-01-01T00:00:00Z; nullopt before the epoch
    [[nodiscard]] Optional<TimeDuration> to_unix_instant() const;

    // nullopt before the Unix epoch or beyond the range of system_clock
    [[nodiscard]] Optional<SystemTimePoint> to_system_time() const;

    [[nodiscard]] constexpr auto operator<=>(const Time&) const = default;
};

} // namespace humanize::time
