// =============================================================================
// Humanize - Civil Time Implementation
// Version: 1.0.0
// =============================================================================

#include <humanize/time/time.hpp>
#include <humanize/time/rfc3339.hpp>

namespace humanize::time {

// =============================================================================
// Constants
// =============================================================================

namespace {

// Days in each month (non-leap year)
constexpr UInt32 DAYS_IN_MONTH[] = {
    0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31
};

// Cumulative days before each month (non-leap year)
constexpr UInt32 DAYS_BEFORE_MONTH[] = {
    0, 0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334
};

constexpr bool in_range(UInt32 n, UInt32 min, UInt32 max) {
    return min <= n && n <= max;
}

// Day number of year-month-day on the seconds axis. The 400/100/4-year block
// constants already include the current year's leap day, so January and
// February of a leap year are pulled back by one. This places 0000-01-01 at
// day -1.
Int64 day_number(UInt32 year, UInt32 month, UInt32 day) {
    Int64 days = 0;
    UInt32 y = year;

    UInt32 n = y / 400;
    y -= n * 400;
    days += static_cast<Int64>(DAYS_PER_400_YEARS) * n;

    n = y / 100;
    y -= n * 100;
    days += static_cast<Int64>(DAYS_PER_100_YEARS) * n;

    n = y / 4;
    y -= n * 4;
    days += static_cast<Int64>(DAYS_PER_4_YEARS) * n;

    days += 365 * static_cast<Int64>(y);

    days += DAYS_BEFORE_MONTH[month];
    if (is_leap_year(year) && month <= 2) {
        days -= 1;
    }

    return days + day - 1;
}

} // anonymous namespace

// =============================================================================
// Calendar helpers
// =============================================================================

UInt32 days_in_month(UInt32 year, UInt32 month) noexcept {
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS_IN_MONTH[month];
}

// =============================================================================
// Time
// =============================================================================

Optional<Time> Time::from_civil(UInt32 year, UInt32 month, UInt32 day,
                                UInt32 hour, UInt32 minute, UInt32 second,
                                UInt32 nanosecond, FixedOffset offset) {
    if (!in_range(year, 0, MAX_YEAR) ||
        !in_range(month, 1, 12) ||
        !in_range(day, 1, 31) ||
        !in_range(hour, 0, 23) ||
        !in_range(minute, 0, 59) ||
        !in_range(second, 0, 59) ||
        !in_range(nanosecond, 0, MAX_NANOSECOND)) {
        return nullopt;
    }

    if (day > days_in_month(year, month)) return nullopt;

    Int64 secs = day_number(year, month, day) * static_cast<Int64>(SECS_PER_DAY)
        + hour * static_cast<Int64>(SECS_PER_HOUR)
        + minute * static_cast<Int64>(SECS_PER_MINUTE)
        + second;

    // Local time minus the offset gives UTC
    Int64 shift = offset.offset_seconds();
    if (shift >= 0) {
        if (shift > secs) return nullopt;
        secs -= shift;
    } else {
        secs += -shift;
    }

    if (secs < 0 || static_cast<UInt64>(secs) >= MAX_SECONDS) return nullopt;

    return Time(static_cast<UInt64>(secs), nanosecond);
}

Result<Time> Time::parse(StringView text) {
    return parse_rfc3339(text);
}

Optional<TimeDuration> Time::since(const Time& earlier) const {
    if (*this < earlier) return nullopt;

    UInt64 secs = seconds_ - earlier.seconds_;
    UInt32 nanos = nanos_;
    if (nanos < earlier.nanos_) {
        secs -= 1;
        nanos += duration::NANOS_PER_SECOND;
    }
    nanos -= earlier.nanos_;

    return TimeDuration(secs, nanos);
}

Optional<TimeDuration> Time::to_unix_instant() const {
    return since(unix_epoch());
}

Optional<SystemTimePoint> Time::to_system_time() const {
    auto elapsed = to_unix_instant();
    if (!elapsed) return nullopt;

    using ClockDuration = SystemClock::duration;
    constexpr auto max_secs = std::chrono::duration_cast<Seconds>(ClockDuration::max()).count();
    if (elapsed->seconds >= static_cast<UInt64>(max_secs)) return nullopt;

    auto since_epoch = std::chrono::duration_cast<ClockDuration>(
        Seconds(static_cast<Seconds::rep>(elapsed->seconds)));
    since_epoch += std::chrono::duration_cast<ClockDuration>(Nanoseconds(elapsed->nanoseconds));
    return SystemTimePoint(since_epoch);
}

} // namespace humanize::time
