// =============================================================================
// Humanize - Fixed UTC Offsets Implementation
// Version: 1.0.0
// =============================================================================

#include <humanize/time/fixed_offset.hpp>

namespace humanize::time {

namespace {

// Offset in seconds for hour offsets -12..+12, indexed by hours + 12
constexpr Int32 OFFSETS[] = {
    SECS_PER_HOUR_OFFSET * -12, SECS_PER_HOUR_OFFSET * -11, SECS_PER_HOUR_OFFSET * -10,
    SECS_PER_HOUR_OFFSET * -9,  SECS_PER_HOUR_OFFSET * -8,  SECS_PER_HOUR_OFFSET * -7,
    SECS_PER_HOUR_OFFSET * -6,  SECS_PER_HOUR_OFFSET * -5,  SECS_PER_HOUR_OFFSET * -4,
    SECS_PER_HOUR_OFFSET * -3,  SECS_PER_HOUR_OFFSET * -2,  SECS_PER_HOUR_OFFSET * -1,
    0,
    SECS_PER_HOUR_OFFSET * 1,   SECS_PER_HOUR_OFFSET * 2,   SECS_PER_HOUR_OFFSET * 3,
    SECS_PER_HOUR_OFFSET * 4,   SECS_PER_HOUR_OFFSET * 5,   SECS_PER_HOUR_OFFSET * 6,
    SECS_PER_HOUR_OFFSET * 7,   SECS_PER_HOUR_OFFSET * 8,   SECS_PER_HOUR_OFFSET * 9,
    SECS_PER_HOUR_OFFSET * 10,  SECS_PER_HOUR_OFFSET * 11,  SECS_PER_HOUR_OFFSET * 12,
};

static_assert(std::size(OFFSETS) == MAX_HOUR_OFFSET - MIN_HOUR_OFFSET + 1);

} // anonymous namespace

Optional<FixedOffset> FixedOffset::from_hour_offset(Int32 hours) {
    if (hours < MIN_HOUR_OFFSET || hours > MAX_HOUR_OFFSET) return nullopt;
    return FixedOffset(OFFSETS[hours - MIN_HOUR_OFFSET]);
}

Result<FixedOffset> FixedOffset::parse_zone_suffix(StringView text) {
    if (text.empty() || text == "Z") return utc();

    // [+-]HH:00
    if (text.size() != 6 || (text[0] != '+' && text[0] != '-') ||
        !is_ascii_digit(text[1]) || !is_ascii_digit(text[2]) ||
        text.substr(3) != ":00") {
        return ErrorCode::INVALID_VALUE;
    }

    Int32 hours = (text[1] - '0') * 10 + (text[2] - '0');
    if (hours > MAX_HOUR_OFFSET) return ErrorCode::INVALID_VALUE;

    return FixedOffset(OFFSETS[(text[0] == '-' ? -hours : hours) - MIN_HOUR_OFFSET]);
}

} // namespace humanize::time
