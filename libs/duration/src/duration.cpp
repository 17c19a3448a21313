// =============================================================================
// Humanize - Duration Parsing Implementation
// Version: 1.0.0
// =============================================================================

#include <humanize/duration/duration.hpp>
#include <humanize/num/checked.hpp>
#include <format>

namespace humanize::duration {

using num::checked_add;
using num::checked_mul;

namespace {

// Nanoseconds per unit, in the order ns, us, ms, s, m, h, d
constexpr UInt64 UNIT_NANOS[] = {
    1ULL,
    1'000ULL,
    1'000'000ULL,
    1'000'000'000ULL,
    60ULL * 1'000'000'000ULL,
    3'600ULL * 1'000'000'000ULL,
    86'400ULL * 1'000'000'000ULL,
};

struct Segment {
    UInt64 value = 0;
    Size consumed = 0;
};

// Maximal run of ASCII digits
Result<Segment> read_int(StringView text) {
    Segment seg;
    while (seg.consumed < text.size() && is_ascii_digit(text[seg.consumed])) {
        auto shifted = checked_mul<UInt64>(seg.value, 10);
        if (!shifted) return ErrorCode::VALUE_OVERFLOW;
        auto next = checked_add<UInt64>(*shifted, static_cast<UInt64>(text[seg.consumed] - '0'));
        if (!next) return ErrorCode::VALUE_OVERFLOW;
        seg.value = *next;
        ++seg.consumed;
    }
    if (seg.consumed == 0) return ErrorCode::MISSING_VALUE;
    return seg;
}

// Maximal run of non-digits, trimmed. Any byte that is not 0-9 belongs to
// the unit, so "1 中文" yields an unknown unit rather than a missing one.
Result<StringView> read_unit(StringView text, Size& consumed) {
    consumed = 0;
    while (consumed < text.size() && !is_ascii_digit(text[consumed])) ++consumed;
    if (consumed == 0) return ErrorCode::MISSING_UNIT;
    return trim_view(text.substr(0, consumed));
}

} // anonymous namespace

// =============================================================================
// TimeDuration
// =============================================================================

Optional<TimeDuration> TimeDuration::normalized(UInt64 secs, UInt64 nanos) {
    auto whole = num::checked_add<UInt64>(secs, nanos / NANOS_PER_SECOND);
    if (!whole) return nullopt;
    return TimeDuration(*whole, static_cast<UInt32>(nanos % NANOS_PER_SECOND));
}

Optional<UInt64> TimeDuration::total_nanoseconds() const {
    auto whole = num::checked_mul<UInt64>(seconds, NANOS_PER_SECOND);
    if (!whole) return nullopt;
    return num::checked_add<UInt64>(*whole, nanoseconds);
}

Optional<Nanoseconds> TimeDuration::to_chrono() const {
    auto total = total_nanoseconds();
    if (!total) return nullopt;
    auto count = num::checked_cast<Nanoseconds::rep>(*total);
    if (!count) return nullopt;
    return Nanoseconds(*count);
}

Optional<TimeDuration> TimeDuration::checked_add(const TimeDuration& other) const {
    UInt32 nanos = nanoseconds + other.nanoseconds;
    UInt64 carry = 0;
    if (nanos >= NANOS_PER_SECOND) {
        nanos -= NANOS_PER_SECOND;
        carry = 1;
    }
    auto secs = num::checked_add(seconds, other.seconds);
    if (!secs) return nullopt;
    secs = num::checked_add(*secs, carry);
    if (!secs) return nullopt;
    return TimeDuration(*secs, nanos);
}

String TimeDuration::to_string() const {
    if (nanoseconds == 0) return std::format("{}s", seconds);
    return std::format("{}.{:09}s", seconds, nanoseconds);
}

// =============================================================================
// Parsing
// =============================================================================

Result<UInt64> unit_nanos(StringView unit) {
    if (unit == "ns") return UNIT_NANOS[0];
    if (unit == "us") return UNIT_NANOS[1];
    if (unit == "ms") return UNIT_NANOS[2];
    if (unit == "s") return UNIT_NANOS[3];
    if (unit == "m") return UNIT_NANOS[4];
    if (unit == "h") return UNIT_NANOS[5];
    if (unit == "d") return UNIT_NANOS[6];
    return ErrorCode::INVALID_UNIT;
}

Result<TimeDuration> parse_duration(StringView text) {
    StringView input = trim_view(text);
    if (input.empty()) return ErrorCode::EMPTY_INPUT;
    if (input == "0") return TimeDuration{};

    UInt64 total = 0;
    Size pos = 0;
    while (pos < input.size()) {
        auto seg = read_int(input.substr(pos));
        if (!seg) return seg.error();
        pos += seg->consumed;

        Size consumed = 0;
        auto unit = read_unit(input.substr(pos), consumed);
        if (!unit) return unit.error();
        pos += consumed;

        auto nanos = unit_nanos(*unit);
        if (!nanos) return nanos.error();

        auto scaled = checked_mul(seg->value, *nanos);
        if (!scaled) return ErrorCode::VALUE_OVERFLOW;
        auto sum = checked_add(total, *scaled);
        if (!sum) return ErrorCode::VALUE_OVERFLOW;
        total = *sum;
    }

    return TimeDuration::from_nanos(total);
}

} // namespace humanize::duration
