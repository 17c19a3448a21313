// =============================================================================
// Humanize - RFC3339 Parsing Implementation
// Version: 1.0.0
// =============================================================================

#include <humanize/time/rfc3339.hpp>

namespace humanize::time {

using detail::parse_fixed_digits;
using detail::scan_fraction;

namespace {

Result<void> check_length(Size length) {
    if (length < rfc3339::DATE_LENGTH) return ErrorCode::TOO_SHORT;
    if (length > rfc3339::DATE_LENGTH && length < rfc3339::DATE_TIME_LENGTH) {
        return ErrorCode::TOO_SHORT;
    }
    if (length > rfc3339::MAX_LENGTH) return ErrorCode::TOO_LONG;
    return make_success();
}

// Separators only; digits are validated afterwards
Result<void> check_punctuation(StringView s) {
    if (s[4] != '-' || s[7] != '-') return ErrorCode::MALFORMED;

    if (s.size() > rfc3339::DATE_LENGTH) {
        if (s[10] != 'T' && s[10] != ' ') return ErrorCode::MALFORMED;
        if (s[13] != ':' || s[16] != ':') return ErrorCode::MALFORMED;
    }

    if (s.size() > rfc3339::DATE_TIME_LENGTH) {
        char c = s[19];
        if (c != '.' && c != 'Z' && c != '+' && c != '-') return ErrorCode::MALFORMED;
    }

    return make_success();
}

struct CivilFields {
    UInt32 year = 0;
    UInt32 month = 0;
    UInt32 day = 0;
    UInt32 hour = 0;
    UInt32 minute = 0;
    UInt32 second = 0;
};

Result<CivilFields> decode_fields(StringView s) {
    struct Field {
        Size pos;
        Size len;
        UInt32 CivilFields::*member;
    };
    static constexpr Field DATE_FIELDS[] = {
        {0, 4, &CivilFields::year},
        {5, 2, &CivilFields::month},
        {8, 2, &CivilFields::day},
    };
    static constexpr Field TIME_FIELDS[] = {
        {11, 2, &CivilFields::hour},
        {14, 2, &CivilFields::minute},
        {17, 2, &CivilFields::second},
    };

    CivilFields fields;
    auto decode = [&](const Field& f) {
        auto value = parse_fixed_digits(s.substr(f.pos, f.len));
        if (!value) return false;
        fields.*f.member = *value;
        return true;
    };

    for (const auto& f : DATE_FIELDS) {
        if (!decode(f)) return ErrorCode::INVALID_VALUE;
    }
    if (s.size() > rfc3339::DATE_LENGTH) {
        for (const auto& f : TIME_FIELDS) {
            if (!decode(f)) return ErrorCode::INVALID_VALUE;
        }
    }
    return fields;
}

} // anonymous namespace

Result<Time> parse_rfc3339(StringView text) {
    StringView s = trim_view(text);
    if (s.empty()) return ErrorCode::EMPTY_INPUT;

    HUMANIZE_TRY(check_length(s.size()));
    HUMANIZE_TRY(check_punctuation(s));

    auto fields = decode_fields(s);
    if (!fields) return fields.error();

    UInt32 nanos = 0;
    Size zone_start = s.size();
    if (s.size() > rfc3339::DATE_TIME_LENGTH) {
        zone_start = rfc3339::DATE_TIME_LENGTH;
        if (s[19] == '.') {
            auto frac = scan_fraction(s.substr(20));
            if (frac.digits == 0) return ErrorCode::MISSING_VALUE;
            nanos = frac.nanos;
            zone_start = 20 + frac.digits;
        }
    }

    auto offset = FixedOffset::parse_zone_suffix(s.substr(zone_start));
    if (!offset) return ErrorCode::INVALID_TIMEZONE;

    auto time = Time::from_civil(fields->year, fields->month, fields->day,
                                 fields->hour, fields->minute, fields->second,
                                 nanos, *offset);
    if (!time) return ErrorCode::VALUE_OVERFLOW;
    return *time;
}

} // namespace humanize::time
