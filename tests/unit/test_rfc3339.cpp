#include "../framework/test_framework.hpp"
#include "humanize/time/rfc3339.hpp"

using namespace humanize;
using namespace humanize::time;
using namespace humanize::test;

namespace {

const FixedOffset UTC = FixedOffset::utc();

Time civil(UInt32 year, UInt32 month, UInt32 day, UInt32 hour, UInt32 minute,
           UInt32 second, UInt32 nanosecond, FixedOffset offset = UTC) {
    auto time = Time::from_civil(year, month, day, hour, minute, second, nanosecond, offset);
    if (!time) throw std::runtime_error("invalid civil time in test fixture");
    return *time;
}

} // namespace

void test_accepted_shapes() {
    struct Case {
        const char* text;
        Time expect;
    };

    const Case cases[] = {
        {"2006-01-02", civil(2006, 1, 2, 0, 0, 0, 0)},
        {"2006-01-02T15:04:05", civil(2006, 1, 2, 15, 4, 5, 0)},
        {"2006-01-02 15:04:05", civil(2006, 1, 2, 15, 4, 5, 0)},
        {"2006-01-02 15:04:05Z", civil(2006, 1, 2, 15, 4, 5, 0)},
        {"2006-01-02 15:04:05+00:00", civil(2006, 1, 2, 15, 4, 5, 0)},
        {"2006-01-02 15:04:05-00:00", civil(2006, 1, 2, 15, 4, 5, 0)},
        {"2006-01-02T15:04:05.999999999Z", civil(2006, 1, 2, 15, 4, 5, 999'999'999)},
        {"2006-01-02T15:04:05.123Z", civil(2006, 1, 2, 15, 4, 5, 123'000'000)},
        {"2006-01-02T15:04:05.5", civil(2006, 1, 2, 15, 4, 5, 500'000'000)},
        {"2006-01-02T15:04:05-07:00", civil(2006, 1, 2, 22, 4, 5, 0)},
        {"2018-09-21T16:56:44.234867232+08:00",
         civil(2018, 9, 21, 16, 56, 44, 234867232, FixedOffset::from_hour_offset(8).value())},
        {"  2006-01-02T15:04:05Z\n", civil(2006, 1, 2, 15, 4, 5, 0)},
        {"9999-12-31T23:59:59.999999999Z", civil(9999, 12, 31, 23, 59, 59, 999'999'999)},
    };

    for (const auto& c : cases) {
        auto result = parse_rfc3339(c.text);
        if (result.is_error()) {
            HUMANIZE_TEST_FAIL("parse_rfc3339 accepts", String(c.text) + " -> " +
                               String(error_name(result.error())));
        }
        if (*result != c.expect) HUMANIZE_TEST_FAIL("parse_rfc3339 value", c.text);
    }
}

void test_error_kinds() {
    struct Case {
        const char* text;
        ErrorCode expect;
    };

    const Case cases[] = {
        {"", ErrorCode::EMPTY_INPUT},
        {" \t\n", ErrorCode::EMPTY_INPUT},
        {"2006-01-0", ErrorCode::TOO_SHORT},
        {"2006-01-02T", ErrorCode::TOO_SHORT},
        {"2006-01-02 15:04:5", ErrorCode::TOO_SHORT},
        {"2006-01-02T15:04:05.1234567890+08:00", ErrorCode::TOO_LONG},
        {"2006-01/02T15:04:05", ErrorCode::MALFORMED},
        {"2006-01-02F15:04:05", ErrorCode::MALFORMED},
        {"2006-01-02 15+04:05", ErrorCode::MALFORMED},
        {"2006-01-02 15:04:05?", ErrorCode::MALFORMED},
        {"200A-01-02T15:04:05Z", ErrorCode::INVALID_VALUE},
        {"200A-01-02 15:04:05", ErrorCode::INVALID_VALUE},
        {"2006-A1-02 15:04:05", ErrorCode::INVALID_VALUE},
        {"2006-01-0A 15:04:05", ErrorCode::INVALID_VALUE},
        {"2006-01-02 1A:04:05", ErrorCode::INVALID_VALUE},
        {"2006-01-02 15:0A:05", ErrorCode::INVALID_VALUE},
        {"2006-01-02 15:04:A5", ErrorCode::INVALID_VALUE},
        {"2006-01-02 15:04:05.Z", ErrorCode::MISSING_VALUE},
        {"2006-01-02T15:04:05.Z", ErrorCode::MISSING_VALUE},
        {"2006-01-02T15:04:05.1235Z08", ErrorCode::INVALID_TIMEZONE},
        {"2006-01-02T15:04:05+05:30", ErrorCode::INVALID_TIMEZONE},
        {"2006-01-02T15:04:05+13:00", ErrorCode::INVALID_TIMEZONE},
        {"2006-01-02T15:04:05Zulu", ErrorCode::INVALID_TIMEZONE},
        {"2018-02-29T15:04:05.1235", ErrorCode::VALUE_OVERFLOW},
        {"2018-02-29T15:04:05Z", ErrorCode::VALUE_OVERFLOW},
        {"2018-13-01", ErrorCode::VALUE_OVERFLOW},
        {"2018-01-01T24:00:00", ErrorCode::VALUE_OVERFLOW},
        {"2018-01-01T23:59:60Z", ErrorCode::VALUE_OVERFLOW},
        {"9999-12-31T23:00:00-01:00", ErrorCode::VALUE_OVERFLOW},
    };

    for (const auto& c : cases) {
        auto result = parse_rfc3339(c.text);
        if (result.is_success()) HUMANIZE_TEST_FAIL("parse_rfc3339 rejects", c.text);
        if (result.error() != c.expect) {
            HUMANIZE_TEST_FAIL("parse_rfc3339 error kind", String(c.text) + " -> " +
                               String(error_name(result.error())) + ", expected " +
                               String(error_name(c.expect)));
        }
    }
}

void test_fraction_scanning() {
    static_assert(humanize::time::detail::scan_fraction("5").nanos == 500'000'000);
    static_assert(humanize::time::detail::scan_fraction("123Z").digits == 3);
    static_assert(humanize::time::detail::scan_fraction("Z").digits == 0);
    static_assert(humanize::time::detail::scan_fraction("1234567891").digits == 9);

    auto frac = humanize::time::detail::scan_fraction("000000001+08:00");
    ASSERT_EQ(frac.nanos, 1u);
    ASSERT_EQ(frac.digits, 9u);

    ASSERT_EQ(humanize::time::detail::parse_fixed_digits("2006"), UInt32{2006});
    ASSERT_FALSE(humanize::time::detail::parse_fixed_digits("20A6").has_value());
    ASSERT_FALSE(humanize::time::detail::parse_fixed_digits("-1").has_value());
}

void test_time_parse_alias() {
    auto direct = parse_rfc3339("2018-09-21T16:56:44.234867232+08:00");
    auto via_time = Time::parse("2018-09-21T16:56:44.234867232+08:00");
    ASSERT_OK(direct);
    ASSERT_OK(via_time);
    ASSERT_EQ(*direct, *via_time);
    ASSERT_EQ(direct->to_unix_instant(), duration::TimeDuration(1537520204, 234867232));

    ASSERT_ERROR(Time::parse("2006-01-0"), ErrorCode::TOO_SHORT);
}

void test_parsed_ordering() {
    auto earlier = parse_rfc3339("2006-01-02T15:04:05Z");
    auto later = parse_rfc3339("2006-01-17T15:04:05Z");
    ASSERT_OK(earlier);
    ASSERT_OK(later);
    ASSERT_LT(*earlier, *later);
    ASSERT_EQ(later->since(*earlier), duration::TimeDuration::from_secs(15 * SECS_PER_DAY));

    auto east = parse_rfc3339("2006-01-02T15:04:05+08:00");
    auto utc = parse_rfc3339("2006-01-02T07:04:05Z");
    ASSERT_OK(east);
    ASSERT_OK(utc);
    ASSERT_EQ(*east, *utc);

    auto fraction_first = parse_rfc3339("2006-01-02T15:04:05.1Z");
    ASSERT_OK(fraction_first);
    ASSERT_LT(*earlier, *fraction_first);
}

void test_axis_start() {
    auto first = parse_rfc3339("0000-01-02");
    ASSERT_OK(first);
    ASSERT_EQ(first->seconds(), UInt64{0});
    ASSERT_EQ(first->nanos(), UInt32{0});
    ASSERT_ERROR(parse_rfc3339("0000-01-01"), ErrorCode::VALUE_OVERFLOW);
}

int main() {
    TestSuite suite("RFC3339 Parser Tests");

    suite.add_test("Accepted Shapes", test_accepted_shapes);
    suite.add_test("Error Kinds", test_error_kinds);
    suite.add_test("Fraction Scanning", test_fraction_scanning);
    suite.add_test("Time::parse", test_time_parse_alias);
    suite.add_test("Parsed Ordering", test_parsed_ordering);
    suite.add_test("Axis Start", test_axis_start);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
