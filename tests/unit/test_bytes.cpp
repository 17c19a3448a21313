#include "../framework/test_framework.hpp"
#include "humanize/bytes/bytes.hpp"

using namespace humanize;
using namespace humanize::bytes;
using namespace humanize::test;

namespace {

UInt64 size_of(Unit unit) {
    return unit_size<UInt64>(unit).value();
}

UInt64 parsed(StringView text) {
    auto result = parse_bytes(text);
    if (result.is_error()) {
        throw std::runtime_error("parse_bytes(\"" + String(text) + "\") failed: " +
                                 String(error_name(result.error())));
    }
    return result->count();
}

} // namespace

void test_unit_sizes() {
    ASSERT_EQ(size_of(Unit::Byte), 1u);
    ASSERT_EQ(size_of(Unit::KiByte), 1024u);
    ASSERT_EQ(size_of(Unit::MiByte), 1024u * 1024u);
    ASSERT_EQ(size_of(Unit::GiByte), 1ULL << 30);
    ASSERT_EQ(size_of(Unit::TiByte), 1ULL << 40);
    ASSERT_EQ(size_of(Unit::PiByte), 1ULL << 50);
    ASSERT_EQ(size_of(Unit::EiByte), 1ULL << 60);
    ASSERT_EQ(size_of(Unit::KByte), 1000u);
    ASSERT_EQ(size_of(Unit::MByte), 1000u * 1000u);
    ASSERT_EQ(size_of(Unit::GByte), 1'000'000'000ULL);
    ASSERT_EQ(size_of(Unit::TByte), 1'000'000'000'000ULL);
    ASSERT_EQ(size_of(Unit::PByte), 1'000'000'000'000'000ULL);
    ASSERT_EQ(size_of(Unit::EByte), 1'000'000'000'000'000'000ULL);
}

void test_unit_sizes_narrow_types() {
    ASSERT_EQ(unit_size<Int8>(Unit::Byte), Int8{1});
    ASSERT_FALSE(unit_size<Int8>(Unit::KiByte).has_value());
    ASSERT_FALSE(unit_size<UInt8>(Unit::KByte).has_value());
    ASSERT_EQ(unit_size<Int16>(Unit::KiByte), Int16{1024});
    ASSERT_FALSE(unit_size<Int16>(Unit::MByte).has_value());
    ASSERT_EQ(unit_size<UInt32>(Unit::GiByte), UInt32{1} << 30);
    ASSERT_FALSE(unit_size<UInt32>(Unit::TiByte).has_value());
    ASSERT_FALSE(unit_size<Int64>(Unit::EByte) == nullopt);
}

void test_unit_names() {
    ASSERT_EQ(to_string(Unit::Byte), "B");
    ASSERT_EQ(to_string(Unit::KiByte), "KiB");
    ASSERT_EQ(to_string(Unit::EiByte), "EiB");
    ASSERT_EQ(to_string(Unit::KByte), "KB");
    ASSERT_EQ(to_string(Unit::EByte), "EB");
}

void test_parse_unit() {
    ASSERT_EQ(parse_unit("").value(), Unit::Byte);
    ASSERT_EQ(parse_unit("b").value(), Unit::Byte);
    ASSERT_EQ(parse_unit("B").value(), Unit::Byte);
    ASSERT_EQ(parse_unit(" KiB ").value(), Unit::KiByte);
    ASSERT_EQ(parse_unit("mi").value(), Unit::MiByte);
    ASSERT_EQ(parse_unit("GIB").value(), Unit::GiByte);
    ASSERT_EQ(parse_unit("k").value(), Unit::KByte);
    ASSERT_EQ(parse_unit("Tb").value(), Unit::TByte);
    ASSERT_EQ(parse_unit("e").value(), Unit::EByte);

    ASSERT_ERROR(parse_unit("bytes"), ErrorCode::INVALID_UNIT);
    ASSERT_ERROR(parse_unit("kibb"), ErrorCode::INVALID_UNIT);
    ASSERT_ERROR(parse_unit("x"), ErrorCode::INVALID_UNIT);
    ASSERT_ERROR(parse_unit("i"), ErrorCode::INVALID_UNIT);
}

void test_parse_plain_and_binary() {
    ASSERT_EQ(parsed("0"), 0u);
    ASSERT_EQ(parsed("1"), 1u);
    ASSERT_EQ(parsed("1b"), 1u);
    ASSERT_EQ(parsed("1B"), 1u);
    ASSERT_EQ(parsed("1 b"), 1u);
    ASSERT_EQ(parsed("1 B"), 1u);

    const std::pair<const char*, Unit> binary[] = {
        {"ki", Unit::KiByte}, {"Ki", Unit::KiByte}, {"kib", Unit::KiByte}, {"KiB", Unit::KiByte},
        {"mi", Unit::MiByte}, {"Mi", Unit::MiByte}, {"mib", Unit::MiByte}, {"MiB", Unit::MiByte},
        {"gi", Unit::GiByte}, {"Gi", Unit::GiByte}, {"gib", Unit::GiByte}, {"GiB", Unit::GiByte},
        {"ti", Unit::TiByte}, {"Ti", Unit::TiByte}, {"tib", Unit::TiByte}, {"TiB", Unit::TiByte},
        {"pi", Unit::PiByte}, {"Pi", Unit::PiByte}, {"pib", Unit::PiByte}, {"PiB", Unit::PiByte},
        {"ei", Unit::EiByte}, {"Ei", Unit::EiByte}, {"eib", Unit::EiByte}, {"EiB", Unit::EiByte},
    };
    for (const auto& [suffix, unit] : binary) {
        ASSERT_EQ(parsed(String("1 ") + suffix), size_of(unit));
    }
}

void test_parse_decimal() {
    const std::pair<const char*, Unit> decimal[] = {
        {"k", Unit::KByte}, {"K", Unit::KByte}, {"kb", Unit::KByte}, {"KB", Unit::KByte},
        {"m", Unit::MByte}, {"M", Unit::MByte}, {"mb", Unit::MByte}, {"MB", Unit::MByte},
        {"g", Unit::GByte}, {"G", Unit::GByte}, {"gb", Unit::GByte}, {"GB", Unit::GByte},
        {"t", Unit::TByte}, {"T", Unit::TByte}, {"tb", Unit::TByte}, {"TB", Unit::TByte},
        {"p", Unit::PByte}, {"P", Unit::PByte}, {"pb", Unit::PByte}, {"PB", Unit::PByte},
        {"e", Unit::EByte}, {"E", Unit::EByte}, {"eb", Unit::EByte}, {"EB", Unit::EByte},
    };
    for (const auto& [suffix, unit] : decimal) {
        ASSERT_EQ(parsed(String("1 ") + suffix), size_of(unit));
    }

    ASSERT_EQ(parsed("10GB"), 10'000'000'000ULL);
    ASSERT_EQ(parsed("  512 MiB\n"), 512ULL << 20);
    ASSERT_EQ(parsed("15 EiB"), 15ULL << 60);
}

void test_parse_errors() {
    ASSERT_ERROR(parse_bytes(""), ErrorCode::EMPTY_INPUT);
    ASSERT_ERROR(parse_bytes(" \t "), ErrorCode::EMPTY_INPUT);
    ASSERT_ERROR(parse_bytes("EB"), ErrorCode::MISSING_VALUE);
    ASSERT_ERROR(parse_bytes("0.5 EB"), ErrorCode::INVALID_VALUE);
    ASSERT_ERROR(parse_bytes("-1 EB"), ErrorCode::INVALID_VALUE);
    ASSERT_ERROR(parse_bytes("1 EEEEB"), ErrorCode::INVALID_UNIT);
    ASSERT_ERROR(parse_bytes("100 EB"), ErrorCode::VALUE_OVERFLOW);
    ASSERT_ERROR(parse_bytes("16 EiB"), ErrorCode::VALUE_OVERFLOW);
    ASSERT_ERROR(parse_bytes("99999999999999999999"), ErrorCode::INVALID_VALUE);

    // The unit is checked before the value
    ASSERT_ERROR(parse_bytes("0.5 XB"), ErrorCode::INVALID_UNIT);
    // Non-ASCII bytes start the unit
    ASSERT_ERROR(parse_bytes("1\xE4\xB8\xAD"), ErrorCode::INVALID_UNIT);
}

void test_int_types() {
    ASSERT_EQ(parse_bytes<Int8>("1 B")->count(), Int8{1});
    ASSERT_EQ(parse_bytes<UInt8>("1 B")->count(), UInt8{1});
    ASSERT_EQ(parse_bytes<Int16>("1 B")->count(), Int16{1});
    ASSERT_EQ(parse_bytes<UInt16>("1 B")->count(), UInt16{1});
    ASSERT_EQ(parse_bytes<Int32>("1 B")->count(), Int32{1});
    ASSERT_EQ(parse_bytes<UInt32>("1 B")->count(), UInt32{1});
    ASSERT_EQ(parse_bytes<Int64>("1 B")->count(), Int64{1});
    ASSERT_EQ(parse_bytes<UInt64>("1 B")->count(), UInt64{1});
    ASSERT_EQ(parse_bytes<Size>("1 B")->count(), Size{1});

    ASSERT_EQ(parse_bytes<Int16>("31 KiB")->count(), Int16{31744});
    ASSERT_ERROR(parse_bytes<Int16>("32 KiB"), ErrorCode::VALUE_OVERFLOW);
    ASSERT_ERROR(parse_bytes<Int8>("1 KiB"), ErrorCode::VALUE_OVERFLOW);
    ASSERT_ERROR(parse_bytes<UInt8>("256"), ErrorCode::INVALID_VALUE);
    ASSERT_EQ(parse_bytes<Int64>("7 EiB")->count(), Int64{7} << 60);
    ASSERT_ERROR(parse_bytes<Int64>("8 EiB"), ErrorCode::VALUE_OVERFLOW);
}

void test_make_and_compare() {
    auto one_gib = Bytes<>::make(1, Unit::GiByte);
    ASSERT_OK(one_gib);
    ASSERT_EQ(*one_gib, *parse_bytes("1 GiB"));
    ASSERT_LT(*parse_bytes("1 GB"), *one_gib);
    ASSERT_ERROR(Bytes<UInt32>::make(4, Unit::GiByte), ErrorCode::VALUE_OVERFLOW);
    ASSERT_EQ(Bytes<>().count(), 0u);
}

int main() {
    TestSuite suite("Byte Size Tests");

    suite.add_test("Unit Sizes", test_unit_sizes);
    suite.add_test("Unit Sizes (narrow types)", test_unit_sizes_narrow_types);
    suite.add_test("Unit Names", test_unit_names);
    suite.add_test("parse_unit", test_parse_unit);
    suite.add_test("Parse Binary Units", test_parse_plain_and_binary);
    suite.add_test("Parse Decimal Units", test_parse_decimal);
    suite.add_test("Parse Errors", test_parse_errors);
    suite.add_test("Integer Types", test_int_types);
    suite.add_test("make and compare", test_make_and_compare);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
