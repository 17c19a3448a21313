#pragma once
// =============================================================================
// Humanize - Byte Size Parsing (C++20)
// Version: 1.0.0
// Parses size literals such as "512", "4 KiB" or "10GB"
// =============================================================================

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"
#include "humanize/num/checked.hpp"
#include <charconv>

namespace humanize::bytes {

// =============================================================================
// Units
// =============================================================================

enum class Unit : UInt8 {
    Byte,

    // Powers of 1024
    KiByte,
    MiByte,
    GiByte,
    TiByte,
    PiByte,
    EiByte,

    // Powers of 1000
    KByte,
    MByte,
    GByte,
    TByte,
    PByte,
    EByte
};

// "B", "KiB", ... "EB"
[[nodiscard]] StringView to_string(Unit unit);

// Case-insensitive unit token: "", "b", "ki"/"kib" ... "e"/"eb".
// Leading and trailing whitespace is ignored.
[[nodiscard]] Result<Unit> parse_unit(StringView text);

// Multiplier of `unit` in T, or nullopt when it does not fit (KiByte in Int8)
template<Integral T>
[[nodiscard]] constexpr Optional<T> unit_size(Unit unit) noexcept {
    auto index = static_cast<UInt32>(unit);
    if (index == 0) return T{1};

    bool binary = unit <= Unit::EiByte;
    UInt32 exponent = binary ? index : index - static_cast<UInt32>(Unit::EiByte);
    auto base = num::checked_cast<T>(binary ? 1024 : 1000);
    if (!base) return nullopt;
    return num::checked_pow<T>(*base, exponent);
}

// =============================================================================
// Bytes
// =============================================================================

// A byte count held in integer type T
template<Integral T = UInt64>
class Bytes {
private:
    T count_ = 0;

    constexpr explicit Bytes(T count) : count_(count) {}

public:
    constexpr Bytes() = default;

    // value * unit; VALUE_OVERFLOW when the product (or the unit itself)
    // does not fit in T
    [[nodiscard]] static Result<Bytes> make(T value, Unit unit) {
        auto size = unit_size<T>(unit);
        if (!size) return ErrorCode::VALUE_OVERFLOW;
        auto product = num::checked_mul<T>(value, *size);
        if (!product) return ErrorCode::VALUE_OVERFLOW;
        return Bytes(*product);
    }

    [[nodiscard]] constexpr T count() const { return count_; }

    [[nodiscard]] constexpr auto operator<=>(const Bytes&) const = default;
};

// =============================================================================
// Parsing
// =============================================================================

namespace detail {

// Index of the first letter, non-ASCII byte or whitespace; size() if none
[[nodiscard]] Size find_unit_start(StringView text) noexcept;

} // namespace detail

// Parses "<digits>[whitespace][unit]".
//
// Errors, in the order they are checked:
//   EMPTY_INPUT     - blank input
//   MISSING_VALUE   - the text starts with the unit
//   INVALID_UNIT    - unknown unit token
//   INVALID_VALUE   - value is not all digits, or does not fit in T
//   VALUE_OVERFLOW  - value * unit does not fit in T
template<Integral T = UInt64>
[[nodiscard]] Result<Bytes<T>> parse_bytes(StringView text) {
    StringView input = trim_view(text);
    if (input.empty()) return ErrorCode::EMPTY_INPUT;

    Size split = detail::find_unit_start(input);
    if (split == 0) return ErrorCode::MISSING_VALUE;

    auto unit = parse_unit(input.substr(split));
    if (!unit) return unit.error();

    StringView digits = input.substr(0, split);
    for (char c : digits) {
        if (!is_ascii_digit(c)) return ErrorCode::INVALID_VALUE;
    }

    T value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return ErrorCode::INVALID_VALUE;
    }

    return Bytes<T>::make(value, *unit);
}

} // namespace humanize::bytes
