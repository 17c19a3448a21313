#pragma once
// =============================================================================
// Humanize - Core Types (C++20)
// Version: 1.0.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <chrono>
#include <concepts>
#include <type_traits>
#include <filesystem>
#include <unordered_map>

namespace humanize {

// =============================================================================
// Fundamental Types
// =============================================================================
using Byte = std::uint8_t;
using Int8 = std::int8_t;
using UInt8 = std::uint8_t;
using Int16 = std::int16_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using UInt64 = std::uint64_t;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;

// =============================================================================
// Container Types
// =============================================================================
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using UniquePtr = std::unique_ptr<T>;
template<typename T> using SharedPtr = std::shared_ptr<T>;

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using Clock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SystemTimePoint = SystemClock::time_point;
using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// C++20 Concepts
// =============================================================================
template<typename T>
concept Integral = std::is_integral_v<T> && !std::is_same_v<T, bool>;

template<typename T>
concept SignedIntegral = Integral<T> && std::is_signed_v<T>;

template<typename T>
concept UnsignedIntegral = Integral<T> && std::is_unsigned_v<T>;

// =============================================================================
// ASCII Character Classes
// =============================================================================
// Locale-independent; bytes >= 0x80 are never digits, letters or spaces.
[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr char ascii_to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Non-allocating trim, used on the parsing hot paths
[[nodiscard]] constexpr StringView trim_view(StringView str) noexcept {
    Size start = 0;
    while (start < str.size() && is_ascii_space(str[start])) ++start;
    Size end = str.size();
    while (end > start && is_ascii_space(str[end - 1])) --end;
    return str.substr(start, end - start);
}

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String to_upper(StringView str);
[[nodiscard]] String to_lower(StringView str);
[[nodiscard]] String trim(StringView str);
[[nodiscard]] std::vector<String> split(StringView str, char delimiter);
[[nodiscard]] String join(const std::vector<String>& strings, StringView delimiter);
[[nodiscard]] String pad_left(StringView str, Size width, char pad = ' ');

} // namespace humanize
