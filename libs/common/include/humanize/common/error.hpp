#pragma once
// =============================================================================
// Humanize - Error Handling (C++20)
// Version: 1.0.0
// =============================================================================

#include "humanize/common/types.hpp"
#include <system_error>
#include <stdexcept>
#include <source_location>

namespace humanize {

// =============================================================================
// Error Codes
// =============================================================================
enum class ErrorCode : Int32 {
    SUCCESS = 0,

    // Parse Errors (100-199) - the only codes the parsers return
    EMPTY_INPUT = 100,
    MISSING_VALUE = 101,
    INVALID_VALUE = 102,
    MISSING_UNIT = 103,
    INVALID_UNIT = 104,
    DUPLICATE_UNIT = 105,   // reserved, no parser emits it yet
    TOO_SHORT = 106,
    TOO_LONG = 107,
    MALFORMED = 108,
    INVALID_TIMEZONE = 109,
    VALUE_OVERFLOW = 110,   // Named to avoid the OVERFLOW macro from <math.h>

    // I/O Errors (1100-1199)
    IO_ERROR = 1100,
    FILE_NOT_FOUND = 1101,

    // Configuration Errors (1300-1399)
    INVALID_ARGUMENT = 1300,
    CONFIG_KEY_NOT_FOUND = 1301
};

// =============================================================================
// Error Category
// =============================================================================
class HumanizeErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override;
    [[nodiscard]] String message(int code) const override;
};

[[nodiscard]] const std::error_category& humanize_error_category() noexcept;
[[nodiscard]] std::error_code make_error_code(ErrorCode e) noexcept;

} // namespace humanize

namespace std {
    template<>
    struct is_error_code_enum<humanize::ErrorCode> : true_type {};
}

namespace humanize {

// =============================================================================
// ErrorInfo - Detailed error information
// =============================================================================
struct ErrorInfo {
    ErrorCode code = ErrorCode::SUCCESS;
    String message;
    String component;
    std::source_location location = std::source_location::current();
    std::unordered_map<String, String> context;

    ErrorInfo() = default;
    ErrorInfo(ErrorCode c, String msg, String comp = "",
              std::source_location loc = std::source_location::current());

    ErrorInfo& with_context(String key, String value);

    [[nodiscard]] String to_string() const;
    [[nodiscard]] String format_full() const;
};

// =============================================================================
// Result<T> - Monadic error handling
// =============================================================================
// The error side is a bare ErrorCode; callers that need the offending text
// keep their own copy of the input.
template<typename T>
class Result {
private:
    Variant<T, ErrorCode> data_;

public:
    Result(T value) : data_(std::move(value)) {}
    Result(ErrorCode error) : data_(error) {}

    [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_error() const { return std::holds_alternative<ErrorCode>(data_); }

    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] ErrorCode error() const { return std::get<ErrorCode>(data_); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T value_or(T default_val) const {
        return is_success() ? value() : std::move(default_val);
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const -> Result<decltype(f(std::declval<T>()))> {
        if (is_success()) return f(value());
        return error();
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> decltype(f(std::declval<T>())) {
        if (is_success()) return f(value());
        return error();
    }

    explicit operator bool() const { return is_success(); }
};

// Specialization for void
template<>
class Result<void> {
private:
    Optional<ErrorCode> error_;

public:
    Result() = default;
    Result(ErrorCode err) : error_(err) {}

    [[nodiscard]] bool is_success() const { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const { return error_.has_value(); }
    [[nodiscard]] ErrorCode error() const { return *error_; }

    explicit operator bool() const { return is_success(); }
};

// =============================================================================
// Result Factory Functions
// =============================================================================
template<typename T>
[[nodiscard]] Result<T> make_success(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> make_success() {
    return Result<void>();
}

template<typename T>
[[nodiscard]] Result<T> make_error(ErrorCode code) {
    return Result<T>(code);
}

// =============================================================================
// Exception
// =============================================================================
class HumanizeException : public std::runtime_error {
protected:
    ErrorInfo error_info_;

public:
    explicit HumanizeException(ErrorInfo info);
    HumanizeException(ErrorCode code, const String& message,
                      std::source_location loc = std::source_location::current());

    [[nodiscard]] ErrorCode code() const { return error_info_.code; }
    [[nodiscard]] const ErrorInfo& error_info() const { return error_info_; }
    [[nodiscard]] String detailed_message() const;
};

// =============================================================================
// Helper Functions
// =============================================================================
[[nodiscard]] bool is_parse_error(ErrorCode code);
[[nodiscard]] StringView error_name(ErrorCode code);
[[nodiscard]] StringView error_category_name(ErrorCode code);
[[nodiscard]] String format_error_code(ErrorCode code);

// =============================================================================
// Macros
// =============================================================================
#define HUMANIZE_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) return _result.error(); \
    } while(0)

#define HUMANIZE_THROW_IF_ERROR(expr, msg) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) throw humanize::HumanizeException(_result.error(), msg); \
    } while(0)

} // namespace humanize
