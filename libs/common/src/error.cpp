#include "humanize/common/error.hpp"
#include <sstream>
#include <format>

namespace humanize {

const char* HumanizeErrorCategory::name() const noexcept { return "humanize"; }

String HumanizeErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::EMPTY_INPUT: return "empty input";
        case ErrorCode::MISSING_VALUE: return "missing value";
        case ErrorCode::INVALID_VALUE: return "invalid value";
        case ErrorCode::MISSING_UNIT: return "missing unit";
        case ErrorCode::INVALID_UNIT: return "invalid unit";
        case ErrorCode::DUPLICATE_UNIT: return "duplicate unit";
        case ErrorCode::TOO_SHORT: return "input too short";
        case ErrorCode::TOO_LONG: return "input too long";
        case ErrorCode::MALFORMED: return "malformed input";
        case ErrorCode::INVALID_TIMEZONE: return "invalid timezone";
        case ErrorCode::VALUE_OVERFLOW: return "value overflow";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::CONFIG_KEY_NOT_FOUND: return "Configuration key not found";
    }
    return "Unknown humanize error";
}

const std::error_category& humanize_error_category() noexcept {
    static HumanizeErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), humanize_error_category()};
}

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp)), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context[std::move(key)] = std::move(value);
    return *this;
}

String ErrorInfo::to_string() const {
    return std::format("[{}] {}: {}", format_error_code(code),
        humanize_error_category().message(static_cast<int>(code)), message);
}

String ErrorInfo::format_full() const {
    std::ostringstream oss;
    oss << "Error: " << to_string() << "\n";
    oss << "  Component: " << (component.empty() ? "unknown" : component) << "\n";
    oss << "  Location: " << location.file_name() << ":" << location.line() << "\n";
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [k, v] : context) {
            oss << "    " << k << ": " << v << "\n";
        }
    }
    return oss.str();
}

HumanizeException::HumanizeException(ErrorInfo info)
    : std::runtime_error(info.to_string()), error_info_(std::move(info)) {}

HumanizeException::HumanizeException(ErrorCode code, const String& message, std::source_location loc)
    : std::runtime_error(message), error_info_(code, message, "", loc) {}

String HumanizeException::detailed_message() const {
    return error_info_.format_full();
}

bool is_parse_error(ErrorCode code) {
    int c = static_cast<int>(code);
    return c >= 100 && c < 200;
}

StringView error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::EMPTY_INPUT: return "EMPTY_INPUT";
        case ErrorCode::MISSING_VALUE: return "MISSING_VALUE";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::MISSING_UNIT: return "MISSING_UNIT";
        case ErrorCode::INVALID_UNIT: return "INVALID_UNIT";
        case ErrorCode::DUPLICATE_UNIT: return "DUPLICATE_UNIT";
        case ErrorCode::TOO_SHORT: return "TOO_SHORT";
        case ErrorCode::TOO_LONG: return "TOO_LONG";
        case ErrorCode::MALFORMED: return "MALFORMED";
        case ErrorCode::INVALID_TIMEZONE: return "INVALID_TIMEZONE";
        case ErrorCode::VALUE_OVERFLOW: return "VALUE_OVERFLOW";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::CONFIG_KEY_NOT_FOUND: return "CONFIG_KEY_NOT_FOUND";
    }
    return "UNKNOWN";
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c == 0) return "None";
    if (c >= 100 && c < 200) return "Parse";
    if (c >= 1100 && c < 1200) return "I/O";
    if (c >= 1300 && c < 1400) return "Config";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("HUM{:04d}", static_cast<int>(code));
}

} // namespace humanize
