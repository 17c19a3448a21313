// =============================================================================
// Humanize - Byte Size Parsing Implementation
// Version: 1.0.0
// =============================================================================

#include <humanize/bytes/bytes.hpp>

namespace humanize::bytes {

namespace {

struct UnitName {
    StringView short_form;
    StringView long_form;
    Unit unit;
};

// Lowercase tokens accepted by parse_unit()
constexpr UnitName UNIT_NAMES[] = {
    {"",   "b",   Unit::Byte},
    {"ki", "kib", Unit::KiByte},
    {"mi", "mib", Unit::MiByte},
    {"gi", "gib", Unit::GiByte},
    {"ti", "tib", Unit::TiByte},
    {"pi", "pib", Unit::PiByte},
    {"ei", "eib", Unit::EiByte},
    {"k",  "kb",  Unit::KByte},
    {"m",  "mb",  Unit::MByte},
    {"g",  "gb",  Unit::GByte},
    {"t",  "tb",  Unit::TByte},
    {"p",  "pb",  Unit::PByte},
    {"e",  "eb",  Unit::EByte},
};

constexpr Size MAX_UNIT_LENGTH = 3;

} // anonymous namespace

StringView to_string(Unit unit) {
    switch (unit) {
        case Unit::Byte:   return "B";
        case Unit::KiByte: return "KiB";
        case Unit::MiByte: return "MiB";
        case Unit::GiByte: return "GiB";
        case Unit::TiByte: return "TiB";
        case Unit::PiByte: return "PiB";
        case Unit::EiByte: return "EiB";
        case Unit::KByte:  return "KB";
        case Unit::MByte:  return "MB";
        case Unit::GByte:  return "GB";
        case Unit::TByte:  return "TB";
        case Unit::PByte:  return "PB";
        case Unit::EByte:  return "EB";
    }
    return "?";
}

Result<Unit> parse_unit(StringView text) {
    StringView token = trim_view(text);
    if (token.size() > MAX_UNIT_LENGTH) return ErrorCode::INVALID_UNIT;

    char lowered[MAX_UNIT_LENGTH];
    for (Size i = 0; i < token.size(); ++i) lowered[i] = ascii_to_lower(token[i]);
    StringView key(lowered, token.size());

    for (const auto& name : UNIT_NAMES) {
        if (key == name.short_form || key == name.long_form) return name.unit;
    }
    return ErrorCode::INVALID_UNIT;
}

namespace detail {

Size find_unit_start(StringView text) noexcept {
    for (Size i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_ascii_alpha(c) || is_ascii_space(c) || static_cast<unsigned char>(c) >= 0x80) {
            return i;
        }
    }
    return text.size();
}

} // namespace detail

} // namespace humanize::bytes
