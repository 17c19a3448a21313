#pragma once
// =============================================================================
// Humanize - Fixed UTC Offsets (C++20)
// Version: 1.0.0
// Whole-hour offsets from -12:00 to +12:00; no timezone database
// =============================================================================

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"

namespace humanize::time {

inline constexpr Int32 SECS_PER_HOUR_OFFSET = 3600;
inline constexpr Int32 MIN_HOUR_OFFSET = -12;
inline constexpr Int32 MAX_HOUR_OFFSET = 12;

class FixedOffset {
private:
    Int32 seconds_ = 0;

    constexpr explicit FixedOffset(Int32 seconds) : seconds_(seconds) {}

public:
    // UTC
    constexpr FixedOffset() = default;

    [[nodiscard]] static constexpr FixedOffset utc() { return FixedOffset(); }

    // -12 <= hours <= 12, otherwise nullopt
    [[nodiscard]] static Optional<FixedOffset> from_hour_offset(Int32 hours);

    // Accepts exactly "", "Z", "+00:00", "-00:00" and "+HH:00"/"-HH:00" for
    // HH in 01..12. Anything else, "+05:30" included, is INVALID_VALUE.
    [[nodiscard]] static Result<FixedOffset> parse_zone_suffix(StringView text);

    // Seconds east of UTC
    [[nodiscard]] constexpr Int32 offset_seconds() const { return seconds_; }

    [[nodiscard]] constexpr bool operator==(const FixedOffset&) const = default;
};

} // namespace humanize::time
