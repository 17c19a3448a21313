// =============================================================================
// Humanize - Parsing Example
// Version: 1.0.0
// Demonstrates: byte sizes, durations, RFC3339 timestamps, INI configuration
// =============================================================================

#include <iostream>
#include <string>

#include "humanize/bytes/bytes.hpp"
#include "humanize/duration/duration.hpp"
#include "humanize/time/rfc3339.hpp"
#include "humanize/config/config.hpp"
#include "humanize/common/logging.hpp"

using namespace humanize;

void demo_bytes() {
    std::cout << "\n=== Byte Sizes ===\n";

    for (const char* text : {"512", "4 KiB", "10GB", "1.5 MB", "100 EB"}) {
        auto size = bytes::parse_bytes(text);
        std::cout << pad_left(text, 8) << " -> ";
        if (size) {
            std::cout << size->count() << " bytes\n";
        } else {
            std::cout << error_name(size.error()) << "\n";
        }
    }

    // Narrow integer types fail instead of wrapping
    auto narrow = bytes::parse_bytes<Int16>("64 KiB");
    std::cout << "64 KiB as Int16 -> "
              << (narrow ? std::to_string(narrow->count()) : String(error_name(narrow.error()))) << "\n";
}

void demo_durations() {
    std::cout << "\n=== Durations ===\n";

    for (const char* text : {"250ms", "1h 30m", "1d12h", "90", "3 fortnights"}) {
        auto span = duration::parse_duration(text);
        std::cout << pad_left(text, 12) << " -> "
                  << (span ? span->to_string() : String(error_name(span.error()))) << "\n";
    }
}

void demo_timestamps() {
    std::cout << "\n=== RFC3339 Timestamps ===\n";

    for (const char* text : {"2006-01-02", "2018-09-21T16:56:44.234867232+08:00",
                             "2006-01-02T15:04:05+05:30", "2018-02-29T00:00:00Z"}) {
        auto instant = time::parse_rfc3339(text);
        std::cout << text << "\n    -> ";
        if (!instant) {
            std::cout << error_name(instant.error()) << "\n";
            continue;
        }
        auto since_epoch = instant->to_unix_instant();
        std::cout << (since_epoch ? since_epoch->to_string() : String("before 1970"))
                  << " since the Unix epoch\n";
    }

    // Programmatic construction from civil fields
    auto offset = time::FixedOffset::from_hour_offset(-5).value();
    auto new_year = time::Time::from_civil(1999, 12, 31, 19, 0, 0, 0, offset);
    auto y2k = time::parse_rfc3339("2000-01-01T00:00:00Z");
    if (new_year && y2k) {
        std::cout << "1999-12-31T19:00:00-05:00 == 2000-01-01T00:00:00Z: "
                  << (*new_year == *y2k ? "yes" : "no") << "\n";
    }
}

void demo_config() {
    std::cout << "\n=== Configuration ===\n";

    auto config = config::parse_config(R"(
[upload]
max_size = 64 MiB
timeout = 1m 30s
not_before = 2018-09-21T00:00:00Z
)");
    if (!config) return;

    const auto& upload = (*config)["upload"];
    std::cout << "max_size:   " << upload.get_bytes("max_size").count() << " bytes\n";
    std::cout << "timeout:    " << upload.get_duration("timeout").to_string() << "\n";
    std::cout << "not_before: " << upload.get_time("not_before").seconds() << " s since 0000-01-01\n";

    // HUMANIZE_UPLOAD_MAX_SIZE in the environment takes precedence
    std::cout << "(set " << config::env_override_name("upload", "max_size")
              << " to override max_size)\n";
    std::cout << "effective:  " << config->get_bytes("upload", "max_size").count() << " bytes\n";
}

int main() {
    logging::LogManager::instance().configure_default(logging::LogLevel::WARN);

    std::cout << "Humanize Parsing Example\n";
    std::cout << "========================\n";

    demo_bytes();
    demo_durations();
    demo_timestamps();
    demo_config();

    logging::LogManager::instance().shutdown();
    return 0;
}
