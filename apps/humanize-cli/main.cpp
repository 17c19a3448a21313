// =============================================================================
// Humanize - Command Line Tool
// Version: 1.0.0
// Parses a byte size, duration or RFC3339 timestamp given on the command line
// or read from an INI file, and prints the normalised value
// =============================================================================

#include <iostream>
#include <string>
#include <format>

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"
#include "humanize/common/logging.hpp"
#include "humanize/common/cli.hpp"
#include "humanize/bytes/bytes.hpp"
#include "humanize/duration/duration.hpp"
#include "humanize/time/rfc3339.hpp"
#include "humanize/config/config.hpp"

using namespace humanize;

namespace {

// Each kind logs under the logger of the module that parses it
constexpr StringView KINDS[] = {logging::BYTES_LOGGER, logging::DURATION_LOGGER, logging::TIME_LOGGER};

void print_field(StringView label, StringView value) {
    std::cout << pad_left(label, 10) << ": " << value << "\n";
}

int report_failure(StringView kind, StringView text, ErrorCode code) {
    auto logger = logging::LogManager::instance().get_logger(String(kind));
    logger->log(logging::LogLevel::DBG, std::format("rejected \"{}\"", text), code);
    std::cerr << "error: cannot parse \"" << text << "\" as " << kind << ": "
              << error_name(code) << " (" << format_error_code(code) << ", "
              << make_error_code(code).message() << ")\n";
    return 1;
}

int show_bytes(StringView text) {
    auto parsed = bytes::parse_bytes(text);
    if (parsed.is_error()) return report_failure("bytes", text, parsed.error());

    print_field("input", text);
    print_field("bytes", std::to_string(parsed->count()));
    return 0;
}

int show_duration(StringView text) {
    auto parsed = duration::parse_duration(text);
    if (parsed.is_error()) return report_failure("duration", text, parsed.error());

    print_field("input", text);
    print_field("seconds", parsed->to_string());
    if (auto nanos = parsed->total_nanoseconds()) {
        print_field("nanos", std::to_string(*nanos));
    }
    return 0;
}

int show_time(StringView text) {
    auto parsed = time::parse_rfc3339(text);
    if (parsed.is_error()) return report_failure("time", text, parsed.error());

    print_field("input", text);
    if (auto since_epoch = parsed->to_unix_instant()) {
        print_field("unix", since_epoch->to_string());
    } else {
        auto before = time::Time::unix_epoch().since(*parsed);
        print_field("unix", "-" + (before ? before->to_string() : String("?")));
    }
    return 0;
}

int show(StringView kind, StringView text) {
    logging::LogManager::instance().get_logger(String(kind))->debug("parsing \"{}\"", text);
    if (kind == "bytes") return show_bytes(text);
    if (kind == "duration") return show_duration(text);
    return show_time(text);
}

bool is_known_kind(StringView kind) {
    for (auto k : KINDS) {
        if (k == kind) return true;
    }
    return false;
}

// Parses `key` of [section] as `kind`, or every key of the section when `key`
// is empty. Environment overrides apply.
int show_from_config(StringView kind, const Path& path, StringView section, StringView key) {
    auto logger = logging::LogManager::instance().get_logger(logging::CLI_LOGGER);

    auto config = config::load_config(path);
    if (config.is_error()) {
        logger->error("Cannot load {}: {}", path.string(), error_name(config.error()));
        return 1;
    }

    Vector<String> keys;
    if (key.empty()) {
        keys = config->section(section).keys();
    } else {
        keys.emplace_back(key);
    }
    if (keys.empty()) {
        logger->error("Section [{}] of {} is empty", section, path.string());
        return 1;
    }

    int status = 0;
    for (const auto& name : keys) {
        auto value = config->lookup(section, name);
        if (!value) {
            logger->error("No key [{}] {} in {}", section, name, path.string());
            status = 1;
            continue;
        }
        logger->debug("[{}] {} = \"{}\"", section, name, value->str());
        print_field("key", name);
        if (show(kind, value->str()) != 0) status = 1;
    }
    return status;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    cli::ArgParser args("humanize-cli", "Parse human-readable sizes, durations and timestamps");
    args.add_option("config", 'c', "INI file to read the value from")
        .add_option("section", 's', "Section of the INI file", "default")
        .add_option("log-file", 'l', "Also write log output to this file")
        .add_option("log-level", 0, "Console log level (trace..off)", "warn")
        .add_flag("verbose", 'v', "Log at debug level")
        .add_positional("kind", join({"bytes", "duration", "time"}, " | "))
        .add_positional("value", "Text to parse; with --config, a key (default: all keys)", false);

    if (args.parse(argc, argv).is_error()) {
        if (args.help_requested()) {
            args.show_help();
            return 0;
        }
        std::cerr << "error: " << args.error() << "\n\n";
        args.show_help(std::cerr);
        return 1;
    }

    auto level = logging::parse_log_level(args.get("log-level", "warn"));
    if (!level) {
        std::cerr << "error: unknown log level: " << args.get("log-level", "") << "\n";
        return 1;
    }
    if (args.flag("verbose")) level = logging::LogLevel::DBG;

    Optional<Path> log_file;
    if (auto file = args.get("log-file")) log_file = Path(*file);
    logging::LogManager::instance().configure_default(*level, log_file);

    String kind = to_lower(*args.positional(0));
    if (!is_known_kind(kind)) {
        std::cerr << "error: unknown kind \"" << kind << "\", expected one of: "
                  << join({"bytes", "duration", "time"}, ", ") << "\n";
        return 1;
    }

    auto value = args.positional(1);

    int status = 0;
    if (auto config_path = args.get("config")) {
        status = show_from_config(kind, *config_path, args.get("section", "default"),
                                  value.value_or(""));
    } else if (value) {
        status = show(kind, *value);
    } else {
        std::cerr << "error: missing value (or --config)\n";
        status = 1;
    }

    logging::LogManager::instance().shutdown();
    return status;
}
