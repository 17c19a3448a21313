#pragma once
// =============================================================================
// Humanize - Configuration File Parser
// Version: 1.0.0
// INI files with human-readable sizes, durations and timestamps
// =============================================================================

#include "humanize/common/types.hpp"
#include "humanize/common/error.hpp"
#include "humanize/bytes/bytes.hpp"
#include "humanize/duration/duration.hpp"
#include "humanize/time/time.hpp"
#include <map>

namespace humanize::config {

using ByteSize = bytes::Bytes<UInt64>;
using duration::TimeDuration;
using time::Time;

// =============================================================================
// Configuration Value
// =============================================================================

class ConfigValue {
private:
    String value_;

public:
    ConfigValue() = default;
    explicit ConfigValue(String value) : value_(std::move(value)) {}

    [[nodiscard]] const String& str() const { return value_; }
    [[nodiscard]] StringView view() const { return value_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }

    // Plain conversions
    [[nodiscard]] Result<Int64> to_int() const;
    [[nodiscard]] Result<UInt64> to_uint() const;
    [[nodiscard]] Result<bool> to_bool() const;

    // Human-readable conversions ("64 MiB", "1h 30m", "2018-09-21T16:56:44Z")
    [[nodiscard]] Result<ByteSize> to_bytes() const;
    [[nodiscard]] Result<TimeDuration> to_duration() const;
    [[nodiscard]] Result<Time> to_time() const;

    // With defaults
    [[nodiscard]] Int64 to_int_or(Int64 default_val) const;
    [[nodiscard]] UInt64 to_uint_or(UInt64 default_val) const;
    [[nodiscard]] bool to_bool_or(bool default_val) const;
    [[nodiscard]] String to_string_or(StringView default_val) const;
    [[nodiscard]] ByteSize to_bytes_or(ByteSize default_val) const;
    [[nodiscard]] TimeDuration to_duration_or(TimeDuration default_val) const;
    [[nodiscard]] Time to_time_or(Time default_val) const;

    // Comma-separated list, items trimmed, empty items dropped
    [[nodiscard]] Vector<String> to_list(char delimiter = ',') const;
};

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    String name_;
    std::map<String, ConfigValue, std::less<>> values_;

public:
    ConfigSection() = default;
    explicit ConfigSection(String name) : name_(std::move(name)) {}

    [[nodiscard]] const String& name() const { return name_; }

    // Value access
    [[nodiscard]] bool has(StringView key) const;
    [[nodiscard]] const ConfigValue& get(StringView key) const;

    // Typed access with defaults. A present but unreadable value falls back to
    // the default and logs a warning.
    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView key, bool default_val = false) const;
    [[nodiscard]] Vector<String> get_list(StringView key, char delimiter = ',') const;
    [[nodiscard]] ByteSize get_bytes(StringView key, ByteSize default_val = {}) const;
    [[nodiscard]] TimeDuration get_duration(StringView key, TimeDuration default_val = {}) const;
    [[nodiscard]] Time get_time(StringView key, Time default_val = Time::unix_epoch()) const;

    // Typed access that throws HumanizeException, with "section" and "key"
    // context, when the key is missing (CONFIG_KEY_NOT_FOUND) or the value
    // does not parse (the parser's error code)
    [[nodiscard]] ByteSize require_bytes(StringView key) const;
    [[nodiscard]] TimeDuration require_duration(StringView key) const;
    [[nodiscard]] Time require_time(StringView key) const;

    // Modification
    void set(StringView key, StringView value);
    void remove(StringView key);
    void clear();

    // Iteration
    [[nodiscard]] Vector<String> keys() const;
    [[nodiscard]] Size size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    Path filepath_;
    String default_section_name_ = "default";
    std::map<String, ConfigSection, std::less<>> sections_;

    void parse_line(StringView line, String& current_section);

public:
    ConfigFile() = default;

    // File operations
    [[nodiscard]] Result<void> load(const Path& path);
    void parse(StringView content);
    [[nodiscard]] Result<void> reload();

    [[nodiscard]] const Path& path() const { return filepath_; }
    [[nodiscard]] bool is_loaded() const { return !filepath_.empty(); }

    // Section access
    [[nodiscard]] bool has_section(StringView name) const;
    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    [[nodiscard]] ConfigSection& operator[](StringView name);
    [[nodiscard]] const ConfigSection& operator[](StringView name) const;

    // Keys outside any [section]
    [[nodiscard]] const ConfigSection& default_section() const;

    /**
     * @brief Value for section/key, honouring environment overrides
     *
     * HUMANIZE_<SECTION>_<KEY> (upper-cased, other characters mapped to '_')
     * wins over the file when set.
     */
    [[nodiscard]] Optional<ConfigValue> lookup(StringView section, StringView key) const;

    [[nodiscard]] bool has(StringView section, StringView key) const;
    [[nodiscard]] String get_string(StringView section, StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView section, StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView section, StringView key, bool default_val = false) const;
    [[nodiscard]] ByteSize get_bytes(StringView section, StringView key, ByteSize default_val = {}) const;
    [[nodiscard]] TimeDuration get_duration(StringView section, StringView key,
                                            TimeDuration default_val = {}) const;
    [[nodiscard]] Time get_time(StringView section, StringView key,
                                Time default_val = Time::unix_epoch()) const;

    // Modification
    void set(StringView section, StringView key, StringView value);
    ConfigSection& add_section(StringView name);
    void clear();

    [[nodiscard]] Vector<String> section_names() const;
    [[nodiscard]] Size section_count() const { return sections_.size(); }

    auto begin() const { return sections_.begin(); }
    auto end() const { return sections_.end(); }
};

// =============================================================================
// Environment Variable Support
// =============================================================================

[[nodiscard]] Optional<String> get_env(StringView name);
[[nodiscard]] String get_env_or(StringView name, StringView default_val);
[[nodiscard]] Result<void> set_env(StringView name, StringView value);
[[nodiscard]] Result<void> unset_env(StringView name);

// Replaces ${VAR} with its value; unset variables expand to nothing
[[nodiscard]] String expand_env(StringView str);

// "HUMANIZE_<SECTION>_<KEY>"
[[nodiscard]] String env_override_name(StringView section, StringView key);

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] Result<ConfigFile> load_config(const Path& path);
[[nodiscard]] Result<ConfigFile> parse_config(StringView content);

} // namespace humanize::config
