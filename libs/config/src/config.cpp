// =============================================================================
// Humanize - Configuration File Parser Implementation
// Version: 1.0.0
// =============================================================================

#include <humanize/config/config.hpp>
#include <humanize/common/logging.hpp>
#include <humanize/time/rfc3339.hpp>
#include <fstream>
#include <sstream>
#include <charconv>
#include <algorithm>
#include <cstdlib>

namespace humanize::config {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

SharedPtr<logging::Logger> config_logger() {
    return logging::LogManager::instance().get_logger(logging::CONFIG_LOGGER);
}

bool is_true_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

bool is_false_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "false" || lower == "no" || lower == "off" || lower == "0";
}

template<typename T>
Result<T> parse_integer(StringView text) {
    if (text.empty()) return ErrorCode::EMPTY_INPUT;
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) return ErrorCode::VALUE_OVERFLOW;
    if (ec != std::errc() || ptr != text.data() + text.size()) return ErrorCode::INVALID_VALUE;
    return value;
}

// Falls back to `default_val` when the value is present but unreadable
template<typename T>
T typed_or_default(const ConfigSection& section, StringView key, StringView kind,
                   const Result<T>& parsed, T default_val) {
    if (parsed.is_success()) return parsed.value();
    if (section.has(key)) {
        config_logger()->rejected(parsed.error(), "[{}] {}: cannot read \"{}\" as {}, using default",
            section.name(), key, section.get(key).str(), kind);
    }
    return default_val;
}

template<typename T>
T typed_or_throw(const ConfigSection& section, StringView key, const Result<T>& parsed) {
    if (parsed.is_success()) return parsed.value();

    ErrorCode code = section.has(key) ? parsed.error() : ErrorCode::CONFIG_KEY_NOT_FOUND;
    String message = section.has(key)
        ? "Cannot parse value \"" + section.get(key).str() + "\""
        : "Missing required key";
    ErrorInfo info(code, std::move(message), "config");
    info.with_context("section", section.name()).with_context("key", String(key));
    throw HumanizeException(std::move(info));
}

void strip_quotes(String& value) {
    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
}

} // anonymous namespace

// =============================================================================
// ConfigValue Implementation
// =============================================================================

Result<Int64> ConfigValue::to_int() const {
    return parse_integer<Int64>(trim_view(value_));
}

Result<UInt64> ConfigValue::to_uint() const {
    return parse_integer<UInt64>(trim_view(value_));
}

Result<bool> ConfigValue::to_bool() const {
    if (is_true_value(value_)) return true;
    if (is_false_value(value_)) return false;
    return ErrorCode::INVALID_VALUE;
}

Result<ByteSize> ConfigValue::to_bytes() const {
    return bytes::parse_bytes<UInt64>(value_);
}

Result<TimeDuration> ConfigValue::to_duration() const {
    return duration::parse_duration(value_);
}

Result<Time> ConfigValue::to_time() const {
    return time::parse_rfc3339(value_);
}

Int64 ConfigValue::to_int_or(Int64 default_val) const {
    return to_int().value_or(default_val);
}

UInt64 ConfigValue::to_uint_or(UInt64 default_val) const {
    return to_uint().value_or(default_val);
}

bool ConfigValue::to_bool_or(bool default_val) const {
    return to_bool().value_or(default_val);
}

String ConfigValue::to_string_or(StringView default_val) const {
    return value_.empty() ? String(default_val) : value_;
}

ByteSize ConfigValue::to_bytes_or(ByteSize default_val) const {
    return to_bytes().value_or(default_val);
}

TimeDuration ConfigValue::to_duration_or(TimeDuration default_val) const {
    return to_duration().value_or(default_val);
}

Time ConfigValue::to_time_or(Time default_val) const {
    return to_time().value_or(default_val);
}

Vector<String> ConfigValue::to_list(char delimiter) const {
    Vector<String> result;
    for (auto& item : split(value_, delimiter)) {
        String trimmed = trim(item);
        if (!trimmed.empty()) result.push_back(std::move(trimmed));
    }
    return result;
}

// =============================================================================
// ConfigSection Implementation
// =============================================================================

static const ConfigValue EMPTY_VALUE;

bool ConfigSection::has(StringView key) const {
    return values_.find(key) != values_.end();
}

const ConfigValue& ConfigSection::get(StringView key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : EMPTY_VALUE;
}

String ConfigSection::get_string(StringView key, StringView default_val) const {
    return get(key).to_string_or(default_val);
}

Int64 ConfigSection::get_int(StringView key, Int64 default_val) const {
    return typed_or_default(*this, key, "integer", get(key).to_int(), default_val);
}

bool ConfigSection::get_bool(StringView key, bool default_val) const {
    return typed_or_default(*this, key, "boolean", get(key).to_bool(), default_val);
}

Vector<String> ConfigSection::get_list(StringView key, char delimiter) const {
    return get(key).to_list(delimiter);
}

ByteSize ConfigSection::get_bytes(StringView key, ByteSize default_val) const {
    return typed_or_default(*this, key, "byte size", get(key).to_bytes(), default_val);
}

TimeDuration ConfigSection::get_duration(StringView key, TimeDuration default_val) const {
    return typed_or_default(*this, key, "duration", get(key).to_duration(), default_val);
}

Time ConfigSection::get_time(StringView key, Time default_val) const {
    return typed_or_default(*this, key, "timestamp", get(key).to_time(), default_val);
}

ByteSize ConfigSection::require_bytes(StringView key) const {
    return typed_or_throw(*this, key, get(key).to_bytes());
}

TimeDuration ConfigSection::require_duration(StringView key) const {
    return typed_or_throw(*this, key, get(key).to_duration());
}

Time ConfigSection::require_time(StringView key) const {
    return typed_or_throw(*this, key, get(key).to_time());
}

void ConfigSection::set(StringView key, StringView value) {
    values_.insert_or_assign(String(key), ConfigValue(String(value)));
}

void ConfigSection::remove(StringView key) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        values_.erase(it);
    }
}

void ConfigSection::clear() {
    values_.clear();
}

Vector<String> ConfigSection::keys() const {
    Vector<String> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigFile Implementation
// =============================================================================

void ConfigFile::parse_line(StringView line, String& current_section) {
    String trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return;
    }

    // [section]
    if (trimmed[0] == '[' && trimmed.back() == ']') {
        current_section = trim(StringView(trimmed).substr(1, trimmed.size() - 2));
        if (!has_section(current_section)) {
            add_section(current_section);
        }
        return;
    }

    // key = value or key: value; timestamps contain ':' so the first
    // separator wins
    Size sep_pos = std::min(trimmed.find('='), trimmed.find(':'));
    if (sep_pos == String::npos) {
        config_logger()->debug("Ignoring line without separator: {}", trimmed);
        return;
    }

    String key = trim(StringView(trimmed).substr(0, sep_pos));
    String value = trim(StringView(trimmed).substr(sep_pos + 1));
    strip_quotes(value);

    section(current_section).set(key, expand_env(value));
}

void ConfigFile::parse(StringView content) {
    sections_.clear();
    String current_section = default_section_name_;
    add_section(current_section);

    for (const auto& line : split(content, '\n')) {
        parse_line(line, current_section);
    }
}

Result<void> ConfigFile::load(const Path& path) {
    std::ifstream file(path);
    if (!file) {
        config_logger()->error("Cannot open config file: {}", path.string());
        return make_error<void>(ErrorCode::FILE_NOT_FOUND);
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        config_logger()->error("Cannot read config file: {}", path.string());
        return make_error<void>(ErrorCode::IO_ERROR);
    }

    filepath_ = path;
    parse(content.str());

    config_logger()->info("Loaded {} ({} sections)", path.string(), sections_.size());
    return make_success();
}

Result<void> ConfigFile::reload() {
    if (filepath_.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT);
    }
    return load(filepath_);
}

bool ConfigFile::has_section(StringView name) const {
    return sections_.find(name) != sections_.end();
}

static const ConfigSection EMPTY_SECTION;

ConfigSection& ConfigFile::section(StringView name) {
    auto it = sections_.find(name);
    if (it == sections_.end()) {
        return add_section(name);
    }
    return it->second;
}

const ConfigSection& ConfigFile::section(StringView name) const {
    auto it = sections_.find(name);
    return it != sections_.end() ? it->second : EMPTY_SECTION;
}

ConfigSection& ConfigFile::operator[](StringView name) {
    return section(name);
}

const ConfigSection& ConfigFile::operator[](StringView name) const {
    return section(name);
}

const ConfigSection& ConfigFile::default_section() const {
    return section(default_section_name_);
}

Optional<ConfigValue> ConfigFile::lookup(StringView section_name, StringView key) const {
    if (auto env = get_env(env_override_name(section_name, key))) {
        return ConfigValue(std::move(*env));
    }
    const auto& sec = section(section_name);
    if (!sec.has(key)) return nullopt;
    return sec.get(key);
}

bool ConfigFile::has(StringView section_name, StringView key) const {
    return lookup(section_name, key).has_value();
}

String ConfigFile::get_string(StringView section_name, StringView key, StringView default_val) const {
    auto value = lookup(section_name, key);
    return value ? value->to_string_or(default_val) : String(default_val);
}

Int64 ConfigFile::get_int(StringView section_name, StringView key, Int64 default_val) const {
    auto value = lookup(section_name, key);
    return value ? value->to_int_or(default_val) : default_val;
}

bool ConfigFile::get_bool(StringView section_name, StringView key, bool default_val) const {
    auto value = lookup(section_name, key);
    return value ? value->to_bool_or(default_val) : default_val;
}

ByteSize ConfigFile::get_bytes(StringView section_name, StringView key, ByteSize default_val) const {
    auto value = lookup(section_name, key);
    return value ? value->to_bytes_or(default_val) : default_val;
}

TimeDuration ConfigFile::get_duration(StringView section_name, StringView key,
                                      TimeDuration default_val) const {
    auto value = lookup(section_name, key);
    return value ? value->to_duration_or(default_val) : default_val;
}

Time ConfigFile::get_time(StringView section_name, StringView key, Time default_val) const {
    auto value = lookup(section_name, key);
    return value ? value->to_time_or(default_val) : default_val;
}

void ConfigFile::set(StringView section_name, StringView key, StringView value) {
    section(section_name).set(key, value);
}

ConfigSection& ConfigFile::add_section(StringView name) {
    auto [it, _] = sections_.emplace(String(name), ConfigSection(String(name)));
    return it->second;
}

void ConfigFile::clear() {
    sections_.clear();
}

Vector<String> ConfigFile::section_names() const {
    Vector<String> result;
    result.reserve(sections_.size());
    for (const auto& [name, _] : sections_) {
        result.push_back(name);
    }
    return result;
}

// =============================================================================
// Environment Variable Support
// =============================================================================

Optional<String> get_env(StringView name) {
    const char* value = std::getenv(String(name).c_str());
    if (value) {
        return String(value);
    }
    return nullopt;
}

String get_env_or(StringView name, StringView default_val) {
    return get_env(name).value_or(String(default_val));
}

Result<void> set_env(StringView name, StringView value) {
#ifdef _WIN32
    if (_putenv_s(String(name).c_str(), String(value).c_str()) != 0) {
        return make_error<void>(ErrorCode::IO_ERROR);
    }
#else
    if (setenv(String(name).c_str(), String(value).c_str(), 1) != 0) {
        return make_error<void>(ErrorCode::IO_ERROR);
    }
#endif
    return make_success();
}

Result<void> unset_env(StringView name) {
#ifdef _WIN32
    if (_putenv_s(String(name).c_str(), "") != 0) {
        return make_error<void>(ErrorCode::IO_ERROR);
    }
#else
    if (unsetenv(String(name).c_str()) != 0) {
        return make_error<void>(ErrorCode::IO_ERROR);
    }
#endif
    return make_success();
}

String expand_env(StringView str) {
    String result;
    result.reserve(str.size());

    for (Size i = 0; i < str.size(); ++i) {
        if (str[i] == '$' && i + 1 < str.size() && str[i + 1] == '{') {
            Size end = str.find('}', i + 2);
            if (end != StringView::npos) {
                if (auto value = get_env(str.substr(i + 2, end - i - 2))) {
                    result += *value;
                }
                i = end;
                continue;
            }
        }
        result += str[i];
    }

    return result;
}

String env_override_name(StringView section, StringView key) {
    String name = "HUMANIZE_";
    auto append = [&name](StringView part) {
        for (char c : part) {
            name += (is_ascii_alpha(c) || is_ascii_digit(c)) ? c : '_';
        }
    };
    append(section);
    name += '_';
    append(key);
    return to_upper(name);
}

// =============================================================================
// Factory Functions
// =============================================================================

Result<ConfigFile> load_config(const Path& path) {
    ConfigFile config;
    HUMANIZE_TRY(config.load(path));
    return config;
}

Result<ConfigFile> parse_config(StringView content) {
    ConfigFile config;
    config.parse(content);
    return config;
}

} // namespace humanize::config
