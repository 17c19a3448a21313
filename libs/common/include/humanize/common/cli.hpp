// =============================================================================
// Humanize - Command Line Argument Parser
// Version: 1.0.0
// =============================================================================

#pragma once

#include "humanize/common/error.hpp"
#include <map>
#include <charconv>
#include <iostream>
#include <iomanip>

namespace humanize::cli {

/**
 * @brief Command-line argument parser
 *
 * Supports:
 * - Long options (--name, --name=value)
 * - Short options (-n, -n value, -nvalue)
 * - Boolean flags
 * - Positional arguments
 * - "--" to end option processing
 * - Help generation
 */
class ArgParser {
public:
    struct Option {
        String long_name;
        char short_name = 0;
        String description;
        String default_value;
        bool is_flag = false;
        bool required = false;
    };

    explicit ArgParser(String program_name = "", String description = "")
        : program_name_(std::move(program_name)), description_(std::move(description)) {}

    ArgParser& add_option(const String& long_name,
                          char short_name = 0,
                          const String& description = "",
                          const String& default_value = "",
                          bool required = false) {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.default_value = default_value;
        opt.required = required;
        options_.push_back(opt);
        return *this;
    }

    ArgParser& add_flag(const String& long_name,
                        char short_name = 0,
                        const String& description = "") {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.is_flag = true;
        options_.push_back(opt);
        return *this;
    }

    ArgParser& add_positional(const String& name,
                              const String& description = "",
                              bool required = true) {
        positionals_.push_back({name, description, required});
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     *
     * Returns INVALID_ARGUMENT with error() set on bad input. A help request
     * also stops parsing; check help_requested() before reporting.
     */
    Result<void> parse(int argc, const char* const argv[]) {
        if (argc > 0 && program_name_.empty()) {
            program_name_ = argv[0];
        }

        for (const auto& opt : options_) {
            if (!opt.default_value.empty()) values_[opt.long_name] = opt.default_value;
            if (opt.is_flag) flags_[opt.long_name] = false;
        }

        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            String arg = argv[i];

            if (options_done || arg == "-" || !arg.starts_with("-")) {
                add_positional_value(std::move(arg));
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }
            if (arg == "-h" || arg == "--help") {
                help_requested_ = true;
                return fail("help requested");
            }

            if (arg.starts_with("--")) {
                String name;
                Optional<String> value;
                auto eq_pos = arg.find('=');
                if (eq_pos != String::npos) {
                    name = arg.substr(2, eq_pos - 2);
                    value = arg.substr(eq_pos + 1);
                } else {
                    name = arg.substr(2);
                }

                const Option* opt = find_option(name);
                if (!opt) return fail("Unknown option: --" + name);

                if (opt->is_flag) {
                    if (value) return fail("Flag --" + name + " does not take a value");
                    flags_[opt->long_name] = true;
                    continue;
                }
                if (!value) {
                    if (i + 1 >= argc) return fail("Option --" + name + " requires a value");
                    value = argv[++i];
                }
                values_[opt->long_name] = *value;
                continue;
            }

            // Short option cluster, e.g. -vc file
            for (Size j = 1; j < arg.size(); ++j) {
                const Option* opt = find_option(arg[j]);
                if (!opt) return fail(String("Unknown option: -") + arg[j]);

                if (opt->is_flag) {
                    flags_[opt->long_name] = true;
                    continue;
                }
                if (j + 1 < arg.size()) {
                    values_[opt->long_name] = arg.substr(j + 1);
                } else if (i + 1 < argc) {
                    values_[opt->long_name] = argv[++i];
                } else {
                    return fail(String("Option -") + arg[j] + " requires a value");
                }
                break;
            }
        }

        for (const auto& opt : options_) {
            if (opt.required && !values_.contains(opt.long_name)) {
                return fail("Required option missing: --" + opt.long_name);
            }
        }
        for (Size i = 0; i < positionals_.size(); ++i) {
            if (positionals_[i].required && i >= positional_values_.size()) {
                return fail("Required argument missing: " + positionals_[i].name);
            }
        }
        return make_success();
    }

    [[nodiscard]] Optional<String> get(const String& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) return it->second;
        return nullopt;
    }

    [[nodiscard]] String get(const String& name, const String& default_val) const {
        return get(name).value_or(default_val);
    }

    [[nodiscard]] Optional<Int64> get_int(const String& name) const {
        auto str = get(name);
        if (!str) return nullopt;
        Int64 value = 0;
        auto [ptr, ec] = std::from_chars(str->data(), str->data() + str->size(), value);
        if (ec != std::errc() || ptr != str->data() + str->size()) return nullopt;
        return value;
    }

    [[nodiscard]] bool flag(const String& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    [[nodiscard]] Optional<String> positional(Size index) const {
        if (index < positional_values_.size()) return positional_values_[index];
        return nullopt;
    }

    [[nodiscard]] const Vector<String>& positional_args() const { return positional_values_; }
    [[nodiscard]] const Vector<String>& extra_args() const { return extra_args_; }
    [[nodiscard]] const String& error() const { return error_; }
    [[nodiscard]] bool help_requested() const { return help_requested_; }

    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_;
        for (const auto& opt : options_) {
            if (opt.is_flag) {
                out << " [--" << opt.long_name << "]";
            } else if (opt.required) {
                out << " --" << opt.long_name << "=<value>";
            } else {
                out << " [--" << opt.long_name << "=<value>]";
            }
        }
        for (const auto& pos : positionals_) {
            out << (pos.required ? " <" : " [") << pos.name << (pos.required ? ">" : "]");
        }
        out << "\n\n";

        if (!description_.empty()) out << description_ << "\n\n";

        if (!options_.empty()) {
            out << "Options:\n";
            for (const auto& opt : options_) {
                out << "  ";
                if (opt.short_name) {
                    out << "-" << opt.short_name << ", ";
                } else {
                    out << "    ";
                }
                out << "--" << std::left << std::setw(20) << opt.long_name << opt.description;
                if (!opt.default_value.empty()) out << " [default: " << opt.default_value << "]";
                if (opt.required) out << " (required)";
                out << "\n";
            }
        }

        if (!positionals_.empty()) {
            out << "\nArguments:\n";
            for (const auto& pos : positionals_) {
                out << "  " << std::left << std::setw(22) << pos.name << pos.description;
                if (pos.required) out << " (required)";
                out << "\n";
            }
        }

        out << "\n  -h, --help                Show this help message\n";
    }

private:
    struct Positional {
        String name;
        String description;
        bool required = true;
    };

    Result<void> fail(String message) {
        error_ = std::move(message);
        return make_error<void>(ErrorCode::INVALID_ARGUMENT);
    }

    void add_positional_value(String value) {
        if (positional_values_.size() < positionals_.size()) {
            positional_values_.push_back(std::move(value));
        } else {
            extra_args_.push_back(std::move(value));
        }
    }

    [[nodiscard]] const Option* find_option(const String& name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    [[nodiscard]] const Option* find_option(char short_name) const {
        for (const auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    String program_name_;
    String description_;
    Vector<Option> options_;
    Vector<Positional> positionals_;

    std::map<String, String> values_;
    std::map<String, bool> flags_;
    Vector<String> positional_values_;
    Vector<String> extra_args_;
    String error_;
    bool help_requested_ = false;
};

} // namespace humanize::cli
