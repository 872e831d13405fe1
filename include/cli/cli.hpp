#pragma once

#include "core/errors.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sem {

// ============================================================================
// Option Specifications
// ============================================================================

enum class OptionKind {
    TEXT,       // Free-form string
    INTEGER,    // Whole number within [min_value, max_value]
    NUMBER,     // Real number within [min_value, max_value]
    FLAG,       // Presence only
    CHOICE,     // One of a fixed set of names
    ID_LIST     // Comma-separated document ids
};

/**
 * @brief Declares one command-line option and the values it accepts
 *
 * Values are checked while the command line is parsed, so handlers only
 * ever see values that passed the kind and range checks.
 */
struct OptionSpec {
    std::string name;
    std::string short_name;
    std::string description;
    OptionKind kind = OptionKind::TEXT;
    std::string default_value;
    bool required = false;
    double min_value = 0.0;
    double max_value = 0.0;
    std::vector<std::string> choices;

    static OptionSpec text(const std::string& name, const std::string& short_name,
                           const std::string& description, bool required = false) {
        OptionSpec spec;
        spec.name = name;
        spec.short_name = short_name;
        spec.description = description;
        spec.required = required;
        return spec;
    }

    static OptionSpec integer(const std::string& name, const std::string& short_name,
                              const std::string& description, long long min_value, long long max_value,
                              const std::string& default_value = "") {
        OptionSpec spec = text(name, short_name, description);
        spec.kind = OptionKind::INTEGER;
        spec.min_value = static_cast<double>(min_value);
        spec.max_value = static_cast<double>(max_value);
        spec.default_value = default_value;
        return spec;
    }

    static OptionSpec number(const std::string& name, const std::string& short_name,
                             const std::string& description, double min_value, double max_value) {
        OptionSpec spec = text(name, short_name, description);
        spec.kind = OptionKind::NUMBER;
        spec.min_value = min_value;
        spec.max_value = max_value;
        return spec;
    }

    static OptionSpec flag(const std::string& name, const std::string& short_name,
                           const std::string& description) {
        OptionSpec spec = text(name, short_name, description);
        spec.kind = OptionKind::FLAG;
        return spec;
    }

    static OptionSpec choice(const std::string& name, const std::string& short_name,
                             const std::string& description, std::vector<std::string> choices,
                             const std::string& default_value) {
        OptionSpec spec = text(name, short_name, description);
        spec.kind = OptionKind::CHOICE;
        spec.choices = std::move(choices);
        spec.default_value = default_value;
        return spec;
    }

    static OptionSpec id_list(const std::string& name, const std::string& short_name,
                              const std::string& description) {
        OptionSpec spec = text(name, short_name, description);
        spec.kind = OptionKind::ID_LIST;
        return spec;
    }

    std::string value_hint() const {
        switch (kind) {
            case OptionKind::INTEGER: return "<int>";
            case OptionKind::NUMBER: return "<number>";
            case OptionKind::FLAG: return "";
            case OptionKind::ID_LIST: return "<id,id,...>";
            case OptionKind::CHOICE: {
                std::string hint = "<";
                for (size_t i = 0; i < choices.size(); ++i) {
                    if (i > 0) hint += "|";
                    hint += choices[i];
                }
                return hint + ">";
            }
            default: return "<value>";
        }
    }
};

// ============================================================================
// Value Conversion
// ============================================================================

inline long long parse_integer_option(const std::string& option, const std::string& value) {
    if (value.empty()) {
        throw ValidationError("--" + option + " expects an integer, got an empty value");
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) {
        throw ValidationError("--" + option + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

inline double parse_number_option(const std::string& option, const std::string& value) {
    if (value.empty()) {
        throw ValidationError("--" + option + " expects a number, got an empty value");
    }
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(value.c_str(), &end);
    if (*end != '\0' || errno == ERANGE || parsed != parsed) {
        throw ValidationError("--" + option + " expects a number, got '" + value + "'");
    }
    return parsed;
}

inline std::vector<std::string> split_id_list(const std::string& value) {
    std::vector<std::string> ids;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string id = value.substr(start, comma - start);
        if (!id.empty()) ids.push_back(id);
        start = comma + 1;
    }
    return ids;
}

/**
 * @brief Checks one raw value against its spec
 * @throws ValidationError naming the option when the value is rejected
 */
inline void check_option_value(const OptionSpec& spec, const std::string& value) {
    switch (spec.kind) {
        case OptionKind::INTEGER: {
            long long parsed = parse_integer_option(spec.name, value);
            if (parsed < spec.min_value || parsed > spec.max_value) {
                throw ValidationError("--" + spec.name + " must be between " +
                                      std::to_string(static_cast<long long>(spec.min_value)) + " and " +
                                      std::to_string(static_cast<long long>(spec.max_value)) +
                                      ", got " + value);
            }
            break;
        }
        case OptionKind::NUMBER: {
            double parsed = parse_number_option(spec.name, value);
            if (parsed < spec.min_value || parsed > spec.max_value) {
                throw ValidationError("--" + spec.name + " must be between " +
                                      std::to_string(spec.min_value) + " and " +
                                      std::to_string(spec.max_value) + ", got " + value);
            }
            break;
        }
        case OptionKind::CHOICE: {
            for (const auto& c : spec.choices) {
                if (c == value) return;
            }
            throw ValidationError("--" + spec.name + " must be one of " + spec.value_hint() +
                                  ", got '" + value + "'");
        }
        case OptionKind::ID_LIST:
            if (split_id_list(value).empty()) {
                throw ValidationError("--" + spec.name + " needs at least one document id");
            }
            break;
        default:
            break;
    }
}

// ============================================================================
// Parsed Options
// ============================================================================

/**
 * @brief Option values of one invocation, read back by kind
 *
 * Getters return nullopt (or an empty list) for options that were neither
 * given nor defaulted.
 */
class ParsedOptions {
public:
    void set(const std::string& name, const std::string& value) { values_[name] = value; }

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    bool flag(const std::string& name) const { return has(name); }

    std::optional<std::string> text(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<int> integer(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return std::nullopt;
        long long parsed = parse_integer_option(name, it->second);
        if (parsed < INT_MIN || parsed > INT_MAX) {
            throw ValidationError("--" + name + " is out of range: " + it->second);
        }
        return static_cast<int>(parsed);
    }

    std::optional<double> number(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return std::nullopt;
        return parse_number_option(name, it->second);
    }

    std::vector<std::string> id_list(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) return {};
        return split_id_list(it->second);
    }

    std::string require(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw ValidationError("Missing required option: --" + name);
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> values_;
};

// ============================================================================
// Commands
// ============================================================================

struct CommandSpec {
    std::string name;
    std::string description;
    std::vector<OptionSpec> options;
    std::function<int(const ParsedOptions&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& opt : options) {
            if (opt.required) std::cout << " --" << opt.name << " " << opt.value_hint();
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";
        for (const auto& opt : options) {
            std::cout << "  --" << opt.name;
            if (!opt.short_name.empty()) std::cout << ", -" << opt.short_name;
            if (opt.kind != OptionKind::FLAG) std::cout << " " << opt.value_hint();
            std::cout << "\n      " << opt.description;
            if (opt.kind == OptionKind::INTEGER) {
                std::cout << " [" << static_cast<long long>(opt.min_value) << ".."
                          << static_cast<long long>(opt.max_value) << "]";
            }
            if (!opt.default_value.empty()) std::cout << " (default: " << opt.default_value << ")";
            if (opt.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Parses the tokens after the command name
 *
 * Accepts --name value, --name=value and -s value forms. Defaults are applied
 * after parsing and every value is checked against its spec.
 *
 * @throws ValidationError on unknown options, missing values, missing
 *         required options and values rejected by check_option_value
 */
inline ParsedOptions parse_options(const std::vector<std::string>& tokens, const CommandSpec& command) {
    std::map<std::string, const OptionSpec*> by_name;
    std::map<std::string, const OptionSpec*> by_short;
    for (const auto& opt : command.options) {
        by_name["--" + opt.name] = &opt;
        if (!opt.short_name.empty()) by_short["-" + opt.short_name] = &opt;
    }

    ParsedOptions parsed;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        const OptionSpec* spec = nullptr;
        std::optional<std::string> inline_value;

        if (token.rfind("--", 0) == 0) {
            auto eq = token.find('=');
            auto it = by_name.find(token.substr(0, eq));
            if (it != by_name.end()) spec = it->second;
            if (eq != std::string::npos) inline_value = token.substr(eq + 1);
        } else if (token.size() == 2 && token[0] == '-') {
            auto it = by_short.find(token);
            if (it != by_short.end()) spec = it->second;
        } else {
            throw ValidationError("Unexpected argument: " + token);
        }

        if (!spec) {
            throw ValidationError("Unknown option for '" + command.name + "': " + token);
        }

        if (spec->kind == OptionKind::FLAG) {
            if (inline_value) {
                throw ValidationError("--" + spec->name + " does not take a value");
            }
            parsed.set(spec->name, "true");
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < tokens.size()) {
            value = tokens[++i];
        } else {
            throw ValidationError("--" + spec->name + " requires a value");
        }

        check_option_value(*spec, value);
        parsed.set(spec->name, value);
    }

    for (const auto& opt : command.options) {
        if (parsed.has(opt.name)) continue;
        if (opt.required) {
            throw ValidationError("Missing required option: --" + opt.name);
        }
        if (!opt.default_value.empty()) parsed.set(opt.name, opt.default_value);
    }

    return parsed;
}

/**
 * @brief Process exit status for a failed command
 *
 * 1 is reserved for failures outside the engine error taxonomy.
 */
inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return 2;
        case ErrorKind::NotFound: return 3;
        case ErrorKind::DimensionMismatch: return 4;
        case ErrorKind::ExternalService: return 5;
        case ErrorKind::Internal: return 6;
        default: return 6;
    }
}

// ============================================================================
// CLI
// ============================================================================

class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(CommandSpec command) {
        commands_[command.name] = std::move(command);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string name = argv[1];
        if (name == "--help" || name == "-h") {
            print_help();
            return 0;
        }
        if (name == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const CommandSpec& command = it->second;

        std::vector<std::string> tokens(argv + 2, argv + argc);
        for (const auto& token : tokens) {
            if (token == "--help" || token == "-h") {
                command.print_help(program_name_);
                return 0;
            }
        }

        ParsedOptions options;
        try {
            options = parse_options(tokens, command);
        } catch (const ValidationError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            command.print_help(program_name_);
            return exit_code_for(e.kind());
        }

        try {
            return command.handler(options);
        } catch (const EngineError& e) {
            std::cerr << "Error [" << error_kind_to_string(e.kind()) << "]: " << e.what() << "\n";
            return exit_code_for(e.kind());
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - embedding analytics for document corpora\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, command] : commands_) {
            std::cout << "  " << name;
            for (size_t i = name.length(); i < 12; ++i) std::cout << " ";
            std::cout << command.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, CommandSpec> commands_;
};

} // namespace sem
