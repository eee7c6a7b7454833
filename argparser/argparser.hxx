#pragma once

/**
 * @file argparser.hxx
 * @brief Command-line parser with subcommands, repeatable options and TOML config support
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Command line
 * ------------
 *   program <command> [--name value]... [--flag]... [--config file.toml]
 *
 * The first bare token selects one of the commands registered with
 * add_command(). Options of type std::vector<std::string> may be repeated;
 * each occurrence appends one value. Values are taken verbatim, so a value
 * may itself start with '-' (e.g. `--op -Spirit_Bomb`).
 *
 * TOML config support
 * -------------------
 * Pass --config <path/to/file.toml> to load option values from a file.
 *
 * Precedence (lowest → highest):
 *   1. Defaults registered with .default_val()
 *   2. Values from the TOML config file
 *   3. Values from the command line
 *
 * Only flat `key = value` lines (and an optional, ignored table header) are
 * understood. Inline comments after a value are allowed:
 *
 *   [talentcode]            # header is skipped
 *   catalog = "data/catalog.json"
 *   primary-budget = 34
 *   no-color = true
 *   op = ["+Felblade", "-Imprison"]
 *
 * Supported value literals
 *   int    : decimal integer, optionally signed
 *   bool   : true / false
 *   string : double- or single-quoted string
 *   path   : quoted string for an option whose type is fs::path
 *   list   : [ "a", "b" ] for an option whose type is std::vector<std::string>
 */

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>
#include <vector>

namespace talentcode::cli {

namespace fs = std::filesystem;

using StringList = std::vector<std::string>;

// Supported value types
using Value = std::variant<int, bool, std::string, fs::path, StringList>;

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Argument descriptor ────────────────────────────────────────────────────

struct Arg {
    std::string name;    // long name, e.g. "catalog"
    char shortName = 0;  // short name, e.g. 'c'  (0 = none)
    std::string help;    // description shown in --help
    bool required = false;

    std::type_index type{typeid(void)};

    std::optional<Value> defaultValue;
    std::optional<int> minValue;  // inclusive, int only
    std::optional<int> maxValue;  // inclusive, int only
    std::vector<Value> choices;   // allowed values

    // ── fluent builders ────────────────────────────────────────────────
    auto shorthand(char short_name) -> Arg& {
        shortName = short_name;
        return *this;
    }

    auto description(std::string_view description) -> Arg& {
        help = description;
        return *this;
    }

    auto require() -> Arg& {
        required = true;
        return *this;
    }

    template <typename T>
    auto default_val(T value) -> Arg& {
        defaultValue = normalize_and_store(value);
        return *this;
    }

    auto min(int value) -> Arg& {
        expect_type(typeid(int), "min()");
        minValue = value;
        return *this;
    }

    auto max(int value) -> Arg& {
        expect_type(typeid(int), "max()");
        maxValue = value;
        return *this;
    }

    template <typename T>
    auto allow(std::initializer_list<T> list) -> Arg& {
        for (auto v : list) {
            choices.emplace_back(normalize_and_store(v));
        }
        return *this;
    }

    template <typename T>
    auto normalize_and_store(T value) -> Value {
        if constexpr (std::is_same_v<T, bool>) {
            expect_type(typeid(bool), "bool value");
            return Value{value};
        } else if constexpr (std::is_same_v<T, fs::path>) {
            expect_type(typeid(fs::path), "path value");
            return Value{value};
        } else if constexpr (std::is_same_v<T, StringList>) {
            expect_type(typeid(StringList), "list value");
            return Value{value};
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            expect_type(typeid(std::string), "string value");
            return Value{std::string{value}};
        } else if constexpr (std::is_integral_v<T>) {
            expect_type(typeid(int), "int value");
            return Value{static_cast<int>(value)};
        } else {
            throw ParseError("unsupported type for --" + name);
        }
    }

   private:
    void expect_type(std::type_index wanted, const char* what) const {
        if (type != wanted) {
            throw ParseError("type mismatch for --" + name + ": " + what);
        }
    }
};

// ── Parser ─────────────────────────────────────────────────────────────────

class ArgParser {
   public:
    explicit ArgParser(std::string programName, std::string description = "")
        : programName_(std::move(programName)), description_(std::move(description)) {}

    /// Register a subcommand; the first bare token must name one of them.
    auto add_command(std::string name, std::string help) -> ArgParser& {
        commands_.emplace_back(std::move(name), std::move(help));
        return *this;
    }

    // Register a new argument and return a reference for chaining
    template <typename T>
    auto add(std::string name) -> Arg& {
        if (find_arg(name) != nullptr) {
            throw ParseError("duplicate argument registration: --" + name);
        }
        args_.push_back(Arg{.name = std::move(name), .type = typeid(T)});
        return args_.back();
    }

    // ── parse ──────────────────────────────────────────────────────────
    //
    // Precedence: defaults < TOML config < CLI flags.
    // --config <file> is consumed before the second pass so it is never
    // forwarded to the normal argument matching logic.

    void parse(int argc, char* argv[]) {
        std::vector<std::string> tokens;
        for (int i = 1; i < argc; ++i) {
            tokens.emplace_back(argv[i]);
        }
        parse(tokens);
    }

    void parse(const std::vector<std::string>& tokens) {
        // 1. Seed defaults
        for (auto& arg : args_) {
            if (arg.defaultValue) {
                parsed_[arg.name] = *arg.defaultValue;
            }
        }

        // 2. First pass: find --config and load TOML
        std::vector<std::string> remaining;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (tokens[i] == "--config" || tokens[i] == "-C") {
                if (i + 1 >= tokens.size()) {
                    throw ParseError("--config requires a file path");
                }
                load_toml(tokens[++i]);
            } else {
                remaining.push_back(tokens[i]);
            }
        }

        // 3. Second pass: apply CLI flags (override TOML values)
        parse_cli_arguments(remaining);
        if (helpRequested_) {
            return;
        }

        // 4. Check command and required arguments
        if (!commands_.empty() && command_.empty()) {
            throw ParseError("missing command");
        }
        for (auto& arg : args_) {
            if (arg.required && !parsed_.contains(arg.name)) {
                throw ParseError("required argument missing: --" + arg.name);
            }
        }
    }

    // ── accessors ──────────────────────────────────────────────────────

    [[nodiscard]] auto help_requested() const -> bool { return helpRequested_; }

    [[nodiscard]] auto command() const -> const std::string& { return command_; }

    [[nodiscard]] auto has(const std::string& name) const -> bool { return parsed_.contains(name); }

    template <typename T>
    auto get(const std::string& name) const -> T {
        auto value_it = parsed_.find(name);
        if (value_it == parsed_.end()) {
            throw ParseError("argument not found: " + name);
        }

        const Arg* arg = find_arg(name);
        if (arg == nullptr) {
            throw ParseError("internal error: argument '" + name + "' not registered");
        }
        if (arg->type != typeid(T)) {
            throw ParseError("type mismatch for --" + name + " (expected " + type_to_string(arg->type) + ", requested by get() " +
                             type_to_string(typeid(T)) + ")");
        }
        return std::get<T>(value_it->second);
    }

    /// Value of an optional argument, or nullopt when neither config nor CLI set it.
    template <typename T>
    auto get_optional(const std::string& name) const -> std::optional<T> {
        if (!has(name)) {
            return std::nullopt;
        }
        return get<T>(name);
    }

    // ── help ───────────────────────────────────────────────────────────

    void print_help(std::ostream& out = std::cout) const {
        constexpr std::size_t HELP_COLUMN_WIDTH = 26;
        out << "Usage: " << programName_ << (commands_.empty() ? "" : " <command>") << " [options]\n";
        if (!description_.empty()) {
            out << description_ << "\n";
        }
        if (!commands_.empty()) {
            out << "\nCommands:\n";
            for (const auto& [name, help] : commands_) {
                out << pad("  " + name, HELP_COLUMN_WIDTH) << help << '\n';
            }
        }
        out << "\nOptions:\n";
        out << pad("  -h, --help", HELP_COLUMN_WIDTH) << "Show this help message\n";
        out << pad("  -C, --config <file>", HELP_COLUMN_WIDTH) << "Load option values from a TOML file\n";

        for (const auto& arg : args_) {
            std::string left = "  --" + arg.name;
            if (arg.shortName != 0) {
                left += std::string(", -") + arg.shortName;
            }
            if (arg.type != typeid(bool)) {
                left += " <" + type_to_string(arg.type) + ">";
            }
            out << pad(left, HELP_COLUMN_WIDTH) << arg.help;

            if (arg.defaultValue) {
                out << " [default: " << value_to_string(*arg.defaultValue) << "]";
            }
            if (arg.minValue && arg.maxValue) {
                out << " [range: " << *arg.minValue << ".." << *arg.maxValue << "]";
            }
            if (!arg.choices.empty()) {
                out << " [choices: ";
                for (std::size_t i = 0; i < arg.choices.size(); ++i) {
                    out << (i != 0U ? "|" : "") << value_to_string(arg.choices[i]);
                }
                out << ']';
            }
            if (arg.type == typeid(StringList)) {
                out << " (repeatable)";
            }
            if (arg.required) {
                out << " (required)";
            }
            out << '\n';
        }
    }

   private:
    // ── CLI argument processor ─────────────────────────────────────────

    void parse_cli_arguments(const std::vector<std::string>& remaining) {
        std::set<std::string> seenCli;
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            const auto& tok = remaining[i];

            if (tok == "--help" || tok == "-h") {
                helpRequested_ = true;
                return;
            }

            std::string key;
            if (tok.starts_with("--")) {
                key = tok.substr(2);
            } else if (tok.starts_with("-") && tok.size() == 2) {
                key = expand_short(tok[1]);
            } else if (!commands_.empty() && command_.empty()) {
                select_command(tok);
                continue;
            } else {
                throw ParseError("unexpected token: " + tok);
            }

            Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError("unknown argument: --" + key);
            }

            const bool repeatable = arg->type == typeid(StringList);
            const bool first_on_cli = seenCli.insert(key).second;
            if (!first_on_cli && !repeatable) {
                throw ParseError("duplicate CLI argument: --" + key);
            }
            if (repeatable && first_on_cli) {
                parsed_[key] = StringList{};  // command line replaces config / default lists
            }

            process_cli_value(*arg, key, remaining, i);
            validate(*arg, parsed_[key]);
        }
    }

    void select_command(const std::string& tok) {
        for (const auto& [name, help] : commands_) {
            if (name == tok) {
                command_ = tok;
                return;
            }
        }
        throw ParseError("unknown command: " + tok);
    }

    void process_cli_value(const Arg& arg, const std::string& key, const std::vector<std::string>& remaining, std::size_t& index) {
        // bool flags may be used without a value
        if (arg.type == typeid(bool)) {
            if (index + 1 < remaining.size() && is_bool_literal(remaining[index + 1])) {
                parsed_[key] = parse_bool(remaining[++index]);
            } else {
                parsed_[key] = true;
            }
            return;
        }
        if (index + 1 >= remaining.size()) {
            throw ParseError("--" + key + " requires a value");
        }
        const std::string& raw = remaining[++index];
        if (arg.type == typeid(StringList)) {
            std::get<StringList>(parsed_[key]).push_back(raw);
        } else {
            parsed_[key] = parse_value(arg, raw);
        }
    }

    // ── TOML loader ────────────────────────────────────────────────────

    void load_toml(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw ParseError("cannot open config file: " + path);
        }

        std::set<std::string> seenToml;
        std::string line;
        while (std::getline(file, line)) {
            auto stripped = strip_comment(trim(line));
            if (stripped.empty() || stripped[0] == '[') {
                continue;
            }

            auto equal = stripped.find('=');
            if (equal == std::string::npos) {
                throw ParseError("wrongly formatted line in config file: " + stripped);
            }

            std::string key = trim(stripped.substr(0, equal));
            std::string rawVal = trim(stripped.substr(equal + 1));

            Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError("unknown argument in config file: " + key);
            }
            if (!seenToml.insert(key).second) {
                throw ParseError("duplicate key in config file: " + key);
            }

            Value toml_value = arg->type == typeid(StringList) ? Value{parse_list(*arg, rawVal)} : parse_value(*arg, rawVal);
            validate(*arg, toml_value);
            parsed_[key] = toml_value;
        }
    }

    // ── string utilities ───────────────────────────────────────────────

    static auto trim(const std::string& str) -> std::string {
        auto begin = str.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(begin, end - begin + 1);
    }

    // Remove everything after the first '#' that is outside a quoted string.
    static auto strip_comment(const std::string& text) -> std::string {
        bool inDouble = false;
        bool inSingle = false;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '"' && !inSingle) {
                inDouble = !inDouble;
            }
            if (text[i] == '\'' && !inDouble) {
                inSingle = !inSingle;
            }
            if (text[i] == '#' && !inDouble && !inSingle) {
                return trim(text.substr(0, i));
            }
        }
        return text;
    }

    static auto unquote(const std::string& raw) -> std::string {
        if (raw.size() >= 2 && ((raw.front() == '"' && raw.back() == '"') || (raw.front() == '\'' && raw.back() == '\''))) {
            return raw.substr(1, raw.size() - 2);
        }
        return raw;
    }

    // ["a", "b"] -> {a, b}. Commas inside quotes are kept.
    static auto parse_list(const Arg& arg, const std::string& raw) -> StringList {
        if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
            throw ParseError("--" + arg.name + " expects a list like [\"a\", \"b\"]");
        }
        StringList items;
        std::string current;
        bool inDouble = false;
        bool inSingle = false;
        for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
            char chr = raw[i];
            if (chr == '"' && !inSingle) {
                inDouble = !inDouble;
            } else if (chr == '\'' && !inDouble) {
                inSingle = !inSingle;
            }
            if (chr == ',' && !inDouble && !inSingle) {
                if (!trim(current).empty()) {
                    items.push_back(unquote(trim(current)));
                }
                current.clear();
                continue;
            }
            current += chr;
        }
        if (!trim(current).empty()) {
            items.push_back(unquote(trim(current)));
        }
        return items;
    }

    auto find_arg(const std::string& key) -> Arg* {
        for (auto& arg : args_) {
            if (arg.name == key) {
                return &arg;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto find_arg(const std::string& key) const -> const Arg* {
        for (const auto& arg : args_) {
            if (arg.name == key) {
                return &arg;
            }
        }
        return nullptr;
    }

    auto expand_short(char short_name) -> std::string {
        for (auto& arg : args_) {
            if (arg.shortName == short_name) {
                return arg.name;
            }
        }
        throw ParseError(std::string("unknown short option: -") + short_name);
    }

    static auto is_bool_literal(const std::string& str) -> bool {
        return str == "true" || str == "false" || str == "1" || str == "0" || str == "yes" || str == "no";
    }

    static auto parse_bool(const std::string& str) -> bool {
        if (str == "true" || str == "1" || str == "yes") {
            return true;
        }
        if (str == "false" || str == "0" || str == "no") {
            return false;
        }
        throw ParseError("invalid bool value: " + str);
    }

    static auto parse_value(const Arg& arg, const std::string& raw) -> Value {
        std::string clean = unquote(raw);
        try {
            if (arg.type == typeid(int)) {
                std::size_t used = 0;
                int value = std::stoi(clean, &used);
                if (used != clean.size()) {
                    throw ParseError("trailing characters in \"" + clean + "\"");
                }
                return Value{value};
            }
            if (arg.type == typeid(bool)) {
                return Value{parse_bool(clean)};
            }
            if (arg.type == typeid(std::string)) {
                return Value{clean};
            }
            if (arg.type == typeid(fs::path)) {
                return Value{fs::path{clean}};
            }
        } catch (const std::exception& e) {
            throw ParseError("invalid value for --" + arg.name + ": " + e.what());
        }
        throw ParseError("unsupported type for --" + arg.name);
    }

    static void validate(const Arg& arg, const Value& val) {
        if (!arg.choices.empty() && std::ranges::find(arg.choices, val) == arg.choices.end()) {
            throw ParseError("--" + arg.name + ": value not in allowed choices");
        }
        if (std::holds_alternative<int>(val)) {
            int int_value = std::get<int>(val);
            if (arg.minValue && int_value < *arg.minValue) {
                throw ParseError("--" + arg.name + ": value " + std::to_string(int_value) + " below minimum " + std::to_string(*arg.minValue));
            }
            if (arg.maxValue && int_value > *arg.maxValue) {
                throw ParseError("--" + arg.name + ": value " + std::to_string(int_value) + " above maximum " + std::to_string(*arg.maxValue));
            }
        }
    }

    static auto pad(std::string text, std::size_t width) -> std::string {
        if (text.size() < width) {
            text.resize(width, ' ');
        } else {
            text += ' ';
        }
        return text;
    }

    static auto value_to_string(const Value& value) -> std::string {
        return std::visit(
            [](auto&& val) -> std::string {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, bool>) {
                    return val ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return val;
                } else if constexpr (std::is_same_v<T, fs::path>) {
                    return val.string();
                } else if constexpr (std::is_same_v<T, StringList>) {
                    std::string out;
                    for (const auto& item : val) {
                        out += (out.empty() ? "" : ",") + item;
                    }
                    return out;
                } else {
                    return std::to_string(val);
                }
            },
            value);
    }

    static auto type_to_string(std::type_index type) -> std::string {
        if (type == typeid(int)) {
            return "int";
        }
        if (type == typeid(bool)) {
            return "bool";
        }
        if (type == typeid(std::string)) {
            return "string";
        }
        if (type == typeid(fs::path)) {
            return "path";
        }
        if (type == typeid(StringList)) {
            return "string";
        }
        return "unknown";
    }

    std::string programName_;
    std::string description_;
    std::vector<std::pair<std::string, std::string>> commands_;
    std::vector<Arg> args_;
    std::map<std::string, Value> parsed_;
    std::string command_;
    bool helpRequested_ = false;
};

}  // namespace talentcode::cli

/// Parse, printing the error and the help text on failure.
template <typename Parser>
inline auto argparser_parse(Parser& parser, int argc, char* argv[]) -> bool {
    try {
        parser.parse(argc, argv);
        return true;
    } catch (const talentcode::cli::ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        parser.print_help(std::cerr);
        return false;
    }
}
