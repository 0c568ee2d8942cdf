#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace nugget {

// Exit code for bad command lines (sysexits EX_USAGE)
const int kExitUsage = 64;

/**
 * @brief Command line that cannot be acted on
 *
 * Thrown while parsing or reading arguments; CLI::run prints the command's
 * help and exits with kExitUsage.
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// Argument value holder
struct ArgValue {
    std::string name;
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }

    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        size_t used = 0;
        int result = 0;
        try {
            result = std::stoi(value, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != value.size()) {
            throw UsageError("--" + name + " expects an integer, got '" + value + "'");
        }
        return result;
    }

    size_t as_count(size_t default_val) const {
        if (!is_set) return default_val;
        int result = as_int();
        if (result <= 0) {
            throw UsageError("--" + name + " must be a positive integer");
        }
        return static_cast<size_t>(result);
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        size_t used = 0;
        double result = 0.0;
        try {
            result = std::stod(value, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != value.size()) {
            throw UsageError("--" + name + " expects a number, got '" + value + "'");
        }
        return result;
    }

    // Number in (low, high] or [low, high] depending on include_low
    double as_ratio(double low, double high, bool include_low) const {
        double result = as_double();
        bool low_ok = include_low ? result >= low : result > low;
        if (!low_ok || result > high) {
            std::ostringstream range;
            range << (include_low ? "[" : "(") << low << ", " << high << "]";
            throw UsageError("--" + name + " must be in " + range.str());
        }
        return result;
    }

    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> result;
        if (!is_set) return result;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, delim)) {
            item.erase(0, item.find_first_not_of(" \t"));
            item.erase(item.find_last_not_of(" \t") + 1);
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }
};

// Parsed arguments container
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name) const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{name, "", false};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw UsageError("Missing required argument: --" + name);
        }
        return it->second.value;
    }
};

// Argument definition
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;               // Presence means true, no value expected
    std::vector<std::string> choices;   // Allowed values; each list item for is_list
    bool is_list = false;               // Comma separated
};

// Command definition
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
    std::vector<std::string> examples;

    void print_help(const std::string& program_name) const {
        std::cout << "\n" << description << "\n\n";
        std::cout << "Usage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <" << arg.name << ">";
            }
        }
        std::cout << " [options]\n";

        print_options("Required", true);
        print_options("Options", false);

        if (!examples.empty()) {
            std::cout << "\nExamples:\n";
            for (const auto& example : examples) {
                std::cout << "  " << program_name << " " << name << " " << example << "\n";
            }
        }
        std::cout << "\n";
    }

private:
    void print_options(const std::string& title, bool required) const {
        bool any = std::any_of(args.begin(), args.end(),
                               [required](const ArgDef& a) { return a.required == required; });
        if (!any) return;

        std::cout << "\n" << title << ":\n";
        for (const auto& arg : args) {
            if (arg.required != required) continue;

            std::string flag = "  --" + arg.name;
            if (!arg.short_name.empty()) flag += ", -" + arg.short_name;
            if (!arg.is_flag) flag += " <value>";

            std::cout << flag;
            // Align descriptions at column 30
            for (size_t i = flag.length(); i < 30; ++i) std::cout << " ";
            std::cout << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            if (!arg.choices.empty()) {
                std::cout << " [";
                for (size_t i = 0; i < arg.choices.size(); ++i) {
                    if (i > 0) std::cout << "|";
                    std::cout << arg.choices[i];
                }
                std::cout << "]";
            }
            std::cout << "\n";
        }
    }
};

// Main CLI class
class CLI {
public:
    CLI(const std::string& program_name,
        const std::string& version,
        const std::string& tagline = "")
        : program_name_(program_name), version_(version), tagline_(tagline) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return kExitUsage;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h" || cmd_name == "help") {
            print_help();
            return 0;
        }

        if (cmd_name == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return kExitUsage;
        }

        const Command& cmd = it->second;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--") break;
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return 0;
            }
        }

        try {
            Args args = parse_args(argc - 2, argv + 2, cmd);
            return cmd.handler(args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            std::cerr << "Run '" << program_name_ << " " << cmd.name << " --help' for usage.\n";
            return kExitUsage;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " " << version_;
        if (!tagline_.empty()) std::cout << " - " << tagline_;
        std::cout << "\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name;
            for (size_t i = name.length(); i < 14; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
    }

private:
    static void check_choices(const ArgDef& def, const ArgValue& value) {
        if (def.choices.empty()) return;

        std::vector<std::string> items = def.is_list ? value.as_list() : std::vector<std::string>{value.value};
        for (const auto& item : items) {
            if (std::find(def.choices.begin(), def.choices.end(), item) == def.choices.end()) {
                throw UsageError("Invalid value '" + item + "' for --" + def.name);
            }
        }
    }

    Args parse_args(int argc, char** argv, const Command& cmd) const {
        Args result;

        std::map<std::string, const ArgDef*> by_name;
        std::map<std::string, const ArgDef*> by_short;
        for (const auto& arg : cmd.args) {
            by_name[arg.name] = &arg;
            if (!arg.short_name.empty()) {
                by_short[arg.short_name] = &arg;
            }
        }

        bool options_done = false;
        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];

            if (options_done || arg.size() < 2 || arg[0] != '-') {
                result.positional.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }

            // --name, --name=value, or -n
            const ArgDef* def = nullptr;
            std::string inline_value;
            bool has_inline = false;
            if (arg.rfind("--", 0) == 0) {
                std::string name = arg.substr(2);
                auto eq_pos = name.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                    has_inline = true;
                }
                auto it = by_name.find(name);
                if (it != by_name.end()) def = it->second;
            } else if (arg.size() == 2) {
                auto it = by_short.find(arg.substr(1));
                if (it != by_short.end()) def = it->second;
            }

            if (!def) {
                throw UsageError("Unknown argument: " + arg);
            }

            ArgValue value{def->name, "", true};
            if (def->is_flag) {
                if (has_inline) {
                    throw UsageError("--" + def->name + " does not take a value");
                }
                value.value = "true";
            } else if (has_inline) {
                value.value = inline_value;
            } else {
                if (i + 1 >= argc) {
                    throw UsageError("Argument " + arg + " requires a value");
                }
                value.value = argv[++i];
            }

            check_choices(*def, value);
            result.named[def->name] = value;
        }

        for (const auto& arg : cmd.args) {
            if (result.named.count(arg.name)) continue;
            if (arg.required) {
                throw UsageError("Missing required argument: --" + arg.name);
            }
            if (!arg.default_value.empty()) {
                result.named[arg.name] = ArgValue{arg.name, arg.default_value, true};
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::string tagline_;
    std::map<std::string, Command> commands_;
};

} // namespace nugget
