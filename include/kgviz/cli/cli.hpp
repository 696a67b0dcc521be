#pragma once

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace kgviz {

/**
 * @brief One parsed option value
 *
 * Numeric accessors reject trailing characters ("10x" is an error).
 */
struct ArgValue {
    std::string value;
    bool is_set = false;

    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used == value.size()) return parsed;
        } catch (const std::logic_error&) {
        }
        throw std::runtime_error("Invalid integer value: " + value);
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        try {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used == value.size()) return parsed;
        } catch (const std::logic_error&) {
        }
        throw std::runtime_error("Invalid numeric value: " + value);
    }

    // Comma-separated ids or entity types; blanks are dropped
    std::vector<std::string> as_list() const {
        std::vector<std::string> items;
        if (!is_set) return items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto first = item.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            auto last = item.find_last_not_of(" \t");
            items.push_back(item.substr(first, last - first + 1));
        }
        return items;
    }
};

/**
 * @brief Options of one command invocation, keyed by long name
 */
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name, const std::string& default_val = "") const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{default_val, !default_val.empty()};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return named.at(name).value;
    }
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // Presence means true
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) std::cout << " --" << arg.name << " <value>";
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

        for (const auto& arg : args) {
            std::string flag = "--" + arg.name;
            if (!arg.short_name.empty()) flag += ", -" + arg.short_name;
            if (!arg.is_flag) flag += " <value>";

            std::cout << "  " << flag << "\n      " << arg.description;
            if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Subcommand dispatcher for the kgviz tool
 *
 * `kgviz <command> [options]`. Handler exceptions are reported on stderr
 * and turned into exit code 1.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        std::string name = cmd.name;
        commands_[name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        const std::string cmd_name = argv[1];
        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return 0;
        }
        if (cmd_name == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n"
                      << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const Command& cmd = it->second;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return 0;
            }
        }

        Args args;
        try {
            args = parse_args(argc - 2, argv + 2, cmd);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return 1;
        }

        try {
            return cmd.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        size_t width = 0;
        for (const auto& entry : commands_) {
            width = std::max(width, entry.first.size());
        }

        std::cout << program_name_ << " - Knowledge graph visual exploration engine\n\n"
                  << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << name << std::string(width - name.size() + 4, ' ')
                      << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n"
                  << "Version: " << version_ << "\n";
    }

    /**
     * @brief Parse the arguments following the command name
     *
     * Accepts `--name value`, `--name=value` and `-s value`; flags take no
     * value. Defaults fill in options that were not given.
     *
     * @throws std::runtime_error on unknown, incomplete, stray or missing arguments
     */
    static Args parse_args(int argc, char** argv, const Command& cmd) {
        auto find_def = [&cmd](const std::string& token) -> const ArgDef* {
            for (const auto& def : cmd.args) {
                if (token == "--" + def.name) return &def;
                if (!def.short_name.empty() && token == "-" + def.short_name) return &def;
            }
            return nullptr;
        };

        Args result;
        for (int i = 0; i < argc; ++i) {
            std::string token = argv[i];
            if (token.empty() || token[0] != '-') {
                throw std::runtime_error("Unexpected argument: " + token);
            }

            std::string inline_value;
            bool has_inline = false;
            auto eq_pos = token.find('=');
            if (token.rfind("--", 0) == 0 && eq_pos != std::string::npos) {
                inline_value = token.substr(eq_pos + 1);
                token = token.substr(0, eq_pos);
                has_inline = true;
            }

            const ArgDef* def = find_def(token);
            if (!def) {
                throw std::runtime_error("Unknown argument: " + token);
            }

            if (def->is_flag) {
                if (has_inline) {
                    throw std::runtime_error("Flag " + token + " takes no value");
                }
                result.named[def->name] = ArgValue{"true", true};
            } else if (has_inline) {
                result.named[def->name] = ArgValue{inline_value, true};
            } else if (i + 1 < argc) {
                result.named[def->name] = ArgValue{argv[++i], true};
            } else {
                throw std::runtime_error("Argument " + token + " requires a value");
            }
        }

        for (const auto& def : cmd.args) {
            if (result.named.count(def.name)) continue;
            if (def.required) {
                throw std::runtime_error("Missing required argument: --" + def.name);
            }
            if (!def.default_value.empty()) {
                result.named[def.name] = ArgValue{def.default_value, true};
            }
        }
        return result;
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace kgviz
