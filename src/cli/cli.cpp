#include "cli/cli.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fcg {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

const OptionDef* find_option(const Command& cmd, const std::string& arg) {
    for (const auto& opt : cmd.options) {
        if (arg == "--" + opt.name) return &opt;
        if (!opt.short_name.empty() && arg == "-" + opt.short_name) return &opt;
    }
    return nullptr;
}

} // namespace

// ============== ArgValue / Args ==============

double ArgValue::as_double(double default_val) const {
    if (!is_set) return default_val;
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error("Expected a number, got '" + value + "'");
    }
    return v;
}

std::vector<std::string> ArgValue::as_list(char delim) const {
    std::vector<std::string> items;
    if (!is_set) return items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

ArgValue Args::get(const std::string& name, const std::string& default_val) const {
    auto it = named.find(name);
    if (it != named.end()) return it->second;
    return ArgValue{default_val, !default_val.empty()};
}

bool Args::has(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() && it->second.is_set;
}

std::string Args::require(const std::string& name) const {
    if (!has(name)) {
        throw std::runtime_error("Missing required argument: --" + name);
    }
    return named.at(name).value;
}

// ============== Parsing ==============

Args parse_command_args(const Command& cmd, const std::vector<std::string>& argv) {
    Args args;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            throw std::runtime_error("Unexpected argument: " + arg);
        }

        std::string key = arg;
        std::string inline_value;
        bool has_inline = false;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            key = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
            has_inline = true;
        }

        const OptionDef* opt = find_option(cmd, key);
        if (!opt) {
            throw std::runtime_error("Unknown argument: " + key);
        }

        if (opt->is_flag) {
            if (has_inline) {
                throw std::runtime_error("Flag " + key + " takes no value");
            }
            args.named[opt->name] = ArgValue{"true", true};
        } else if (has_inline) {
            args.named[opt->name] = ArgValue{inline_value, true};
        } else {
            if (i + 1 >= argv.size()) {
                throw std::runtime_error("Argument " + key + " requires a value");
            }
            args.named[opt->name] = ArgValue{argv[++i], true};
        }
    }

    for (const auto& opt : cmd.options) {
        if (args.named.count(opt.name)) continue;
        if (opt.required) {
            throw std::runtime_error("Missing required argument: --" + opt.name);
        }
        if (!opt.default_value.empty()) {
            args.named[opt.name] = ArgValue{opt.default_value, true};
        }
    }

    return args;
}

// ============== Help ==============

void Command::print_help(std::ostream& out) const {
    out << "\nUsage: fcg " << name;
    for (const auto& opt : options) {
        if (opt.required) out << " --" << opt.name << " <value>";
    }
    out << " [options]\n\n" << description << "\n\nOptions:\n";

    for (const auto& opt : options) {
        out << "  --" << opt.name;
        if (!opt.short_name.empty()) out << ", -" << opt.short_name;
        if (!opt.is_flag) out << " <value>";
        out << "\n      " << opt.description;
        if (!opt.default_value.empty()) out << " (default: " << opt.default_value << ")";
        if (opt.required) out << " [required]";
        out << "\n";
    }
    out << "\n";
}

void CLI::print_help(std::ostream& out) const {
    out << program_name_ << " - functional connectivity graph metrics\n\n";
    out << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
    for (const auto& [name, cmd] : commands_) {
        out << "  " << name;
        for (size_t i = name.length(); i < 16; ++i) out << ' ';
        out << cmd.description << "\n";
    }
    out << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
}

// ============== Dispatch ==============

void CLI::register_command(Command cmd) {
    std::string name = cmd.name;
    commands_[name] = std::move(cmd);
}

int CLI::run(int argc, char** argv) const {
    if (argc < 2) {
        print_help(std::cerr);
        return 1;
    }

    std::string cmd_name = argv[1];
    if (cmd_name == "--help" || cmd_name == "-h") {
        print_help(std::cout);
        return 0;
    }
    if (cmd_name == "--version" || cmd_name == "-v") {
        std::cout << program_name_ << " version " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(cmd_name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << cmd_name << "\n";
        std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& cmd = it->second;

    std::vector<std::string> rest(argv + 2, argv + argc);
    for (const auto& arg : rest) {
        if (arg == "--help" || arg == "-h") {
            cmd.print_help(std::cout);
            return 0;
        }
    }

    Args args;
    try {
        args = parse_command_args(cmd, rest);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        cmd.print_help(std::cerr);
        return 1;
    }

    try {
        return cmd.handler(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace fcg
