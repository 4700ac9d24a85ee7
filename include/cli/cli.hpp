#pragma once

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace fcg {

// Value of one command-line option
struct ArgValue {
    std::string value;
    bool is_set = false;

    /**
     * @brief Parse the whole value as a number
     * @throws std::runtime_error on trailing text or a non-number
     */
    double as_double(double default_val = 0.0) const;

    // Comma separated items, blanks trimmed, empty items dropped
    std::vector<std::string> as_list(char delim = ',') const;
};

// Options given to one command
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;

    // @throws std::runtime_error when the option was not given
    std::string require(const std::string& name) const;
};

// One --name / -n option of a command
struct OptionDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // Presence means "true"
};

struct Command {
    std::string name;
    std::string description;
    std::vector<OptionDef> options;
    std::function<int(const Args&)> handler;

    void print_help(std::ostream& out) const;
};

/**
 * @brief Parse the arguments following the command name
 *
 * Accepts "--name value", "--name=value" and "-n value"; flags take no value.
 * Every argument must be an option of the command.
 *
 * @throws std::runtime_error on unknown options, positional arguments,
 * missing values or missing required options
 */
Args parse_command_args(const Command& cmd, const std::vector<std::string>& argv);

// Subcommand dispatcher
class CLI {
public:
    CLI(std::string program_name, std::string version)
        : program_name_(std::move(program_name)), version_(std::move(version)) {}

    void register_command(Command cmd);

    // Exit status of the command, 1 on usage or handler errors
    int run(int argc, char** argv) const;

    void print_help(std::ostream& out) const;

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace fcg
