#ifndef REARLINK_CLI_COMMON_HPP
#define REARLINK_CLI_COMMON_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace rearlink::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    std::optional<std::string> log_level;

    // Overrides for values from the config file
    std::optional<int> n_steps;
    std::optional<int> iterations;
    std::optional<int> num_threads;
};

// Parse a strictly positive integer option value
inline int parse_count(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(option + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size() || parsed < 1) {
        throw std::runtime_error(option + " expects a positive integer, got '" + value + "'");
    }
    return parsed;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(option + " requires an argument");
        }
        std::string value = argv[i + 1];
        i += 2;
        return value;
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "--log-level") {
            ctx.log_level = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "--steps") {
            ctx.n_steps = parse_count(arg, require_value(arg));
        } else if (arg == "--iterations") {
            ctx.iterations = parse_count(arg, require_value(arg));
        } else if (arg == "--threads") {
            ctx.num_threads = parse_count(arg, require_value(arg));
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Command function declarations
int command_validate(int argc, char** argv);
int command_solve(int argc, char** argv);
int command_batch(int argc, char** argv);

}  // namespace rearlink::cli

#endif // REARLINK_CLI_COMMON_HPP
