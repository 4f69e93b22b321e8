#ifndef QUILTBLOCK_CLI_COMMON_HPP
#define QUILTBLOCK_CLI_COMMON_HPP

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace quiltblock::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> text;  // Inline input instead of a file
    double cell_size = 60.0;
    double pixels_per_inch = 10.0;
    bool verbose = false;
};

inline double parse_positive(const std::string& flag, const std::string& value) {
    double parsed = 0.0;
    try {
        parsed = std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " expects a number, got: " + value);
    }
    if (parsed <= 0.0) {
        throw std::runtime_error(flag + " must be positive");
    }
    return parsed;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value("-o/--output");
        } else if (arg == "--text") {
            ctx.text = next_value("--text");
        } else if (arg == "--cell-size") {
            ctx.cell_size = parse_positive(arg, next_value(arg));
        } else if (arg == "--ppi") {
            ctx.pixels_per_inch = parse_positive(arg, next_value(arg));
        } else if (arg == "--log-level") {
            // Applied by main before dispatch
            next_value(arg);
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

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

// Command function declarations
int command_validate(int argc, char** argv);
int command_render(int argc, char** argv);
int command_hashtags(int argc, char** argv);
int command_migrate(int argc, char** argv);
int command_pattern(int argc, char** argv);

}  // namespace quiltblock::cli

#endif // QUILTBLOCK_CLI_COMMON_HPP
