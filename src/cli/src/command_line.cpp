#include "canonical_cbor/cli/command_line.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace ccb {

namespace {

int parse_max_nesting(const std::string& value) {
    size_t parsed_length = 0;
    int max_nesting = 0;

    try {
        max_nesting = std::stoi(value, &parsed_length);
    } catch (const std::invalid_argument&) {
        throw command_line_error(fmt::format("--max-nesting expects an integer, got '{}'", value));
    } catch (const std::out_of_range&) {
        throw command_line_error(fmt::format("--max-nesting value '{}' is out of range", value));
    }

    if (parsed_length != value.size() || max_nesting < 0) {
        throw command_line_error(fmt::format("--max-nesting expects a non-negative integer, got '{}'", value));
    }

    return max_nesting;
}

}  // namespace

command_line_options parse_command_line(const std::vector<std::string>& args) {
    command_line_options options;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "--max-nesting") {
            if (i + 1 >= args.size()) {
                throw command_line_error("--max-nesting requires a value");
            }

            options.max_nesting = parse_max_nesting(args[++i]);
        } else if (arg == "--no-nesting-limit") {
            options.max_nesting = std::nullopt;
        } else if (arg == "--raw") {
            options.format = output_format::raw;
        } else if (arg == "--hexdump") {
            options.format = output_format::hexdump;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            throw command_line_error(fmt::format("Unknown option '{}'", arg));
        } else if (options.input_path) {
            throw command_line_error("Only one input file may be given");
        } else if (arg != "-") {
            options.input_path = arg;
        }
    }

    return options;
}

std::string usage(const std::string& program_name) {
    return fmt::format(
        "Usage: {} [--max-nesting N | --no-nesting-limit] [--raw | --hexdump] [FILE]\n"
        "\n"
        "Reads a JSON document from FILE (or stdin when FILE is omitted or '-')\n"
        "and writes its canonical CBOR encoding to stdout as hex.\n"
        "\n"
        "  --max-nesting N     fail on structures nested deeper than N (default {})\n"
        "  --no-nesting-limit  encode any depth\n"
        "  --raw               write the encoded bytes instead of hex\n"
        "  --hexdump           write an offset/hex/ASCII dump instead of hex\n"
        "\n"
        "Set CANONICAL_CBOR_DEBUG to enable debug logging on stderr.\n",
        program_name, CBOR_DEFAULT_MAX_NESTING
    );
}

}  // namespace ccb
