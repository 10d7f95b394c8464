#pragma once

#include <canonical_cbor/cbor/encode.hpp>
#include <canonical_cbor/exceptions.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ccb {

CUSTOM_EXCEPTION(command_line_error, "Invalid command line");

enum class output_format {
    hex,
    raw,
    hexdump,
};

struct command_line_options {
    std::optional<int> max_nesting{CBOR_DEFAULT_MAX_NESTING};
    output_format format{output_format::hex};
    std::optional<std::string> input_path;
    bool show_help{false};
};

command_line_options parse_command_line(const std::vector<std::string>& args);

std::string usage(const std::string& program_name);

}  // namespace ccb
