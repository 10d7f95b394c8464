#include <canonical_cbor/cbor.hpp>
#include <canonical_cbor/cli/command_line.hpp>
#include <canonical_cbor/cli/json_conversion.hpp>
#include <canonical_cbor/format.hpp>
#include <canonical_cbor/util.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ccb {

namespace {

constexpr std::string_view LOG_NAME = "canonical-cbor";

nlohmann::json read_json_document(const std::optional<std::string>& input_path) {
    if (!input_path) {
        spdlog::debug("Reading JSON document from stdin");
        return nlohmann::json::parse(std::cin);
    }

    spdlog::debug("Reading JSON document from {}", *input_path);

    std::ifstream input{*input_path, std::ios::binary};
    if (!input) {
        throw std::runtime_error(fmt::format("Cannot open {}", *input_path));
    }

    return nlohmann::json::parse(input);
}

void write_output(const byte_vector& encoded, output_format format) {
    switch (format) {
        case output_format::hex:
            std::cout << to_hex(encoded) << "\n";
            break;
        case output_format::raw:
            std::cout.write(reinterpret_cast<const char*>(encoded.data()), encoded.size());
            break;
        case output_format::hexdump: {
            std::stringstream ss;
            dump_binary(ss, encoded);
            std::cout << ss.str();
            break;
        }
    }

    std::cout.flush();
}

int run(const std::vector<std::string>& args, const std::string& program_name) {
    command_line_options options = parse_command_line(args);
    if (options.show_help) {
        std::cout << usage(program_name);
        return 0;
    }

    cbor_value value = json_to_cbor(read_json_document(options.input_path), options.max_nesting);
    spdlog::debug("Encoding CBOR value: {}", value.dump_debug());

    byte_vector encoded = dump_cbor(std::move(value), options.max_nesting);

    spdlog::debug("Encoded {} bytes:", encoded.size());
    log_multiline_binary(encoded.data(), encoded.size(), "  ");

    write_output(encoded, options.format);
    return 0;
}

}  // namespace

}  // namespace ccb

int main(int argc, char** argv) {
    ccb::set_up_logger(ccb::LOG_NAME);

    std::string program_name = argc > 0 ? argv[0] : std::string{ccb::LOG_NAME};
    std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);

    try {
        return ccb::run(args, program_name);
    } catch (const ccb::command_line_error& ex) {
        spdlog::critical("{}", ex.what());
        std::cerr << ccb::usage(program_name);
    } catch (const std::exception& ex) {
        spdlog::critical("Failed to encode document: {}", ex.what());
    }

    return 1;
}
