#include "canonical_cbor/util.hpp"

#include "canonical_cbor/format.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdlib>

namespace ccb {

namespace {

constexpr const size_t DUMP_BINARY_LINE_LENGTH = 16;
constexpr const char* DEBUG_ENVIRONMENT_VARIABLE = "CANONICAL_CBOR_DEBUG";

template <typename Output>
void dump_binary_line(Output& output, const uint8_t* buffer, size_t length) {
    // Print hex values
    for (size_t i = 0; i < length; i++) {
        output << fmt::format("{:02x} ", buffer[i]);
    }

    // If we didn't print a full line, print some padding to line up this
    // partial line's ASCII output with the full lines above it
    if (length < DUMP_BINARY_LINE_LENGTH) {
        output << std::string((DUMP_BINARY_LINE_LENGTH - length) * 3, ' ');
    }

    output << ' ';

    // Print ASCII values
    for (size_t i = 0; i < length; i++) {
        char c = buffer[i];
        if (c < 0x20 || c > 0x7e) {
            // Non-printable ASCII, just print a placeholder
            c = '.';
        }

        output << c;
    }

    output << "\n";
}

}  // namespace

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length, size_t indent) {
    std::string indent_str(indent, ' ');

    // Print a header
    ss << indent_str << "      ";
    for (size_t i = 0; i < DUMP_BINARY_LINE_LENGTH; i++) {
        ss << fmt::format(" {:x} ", i);
    }

    ss << "\n";

    // Print the values
    for (size_t i = 0; i < length; i += DUMP_BINARY_LINE_LENGTH) {
        ss << indent_str << fmt::format("{:04x}: ", i);

        dump_binary_line(ss, buffer + i, std::min(DUMP_BINARY_LINE_LENGTH, length - i));
    }
}

std::optional<std::string> get_environment_variable(const std::string& variable_name) {
    return get_environment_variable(variable_name.c_str());
}

std::optional<std::string> get_environment_variable(const char* variable_name) {
    const char* env_var_value = std::getenv(variable_name);
    if (env_var_value == nullptr) {
        return std::nullopt;
    }

    return std::string(env_var_value);
}

void set_up_logger(std::string_view log_name) {
    auto logger = spdlog::stderr_color_mt(std::string{log_name});
    logger->set_level(
        get_environment_variable(DEBUG_ENVIRONMENT_VARIABLE)
            ? spdlog::level::debug
            : spdlog::level::warn
    );
    spdlog::set_default_logger(logger);
}

void log_multiline(const std::string& data, const std::string& indent_str) {
    std::stringstream ss(data);
    log_multiline(ss, indent_str);
}

void log_multiline(std::stringstream& data, const std::string& indent_str) {
    std::string token;
    while (std::getline(data, token, '\n')) {
        spdlog::debug("{}{}", indent_str, token);
    }
}

void log_multiline_binary(std::span<const uint8_t> buffer, const std::string& indent_str) {
    log_multiline_binary(buffer.data(), buffer.size(), indent_str);
}

void log_multiline_binary(const uint8_t* buffer, size_t length, const std::string& indent_str) {
    std::stringstream ss;
    dump_binary(ss, buffer, length);
    log_multiline(ss, indent_str);
}

}  // namespace ccb
