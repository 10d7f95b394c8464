#pragma once

#include <canonical_cbor/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace ccb {

#define COPYABLE(class_name) \
    class_name(const class_name&) = default; \
    class_name& operator=(const class_name&) = default

#define NON_COPYABLE(class_name) \
    class_name(const class_name&) = delete; \
    class_name& operator=(const class_name&) = delete

#define MOVABLE(class_name) \
    class_name(class_name&&) = default; \
    class_name& operator=(class_name&&) = default

#define NON_MOVABLE(class_name) \
    class_name(class_name&&) = delete; \
    class_name& operator=(class_name&&) = delete

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T, typename U>
using enable_if_convertible_without_cvref =
    std::enable_if_t<std::is_convertible_v<remove_cvref_t<T>, remove_cvref_t<U>>, int>;

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length, size_t indent = 0);

inline void dump_binary(std::stringstream& ss, const byte_vector& binary, size_t indent = 0) {
    dump_binary(ss, binary.data(), binary.size(), indent);
}

inline void dump_binary(std::stringstream& ss, const byte_string& binary, size_t indent = 0) {
    dump_binary(ss, binary.data(), binary.size(), indent);
}

std::optional<std::string> get_environment_variable(const std::string& variable_name);
std::optional<std::string> get_environment_variable(const char* variable_name);

// Installs a stderr logger as the spdlog default. The level is debug when
// CANONICAL_CBOR_DEBUG is set, warn otherwise.
void set_up_logger(std::string_view log_name);

void log_multiline(const std::string& data, const std::string& indent_str = "");
void log_multiline(std::stringstream& data, const std::string& indent_str = "");
void log_multiline_binary(std::span<const uint8_t> buffer, const std::string& indent_str = "");
void log_multiline_binary(const uint8_t* buffer, size_t length, const std::string& indent_str = "");

}  // namespace ccb
