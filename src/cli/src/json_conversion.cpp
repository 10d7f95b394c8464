#include "canonical_cbor/cli/json_conversion.hpp"

#include <canonical_cbor/base64.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace ccb {

namespace {

std::optional<int> one_level_deeper(std::optional<int> remaining_depth) {
    if (!remaining_depth) {
        return std::nullopt;
    }

    return *remaining_depth - 1;
}

uint64_t json_to_unsigned(const nlohmann::json& json, std::string_view what) {
    if (!json.is_number_unsigned()) {
        throw json_conversion_error(fmt::format("{} must be a non-negative integer", what));
    }

    return json.get<uint64_t>();
}

cbor_value json_object_to_cbor(const nlohmann::json& json, std::optional<int> remaining_depth) {
    if (json.size() == 1 && json.contains(JSON_BYTES_KEY)) {
        const auto& encoded = json.at(JSON_BYTES_KEY);
        if (!encoded.is_string()) {
            throw json_conversion_error(fmt::format("{} must be a base64 string", JSON_BYTES_KEY));
        }

        return cbor_byte_string{base64_decode(encoded.get_ref<const std::string&>())};
    }

    if (json.size() == 1 && json.contains(JSON_SIMPLE_KEY)) {
        uint64_t code = json_to_unsigned(json.at(JSON_SIMPLE_KEY), JSON_SIMPLE_KEY);
        if (code > std::numeric_limits<uint8_t>::max()) {
            throw json_conversion_error(fmt::format("Simple value {} does not fit in one byte", code));
        }

        if (code >= CBOR_SIMPLE_RESERVED_FIRST && code <= CBOR_SIMPLE_RESERVED_LAST) {
            throw json_conversion_error(fmt::format("Simple value {} is reserved", code));
        }

        return cbor_simple{static_cast<uint8_t>(code)};
    }

    if (json.size() == 2 && json.contains(JSON_TAG_KEY) && json.contains(JSON_TAG_VALUE_KEY)) {
        return cbor_tag{
            json_to_unsigned(json.at(JSON_TAG_KEY), JSON_TAG_KEY),
            json_to_cbor(json.at(JSON_TAG_VALUE_KEY), one_level_deeper(remaining_depth)),
        };
    }

    if (json.size() == 1 && json.contains(JSON_MAP_KEY)) {
        const auto& pairs = json.at(JSON_MAP_KEY);
        if (!pairs.is_array()) {
            throw json_conversion_error(fmt::format("{} must be an array of [key, value] pairs", JSON_MAP_KEY));
        }

        cbor_map map;
        for (const auto& pair : pairs) {
            if (!pair.is_array() || pair.size() != 2) {
                throw json_conversion_error(fmt::format("{} entries must be [key, value] arrays", JSON_MAP_KEY));
            }

            map.push_back(
                json_to_cbor(pair.at(0), one_level_deeper(remaining_depth)),
                json_to_cbor(pair.at(1), one_level_deeper(remaining_depth))
            );
        }

        return map;
    }

    cbor_map map;
    for (const auto& item : json.items()) {
        if (remaining_depth && *remaining_depth < 1) {
            throw cbor_too_much_nesting_error();
        }

        map.push_back(cbor_text_string{item.key()}, json_to_cbor(item.value(), one_level_deeper(remaining_depth)));
    }

    return map;
}

}  // namespace

cbor_value json_to_cbor(const nlohmann::json& json, std::optional<int> max_nesting) {
    if (max_nesting && *max_nesting < 0) {
        spdlog::debug("Nesting limit reached while converting a JSON {}", json.type_name());
        throw cbor_too_much_nesting_error();
    }

    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return cbor_simple::null();
        case nlohmann::json::value_t::boolean:
            return cbor_simple{json.get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return cbor_integer{json.get<int64_t>()};
        case nlohmann::json::value_t::number_unsigned:
            return cbor_integer{json.get<uint64_t>()};
        case nlohmann::json::value_t::number_float:
            throw json_conversion_error(fmt::format("Floating-point value {} cannot be encoded", json.dump()));
        case nlohmann::json::value_t::string:
            return cbor_text_string{json.get<std::string>()};
        case nlohmann::json::value_t::binary:
            return cbor_byte_string{byte_vector{json.get_binary().cbegin(), json.get_binary().cend()}};
        case nlohmann::json::value_t::array: {
            std::vector<cbor_value> elements;
            elements.reserve(json.size());
            for (const auto& element : json) {
                elements.push_back(json_to_cbor(element, one_level_deeper(max_nesting)));
            }

            return cbor_array{std::move(elements)};
        }
        case nlohmann::json::value_t::object:
            return json_object_to_cbor(json, max_nesting);
        case nlohmann::json::value_t::discarded:
            break;
    }

    throw json_conversion_error(fmt::format("Unsupported JSON value {}", json.dump()));
}

}  // namespace ccb
