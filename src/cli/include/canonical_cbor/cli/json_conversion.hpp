#pragma once

#include <canonical_cbor/cbor/encode.hpp>
#include <canonical_cbor/cbor/types/value.hpp>
#include <canonical_cbor/exceptions.hpp>

#include <nlohmann/json.hpp>

#include <optional>

namespace ccb {

CUSTOM_EXCEPTION(json_conversion_error, "Cannot convert JSON document to CBOR");

//
// Reserved object forms for values plain JSON cannot express:
//
//   {"$bytes": "<base64>"}        byte string
//   {"$tag": N, "$value": V}      tag N wrapping V
//   {"$simple": N}                simple value N (0-255)
//   {"$map": [[K, V], ...]}       map with arbitrary, possibly repeated, keys
//
constexpr const char* JSON_BYTES_KEY = "$bytes";
constexpr const char* JSON_TAG_KEY = "$tag";
constexpr const char* JSON_TAG_VALUE_KEY = "$value";
constexpr const char* JSON_SIMPLE_KEY = "$simple";
constexpr const char* JSON_MAP_KEY = "$map";

// Integers become unsigned or negative CBOR integers, strings text strings,
// arrays arrays, objects maps with text keys, and true/false/null the matching
// simple values. Floating-point numbers are rejected.
//
// Nesting is counted the way the encoder counts it. A document nested deeper
// than `max_nesting` fails with cbor_too_much_nesting_error before the
// deeper levels are built.
cbor_value json_to_cbor(const nlohmann::json& json, std::optional<int> max_nesting = CBOR_DEFAULT_MAX_NESTING);

}  // namespace ccb
