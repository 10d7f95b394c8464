#pragma once

#include <canonical_cbor/cbor/types/value.hpp>

#include <canonical_cbor/exceptions.hpp>
#include <canonical_cbor/types.hpp>

#include <optional>

namespace ccb {

constexpr const int CBOR_DEFAULT_MAX_NESTING = 127;

CUSTOM_EXCEPTION(cbor_encoder_error, "Failed to encode CBOR value");
CUSTOM_EXCEPTION_WITH_BASE(cbor_too_much_nesting_error, cbor_encoder_error, "CBOR value is nested too deeply");
CUSTOM_EXCEPTION_WITH_BASE(cbor_duplicate_map_key_error, cbor_encoder_error, "CBOR map contains a duplicate key");

//
// Canonical encoding
//
// Map pairs are written sorted by the bytes of their encoded keys, and a map
// whose keys encode identically is rejected. Nesting is limited: every array
// element, map key, map value and tagged value is one level deeper than its
// parent, and a value reached with less than zero levels left fails the whole
// call with cbor_too_much_nesting_error.
//
// Bytes are appended to `output`. Whatever it held before the call is left
// alone, but on failure the bytes appended by the failed call remain and the
// caller must discard them.
//

// Encodes with at most CBOR_DEFAULT_MAX_NESTING levels of nesting
void encode_cbor(cbor_value value, byte_vector& output);

// Encodes with at most `max_nesting` levels of nesting, or without a limit
// when `max_nesting` is empty
void encode_cbor_with_limit(cbor_value value, byte_vector& output, std::optional<int> max_nesting);

byte_vector dump_cbor(cbor_value value, std::optional<int> max_nesting = CBOR_DEFAULT_MAX_NESTING);

}  // namespace ccb
