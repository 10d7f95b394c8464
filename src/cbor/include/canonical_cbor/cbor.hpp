#pragma once

#include <canonical_cbor/cbor/detail.hpp>
#include <canonical_cbor/cbor/encode.hpp>
#include <canonical_cbor/cbor/types/array.hpp>
#include <canonical_cbor/cbor/types/integer.hpp>
#include <canonical_cbor/cbor/types/map.hpp>
#include <canonical_cbor/cbor/types/simple.hpp>
#include <canonical_cbor/cbor/types/string.hpp>
#include <canonical_cbor/cbor/types/tag.hpp>
#include <canonical_cbor/cbor/types/value.hpp>
