#include "canonical_cbor/cbor/encode.hpp"

#include "canonical_cbor/cbor/detail.hpp"

#include <canonical_cbor/binary_io.hpp>
#include <canonical_cbor/format.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace ccb {

namespace {

std::optional<int> one_level_deeper(std::optional<int> remaining_depth) {
    if (!remaining_depth) {
        return std::nullopt;
    }

    return *remaining_depth - 1;
}

class cbor_encoder {
public:
    explicit cbor_encoder(byte_vector& output) : _writer(output) {}

    NON_COPYABLE(cbor_encoder);
    NON_MOVABLE(cbor_encoder);

    void encode(cbor_value&& value, std::optional<int> remaining_depth) {
        if (remaining_depth && *remaining_depth < 0) {
            spdlog::debug("Nesting limit reached at a CBOR item of major type {}", value.major_type());
            throw cbor_too_much_nesting_error();
        }

        std::move(value).visit([&](auto&& item) {
            _encode_item(std::move(item), remaining_depth);
        });
    }

private:
    binary_writer _writer;

    void _encode_item(cbor_integer&& value, std::optional<int>) {
        write_initial_byte_into(_writer, value.major_type(), value.raw_value());
    }

    template <typename TString>
    void _encode_item(basic_cbor_string<TString>&& value, std::optional<int>) {
        write_initial_byte_into(_writer, value.major_type(), value.size());
        _writer.write_string(value.string_view());
    }

    void _encode_item(cbor_array&& value, std::optional<int> remaining_depth) {
        auto elements = std::move(value).release();
        write_initial_byte_into(_writer, cbor_array::major_type(), elements.size());

        for (auto&& element : elements) {
            encode(std::move(element), one_level_deeper(remaining_depth));
        }
    }

    void _encode_item(cbor_map&& value, std::optional<int> remaining_depth) {
        // Canonical order is defined over the encoded keys, so every key has
        // to be written out before any of the pairs can be placed
        std::vector<std::pair<byte_vector, cbor_value>> entries;
        auto pairs = std::move(value).release();
        entries.reserve(pairs.size());

        for (auto&& [key, pair_value] : pairs) {
            byte_vector encoded_key;
            cbor_encoder{encoded_key}.encode(std::move(key), one_level_deeper(remaining_depth));
            entries.emplace_back(std::move(encoded_key), std::move(pair_value));
        }

        std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.first < rhs.first;
        });

        auto duplicate = std::adjacent_find(entries.cbegin(), entries.cend(), [](const auto& lhs, const auto& rhs) {
            return lhs.first == rhs.first;
        });

        if (duplicate != entries.cend()) {
            auto encoded_key_hex = to_hex(duplicate->first);
            spdlog::debug("CBOR map has more than one key encoding to {}", encoded_key_hex);
            throw cbor_duplicate_map_key_error(fmt::format("Duplicate CBOR map key {}", encoded_key_hex));
        }

        write_initial_byte_into(_writer, cbor_map::major_type(), entries.size());

        for (auto&& [encoded_key, pair_value] : entries) {
            _writer.write_bytes(encoded_key);
            encode(std::move(pair_value), one_level_deeper(remaining_depth));
        }
    }

    void _encode_item(cbor_tag&& value, std::optional<int> remaining_depth) {
        write_initial_byte_into(_writer, cbor_tag::major_type(), value.tag());
        encode(std::move(value).release(), one_level_deeper(remaining_depth));
    }

    void _encode_item(cbor_simple&& value, std::optional<int>) {
        write_initial_byte_into(_writer, cbor_simple::major_type(), value.code());
    }
};

}  // namespace

void encode_cbor(cbor_value value, byte_vector& output) {
    encode_cbor_with_limit(std::move(value), output, CBOR_DEFAULT_MAX_NESTING);
}

void encode_cbor_with_limit(cbor_value value, byte_vector& output, std::optional<int> max_nesting) {
    cbor_encoder{output}.encode(std::move(value), max_nesting);
}

byte_vector dump_cbor(cbor_value value, std::optional<int> max_nesting) {
    byte_vector output;
    encode_cbor_with_limit(std::move(value), output, max_nesting);
    return output;
}

}  // namespace ccb
