#pragma once

#include <canonical_cbor/types.hpp>
#include <canonical_cbor/util.hpp>

#include <cstdint>
#include <string_view>

namespace ccb {

// Appends to a byte vector owned by the caller. Never reads back or truncates
// what is already there.
class binary_writer {
public:
    explicit binary_writer(byte_vector& output) : _output(output) {}

    NON_COPYABLE(binary_writer);
    NON_MOVABLE(binary_writer);

    size_t bytes_written() const { return _output.size(); }

    void write_uint8_t(uint8_t value) { _output.push_back(value); }
    void write_be_uint16_t(uint16_t value) { _write_integer<2>(value); }
    void write_be_uint32_t(uint32_t value) { _write_integer<4>(value); }
    void write_be_uint64_t(uint64_t value) { _write_integer<8>(value); }

    void write_string(std::string_view buffer) {
        write_bytes(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());
    }

    void write_string(byte_string_view buffer) { write_bytes(buffer.data(), buffer.size()); }
    void write_bytes(const byte_vector& buffer) { write_bytes(buffer.data(), buffer.size()); }

    void write_bytes(const uint8_t* buffer, size_t length) {
        _output.insert(_output.end(), buffer, buffer + length);
    }

private:
    byte_vector& _output;

    template <size_t N, typename T>
    void _write_integer(T value) {
        for (size_t byte_i = 0; byte_i < N; byte_i++) {
            write_uint8_t(static_cast<uint8_t>(value >> ((N - byte_i - 1) * 8)));
        }
    }
};

}  // namespace ccb
