#include "canonical_cbor/base64.hpp"

#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <stdexcept>

//
// Loosely based on https://stackoverflow.com/a/10973348
//

namespace ccb {

std::string base64_encode(const uint8_t* buffer, size_t length) {
    using base64_encoder_it =
        boost::archive::iterators::base64_from_binary<
            boost::archive::iterators::transform_width<const uint8_t*, 6, 8>
        >;

    std::string base64_encoded;

    // Reserve the total number of bytes we'll need after the encoding
    // Based on https://stackoverflow.com/a/4715480
    base64_encoded.resize((length + 2) / 3 * 4);

    std::copy(base64_encoder_it(buffer), base64_encoder_it(buffer + length), base64_encoded.begin());

    // Add padding characters to get the final string to be a length that's a
    // multiple of 4
    size_t num_padding_characters = (3 - (length % 3)) % 3;
    for (size_t i = 0; i < num_padding_characters; i++) {
        base64_encoded[base64_encoded.size() - i - 1] = '=';
    }

    return base64_encoded;
}

byte_vector base64_decode(std::string_view str) {
    using base64_decoder_it =
        boost::archive::iterators::transform_width<
            boost::archive::iterators::binary_from_base64<const char*>, 8, 6
        >;

    // Determine the number of padding characters at the end of the string
    size_t num_padding_characters = 0;
    for (auto it = str.crbegin(); it != str.crend() && *it == '='; ++it) {
        num_padding_characters++;
    }

    if (str.size() % 4 != 0 || num_padding_characters > 2) {
        throw std::invalid_argument("Malformed base64 input");
    }

    // Padding may only appear at the very end
    if (str.find('=') < str.size() - num_padding_characters) {
        throw std::invalid_argument("Malformed base64 input");
    }

    byte_vector base64_decoded{
        base64_decoder_it(str.data()), base64_decoder_it(str.data() + str.size())
    };

    // '=' decodes as zero bits; drop the bytes that only exist because of it
    base64_decoded.erase(base64_decoded.end() - num_padding_characters, base64_decoded.end());

    return base64_decoded;
}

}  // namespace ccb
