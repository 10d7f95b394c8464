#pragma once

#include <canonical_cbor/cbor/detail.hpp>

#include <canonical_cbor/format.hpp>
#include <canonical_cbor/types.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ccb {

namespace detail {

template <typename TChar>
struct basic_cbor_string_type;

template <typename TChar>
inline constexpr uint8_t basic_cbor_string_type_v = basic_cbor_string_type<TChar>::value;

template <> struct basic_cbor_string_type<uint8_t> { static constexpr uint8_t value = CBOR_BYTE_STRING; };
template <> struct basic_cbor_string_type<char> { static constexpr uint8_t value = CBOR_TEXT_STRING; };

}  // namespace detail

// Text strings are held as UTF-8 and written out verbatim, without validation.
template <typename TString>
class basic_cbor_string {
public:
    using string_type = TString;
    using value_type = typename string_type::value_type;
    using string_view_type = std::basic_string_view<value_type, typename string_type::traits_type>;
    using vector_type = std::vector<value_type>;

    basic_cbor_string(string_type str) : _str(std::move(str)) {}
    basic_cbor_string(const value_type* str) : _str(str) {}
    basic_cbor_string(const vector_type& vec) : _str(vec.cbegin(), vec.cend()) {}
    basic_cbor_string() {}

    static constexpr uint8_t major_type() { return detail::basic_cbor_string_type_v<value_type>; }

    const string_type& string() const { return _str; }
    string_view_type string_view() const { return _str; }
    vector_type vector() const { return vector_type{_str.cbegin(), _str.cend()}; }

    const value_type* data() const { return _str.data(); }
    size_t size() const { return _str.size(); }

    operator string_type() const { return string(); }
    operator string_view_type() const { return string_view(); }
    operator vector_type() const { return vector(); }

    bool operator==(const basic_cbor_string<TString>& rhs) const { return _str == rhs._str; }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        if constexpr (std::is_same_v<value_type, uint8_t>) {
            ss << "h'" << to_hex(_str.data(), _str.size()) << '\'';
        } else {
            ss << '"';

            for (auto c : _str) {
                if (c == '"' || c == '\\') {
                    ss << '\\';
                }

                ss << c;
            }

            ss << '"';
        }
    }

private:
    TString _str;
};

using cbor_byte_string = basic_cbor_string<byte_string>;
using cbor_text_string = basic_cbor_string<std::basic_string<char>>;

}  // namespace ccb
