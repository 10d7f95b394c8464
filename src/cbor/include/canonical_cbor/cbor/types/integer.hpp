#pragma once

#include <canonical_cbor/cbor/detail.hpp>

#include <canonical_cbor/format.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace ccb {

namespace detail {

template <typename T>
constexpr bool can_fit_in_cbor_integer_v =
    std::is_integral_v<T> && ! std::is_same_v<T, bool> && sizeof(T) <= sizeof(uint64_t);

}  // namespace detail

class cbor_integer {
public:
    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr cbor_integer(T value) {
        if (value >= 0) {
            _type = CBOR_NON_NEGATIVE_INTEGER;
            _raw_value = static_cast<uint64_t>(value);
        } else {
            _type = CBOR_NEGATIVE_INTEGER;
            _raw_value = static_cast<uint64_t>((value + 1) * -1);
        }
    }

    // The integer -(raw_value + 1). Reaches down to -2^64, which no native
    // integer type can hold.
    static constexpr cbor_integer negative(uint64_t raw_value) {
        cbor_integer result{0};
        result._type = CBOR_NEGATIVE_INTEGER;
        result._raw_value = raw_value;
        return result;
    }

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr operator T() const {
        switch (_type) {
            case CBOR_NON_NEGATIVE_INTEGER:
                if (_raw_value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                    throw std::overflow_error("CBOR non-negative integer cannot fit in specified integer type");
                }

                return static_cast<T>(_raw_value);
            case CBOR_NEGATIVE_INTEGER:
                if constexpr (std::is_unsigned_v<T>) {
                    throw std::overflow_error("Cannot represent CBOR negative integer with unsigned integer type");
                } else {
                    if (_raw_value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                        throw std::overflow_error("CBOR negative integer cannot fit in specified integer type");
                    }

                    return static_cast<T>(-1 - static_cast<T>(_raw_value));
                }
            default:
                throw std::runtime_error("Unknown type value for cbor_integer");
        }
    }

    constexpr uint8_t major_type() const { return _type; }
    constexpr uint64_t raw_value() const { return _raw_value; }
    constexpr bool is_negative() const { return _type == CBOR_NEGATIVE_INTEGER; }

    bool operator<(const cbor_integer& rhs) const {
        return _type == rhs._type
            ? (_type == CBOR_NEGATIVE_INTEGER ? _raw_value > rhs._raw_value : _raw_value < rhs._raw_value)
            : _type > rhs._type;
    }

    bool operator==(const cbor_integer& rhs) const { return _type == rhs._type && _raw_value == rhs._raw_value; }
    bool operator!=(const cbor_integer& rhs) const { return !(*this == rhs); }
    bool operator>(const cbor_integer& rhs) const { return rhs < *this; }
    bool operator>=(const cbor_integer& rhs) const { return !(*this < rhs); }
    bool operator<=(const cbor_integer& rhs) const { return !(rhs < *this); }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        if (_type == CBOR_NEGATIVE_INTEGER) {
            // Use special logic to handle this so we don't run into potential
            // overflow issues for very small negative numbers
            if (_raw_value == std::numeric_limits<uint64_t>::max()) {
                ss << "-18446744073709551616";
            } else {
                ss << '-' << _raw_value + 1;
            }
        } else {
            ss << _raw_value;
        }
    }

private:
    uint8_t _type{CBOR_NON_NEGATIVE_INTEGER};
    uint64_t _raw_value{0};
};

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator==(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) == rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator!=(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) != rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator<(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) < rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator>(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) > rhs; }

}  // namespace ccb
