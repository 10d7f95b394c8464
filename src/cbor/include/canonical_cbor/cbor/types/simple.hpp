#pragma once

#include <canonical_cbor/cbor/detail.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>

namespace ccb {

// Codes 24-31 are ill-formed and rejected with std::invalid_argument
class cbor_simple {
public:
    explicit cbor_simple(uint8_t code);

    template <typename T, std::enable_if_t<std::is_same_v<T, bool>, int> = 0>
    cbor_simple(T value) : cbor_simple(value ? CBOR_VALUE_TRUE : CBOR_VALUE_FALSE) {}

    static cbor_simple false_value() { return cbor_simple{CBOR_VALUE_FALSE}; }
    static cbor_simple true_value() { return cbor_simple{CBOR_VALUE_TRUE}; }
    static cbor_simple null() { return cbor_simple{CBOR_VALUE_NULL}; }
    static cbor_simple undefined() { return cbor_simple{CBOR_VALUE_UNDEFINED}; }

    static constexpr uint8_t major_type() { return CBOR_EVERYTHING_ELSE; }
    uint8_t code() const { return _code; }

    bool is_null() const { return _code == CBOR_VALUE_NULL; }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    bool operator==(const cbor_simple& rhs) const;

private:
    uint8_t _code;
};

}  // namespace ccb
