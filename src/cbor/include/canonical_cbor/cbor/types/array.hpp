#pragma once

#include <canonical_cbor/cbor/detail.hpp>

#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace ccb {

class cbor_value;

class cbor_array {
public:
    cbor_array() {}

    explicit cbor_array(const std::vector<cbor_value>& vec);
    explicit cbor_array(std::vector<cbor_value>&& vec);
    cbor_array(std::initializer_list<cbor_value> list);

    static constexpr uint8_t major_type() { return CBOR_ARRAY; }

    const cbor_value& operator[](size_t index) const;

    void push_back(cbor_value val);

    size_t size() const;

    // Hands the elements over to the caller, leaving this array empty
    std::vector<cbor_value> release() &&;

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    const std::vector<cbor_value>& vector() const { return _array; }

    bool operator==(const cbor_array& rhs) const;

private:
    std::vector<cbor_value> _array;
};

}  // namespace ccb
