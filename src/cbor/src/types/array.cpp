#include "canonical_cbor/cbor/types/array.hpp"

#include "canonical_cbor/cbor/types/value.hpp"

#include <utility>

namespace ccb {

cbor_array::cbor_array(const std::vector<cbor_value>& vec)
    : _array(vec.cbegin(), vec.cend()) {}

cbor_array::cbor_array(std::vector<cbor_value>&& vec)
    : _array(std::move(vec)) {}

cbor_array::cbor_array(std::initializer_list<cbor_value> list)
    : _array(list.begin(), list.end()) {}

const cbor_value& cbor_array::operator[](size_t index) const {
    return _array.at(index);
}

void cbor_array::push_back(cbor_value val) {
    _array.push_back(std::move(val));
}

size_t cbor_array::size() const {
    return _array.size();
}

std::vector<cbor_value> cbor_array::release() && {
    return std::exchange(_array, {});
}

bool cbor_array::operator==(const cbor_array& rhs) const { return _array == rhs._array; }

std::string cbor_array::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_array::dump_debug(std::stringstream& ss) const {
    ss << '[';

    bool first = true;
    for (auto&& value : _array) {
        if (!first) {
            ss << ", ";
        }

        value.dump_debug(ss);
        first = false;
    }

    ss << ']';
}

}  // namespace ccb
