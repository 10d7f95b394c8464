#include "canonical_cbor/cbor/types/value.hpp"

#include <sstream>

namespace ccb {

uint8_t cbor_value::major_type() const {
    return std::visit([](auto&& value) { return value.major_type(); }, _storage);
}

std::string cbor_value::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_value::dump_debug(std::stringstream& ss) const {
    std::visit([&](auto&& value) { value.dump_debug(ss); }, _storage);
}

bool cbor_value::operator==(const cbor_value& rhs) const {
    return _storage == rhs._storage;
}

}  // namespace ccb
