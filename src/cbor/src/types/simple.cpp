#include "canonical_cbor/cbor/types/simple.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace ccb {

cbor_simple::cbor_simple(uint8_t code) : _code(code) {
    if (code >= CBOR_SIMPLE_RESERVED_FIRST && code <= CBOR_SIMPLE_RESERVED_LAST) {
        throw std::invalid_argument(fmt::format("Simple value {} is reserved", code));
    }
}

std::string cbor_simple::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_simple::dump_debug(std::stringstream& ss) const {
    switch (_code) {
        case CBOR_VALUE_FALSE: ss << "false"; break;
        case CBOR_VALUE_TRUE: ss << "true"; break;
        case CBOR_VALUE_NULL: ss << "null"; break;
        case CBOR_VALUE_UNDEFINED: ss << "undefined"; break;
        default: ss << "simple(" << static_cast<int>(_code) << ")"; break;
    }
}

bool cbor_simple::operator==(const cbor_simple& rhs) const {
    return _code == rhs._code;
}

}  // namespace ccb
