#include "canonical_cbor/cbor/types/tag.hpp"

#include "canonical_cbor/cbor/types/value.hpp"

#include <utility>

namespace ccb {

cbor_tag::cbor_tag(uint64_t tag, cbor_value value)
    : _tag(tag), _value(std::make_unique<cbor_value>(std::move(value))) {}

cbor_tag::~cbor_tag() = default;

cbor_tag::cbor_tag(const cbor_tag& other)
    : _tag(other._tag), _value(std::make_unique<cbor_value>(other.value())) {}

cbor_tag& cbor_tag::operator=(const cbor_tag& other) {
    if (this != &other) {
        _tag = other._tag;
        _value = std::make_unique<cbor_value>(other.value());
    }

    return *this;
}

cbor_tag::cbor_tag(cbor_tag&& other) noexcept = default;
cbor_tag& cbor_tag::operator=(cbor_tag&& other) noexcept = default;

// A moved-from tag has no inner value; it behaves as if it wrapped null
const cbor_value& cbor_tag::value() const {
    static const cbor_value null_value{};
    return _value ? *_value : null_value;
}

cbor_value cbor_tag::release() && {
    if (!_value) {
        return cbor_value{};
    }

    cbor_value inner = std::move(*_value);
    _value.reset();
    return inner;
}

std::string cbor_tag::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_tag::dump_debug(std::stringstream& ss) const {
    ss << _tag << '(';
    value().dump_debug(ss);
    ss << ')';
}

bool cbor_tag::operator==(const cbor_tag& rhs) const {
    return _tag == rhs._tag && value() == rhs.value();
}

}  // namespace ccb
