#pragma once

#include <canonical_cbor/cbor/detail.hpp>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

namespace ccb {

class cbor_value;

// A tag number wrapping exactly one inner value
class cbor_tag {
public:
    cbor_tag(uint64_t tag, cbor_value value);
    ~cbor_tag();

    cbor_tag(const cbor_tag& other);
    cbor_tag& operator=(const cbor_tag& other);
    cbor_tag(cbor_tag&& other) noexcept;
    cbor_tag& operator=(cbor_tag&& other) noexcept;

    static constexpr uint8_t major_type() { return CBOR_TAG; }

    uint64_t tag() const { return _tag; }
    const cbor_value& value() const;

    // Hands the inner value over to the caller
    cbor_value release() &&;

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    bool operator==(const cbor_tag& rhs) const;

private:
    uint64_t _tag;
    std::unique_ptr<cbor_value> _value;
};

}  // namespace ccb
