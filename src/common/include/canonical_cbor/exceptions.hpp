#pragma once

#include <canonical_cbor/util.hpp>

#include <stdexcept>
#include <string>

namespace ccb {

#define CUSTOM_EXCEPTION_WITH_BASE(name, base, default_msg) \
    class name : public base { \
    public: \
        name() : base(default_msg) {} \
        name(const std::string& what_arg) : base(what_arg) {} \
        name(const char* what_arg) : base(what_arg) {} \
        \
        COPYABLE(name); \
        MOVABLE(name); \
    }

#define CUSTOM_EXCEPTION(name, default_msg) \
    CUSTOM_EXCEPTION_WITH_BASE(name, std::runtime_error, default_msg)

}  // namespace ccb
