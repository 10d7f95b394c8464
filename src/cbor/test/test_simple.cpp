#include <canonical_cbor/cbor.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

TEST(CBOR, SimpleValues) {
    struct test_case {
        ccb::cbor_value value;
        ccb::byte_vector expected;
    };

    std::vector<test_case> cases = {
        {ccb::cbor_simple::false_value(), {0xf4}},
        {ccb::cbor_simple::true_value(), {0xf5}},
        {ccb::cbor_simple::null(), {0xf6}},
        {ccb::cbor_simple::undefined(), {0xf7}},
        {false, {0xf4}},
        {true, {0xf5}},
        {ccb::cbor_value{}, {0xf6}},
        {ccb::cbor_simple{16}, {0xf0}},
        {ccb::cbor_simple{255}, {0xf8, 0xff}},
    };

    for (auto& [value, expected] : cases) {
        ASSERT_EQ(ccb::dump_cbor(value), expected) << value.dump_debug();
    }
}

TEST(CBOR, SimpleValuesAreNotIntegers) {
    ASSERT_EQ(ccb::cbor_value{true}.type(), ccb::cbor_value_type::simple);
    ASSERT_EQ(ccb::cbor_value{1}.type(), ccb::cbor_value_type::integer);
    ASSERT_NE(ccb::cbor_value{true}, ccb::cbor_value{1});
}

TEST(CBOR, SimpleValueDebugDump) {
    ASSERT_EQ(ccb::cbor_simple::false_value().dump_debug(), "false");
    ASSERT_EQ(ccb::cbor_simple::true_value().dump_debug(), "true");
    ASSERT_EQ(ccb::cbor_simple::null().dump_debug(), "null");
    ASSERT_EQ(ccb::cbor_simple::undefined().dump_debug(), "undefined");
    ASSERT_EQ(ccb::cbor_simple{16}.dump_debug(), "simple(16)");
    ASSERT_TRUE(ccb::cbor_simple::null().is_null());
}

TEST(CBOR, SimpleValuesRejectReservedCodes) {
    for (int code = 24; code <= 31; code++) {
        EXPECT_THROW(ccb::cbor_simple{static_cast<uint8_t>(code)}, std::invalid_argument) << "code " << code;
    }

    ccb::byte_vector expected_23{0xf7};
    ASSERT_EQ(ccb::dump_cbor(ccb::cbor_simple{23}), expected_23);

    ccb::byte_vector expected_32{0xf8, 0x20};
    ASSERT_EQ(ccb::dump_cbor(ccb::cbor_simple{32}), expected_32);
}
