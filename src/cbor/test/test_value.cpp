#include <canonical_cbor/cbor.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace ccb::literals;

TEST(CBOR, ValueBoxing) {
    // cbor_text_string
    {
        const char* c_str = "hello world";
        std::string str_obj = "hello world";

        ccb::cbor_text_string original_cbor_str{"hello world"};
        ASSERT_EQ(original_cbor_str, c_str);
        ASSERT_EQ(original_cbor_str, str_obj);
        ASSERT_EQ(original_cbor_str.string_view(), "hello world");

        ccb::cbor_value boxed_cbor_str{original_cbor_str};
        ASSERT_EQ(boxed_cbor_str, original_cbor_str);

        auto unboxed_cbor_str = static_cast<ccb::cbor_text_string>(boxed_cbor_str);
        ASSERT_EQ(unboxed_cbor_str, c_str);
        ASSERT_EQ(unboxed_cbor_str, str_obj);
        ASSERT_EQ(static_cast<std::string>(boxed_cbor_str), str_obj);
    }

    // cbor_byte_string
    {
        ccb::cbor_value boxed_bytes{"\x01\x02"_bytes};
        ASSERT_EQ(boxed_bytes.type(), ccb::cbor_value_type::byte_string);
        ASSERT_EQ(static_cast<ccb::byte_vector>(boxed_bytes), (ccb::byte_vector{0x01, 0x02}));
    }

    // cbor_integer
    {
        ccb::cbor_value boxed_int{-42};
        ASSERT_EQ(boxed_int, -42);
        ASSERT_EQ(static_cast<int>(boxed_int), -42);
        ASSERT_EQ(static_cast<ccb::cbor_integer>(boxed_int).raw_value(), 41u);
    }
}

TEST(CBOR, ValueCasting) {
    ccb::cbor_text_string str{"hello world"};
    ASSERT_EQ(str, "hello world");

    ccb::cbor_value boxed_str{str};
    EXPECT_THROW(static_cast<ccb::cbor_integer>(boxed_str), std::runtime_error);
    EXPECT_THROW(static_cast<ccb::cbor_array>(boxed_str), std::runtime_error);
    EXPECT_THROW(static_cast<ccb::cbor_map>(boxed_str), std::runtime_error);
    EXPECT_THROW(static_cast<ccb::cbor_byte_string>(boxed_str), std::runtime_error);

    ccb::cbor_value boxed_int{300};
    EXPECT_THROW(static_cast<uint8_t>(boxed_int), std::overflow_error);
    EXPECT_THROW(static_cast<ccb::cbor_text_string>(boxed_int), std::runtime_error);
}

TEST(CBOR, ValueTypes) {
    struct test_case {
        ccb::cbor_value value;
        ccb::cbor_value_type type;
        uint8_t major_type;
    };

    std::vector<test_case> cases = {
        {0, ccb::cbor_value_type::integer, 0},
        {-1, ccb::cbor_value_type::integer, 1},
        {"\x00"_bytes, ccb::cbor_value_type::byte_string, 2},
        {"text", ccb::cbor_value_type::text_string, 3},
        {ccb::cbor_array{}, ccb::cbor_value_type::array, 4},
        {ccb::cbor_map{}, ccb::cbor_value_type::map, 5},
        {ccb::cbor_tag{0, 0}, ccb::cbor_value_type::tag, 6},
        {true, ccb::cbor_value_type::simple, 7},
        {ccb::cbor_value{}, ccb::cbor_value_type::simple, 7},
    };

    for (const auto& [value, type, major_type] : cases) {
        ASSERT_EQ(value.type(), type) << value.dump_debug();
        ASSERT_EQ(value.major_type(), major_type) << value.dump_debug();
    }
}

TEST(CBOR, ValueDebugDump) {
    ccb::cbor_value value = ccb::cbor_map{
        {"a", ccb::cbor_array{1, -2, "\x0a\xff"_bytes}},
        {"b\"", ccb::cbor_tag{1, ccb::cbor_simple::null()}},
    };

    ASSERT_EQ(value.dump_debug(), "{\"a\": [1, -2, h'0aff'], \"b\\\"\": 1(null)}");
}

TEST(CBOR, ValueEquality) {
    ASSERT_EQ(ccb::cbor_value{1}, ccb::cbor_value{1u});
    ASSERT_NE(ccb::cbor_value{1}, ccb::cbor_value{-1});
    ASSERT_NE(ccb::cbor_value{"1"}, ccb::cbor_value{"1"_bytes});
    ASSERT_EQ((ccb::cbor_array{1, "two"}), (ccb::cbor_array{1, "two"}));
    ASSERT_NE((ccb::cbor_array{1, "two"}), (ccb::cbor_array{"two", 1}));
    ASSERT_EQ((ccb::cbor_tag{2, "x"}), (ccb::cbor_tag{2, "x"}));
    ASSERT_NE((ccb::cbor_tag{2, "x"}), (ccb::cbor_tag{3, "x"}));
}
