#include <canonical_cbor/cbor.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

TEST(CBOR, Tags) {
    {
        ccb::byte_vector expected{0xc6, 0x18, 0x42};
        ASSERT_EQ(ccb::dump_cbor(ccb::cbor_tag{6, 0x42}), expected);
    }

    {
        ccb::byte_vector expected{0xc1, 0xf5};
        ASSERT_EQ(ccb::dump_cbor(ccb::cbor_tag{1, true}), expected);
    }

    {
        ccb::cbor_tag tag{
            1000,
            ccb::cbor_map{
                {"b", ccb::cbor_array{2, 3}},
                {"a", 1},
            },
        };

        ccb::byte_vector expected{
            0xd9, 0x03, 0xe8,  // tag 1000
            0xa2,  // map of 2 pairs
            0x61, 0x61,  // "a"
            0x01, 0x61, 0x62,  // "b"
            0x82,  // array with 2 elements
            0x02, 0x03,
        };
        ASSERT_EQ(ccb::dump_cbor(tag), expected);
    }

    // Tag numbers use the full header range
    {
        ccb::byte_vector expected{0xdb, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x00};
        ASSERT_EQ(ccb::dump_cbor(ccb::cbor_tag{std::numeric_limits<uint64_t>::max(), 0}), expected);
    }

    // Tags nest
    {
        ccb::byte_vector expected{0xd8, 0x18, 0xc2, 0x41, 0x01};
        ASSERT_EQ(ccb::dump_cbor(ccb::cbor_tag{24, ccb::cbor_tag{2, ccb::cbor_byte_string{ccb::byte_vector{0x01}}}}), expected);
    }
}

TEST(CBOR, TagCopiesAreIndependent) {
    ccb::cbor_tag original{32, "https://example.com"};
    ccb::cbor_tag copy = original;

    ASSERT_EQ(copy, original);
    ASSERT_EQ(copy.tag(), 32u);
    ASSERT_EQ(copy.value(), "https://example.com");
    ASSERT_NE(&copy.value(), &original.value());

    copy = ccb::cbor_tag{33, "other"};
    ASSERT_EQ(original.value(), "https://example.com");
    ASSERT_EQ(copy.dump_debug(), "33(\"other\")");
}
