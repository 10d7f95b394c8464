#include <canonical_cbor/format.hpp>
#include <canonical_cbor/util.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

using namespace ccb::literals;

TEST(Util, ToHex) {
    ASSERT_EQ(ccb::to_hex(ccb::byte_vector{}), "");
    ASSERT_EQ(ccb::to_hex(ccb::byte_vector{0x00, 0x0a, 0xab, 0xff}), "000aabff");
    ASSERT_EQ(ccb::to_hex("IETF"_bytes), "49455446");
}

TEST(Util, DumpBinary) {
    std::stringstream ss;
    ccb::dump_binary(ss, "AB\x01"_bytes, 2);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0], "        " " 0  1  2  3  4  5  6  7  8  9  a  b  c  d  e  f ");
    ASSERT_EQ(lines[1], "  0000: 41 42 01 " + std::string(13 * 3, ' ') + " AB.");
}

TEST(Util, DumpBinaryMultipleLines) {
    ccb::byte_vector buffer(33, 'x');

    std::stringstream ss;
    ccb::dump_binary(ss, buffer);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 4u);
    ASSERT_EQ(lines[1].substr(0, 6), "0000: ");
    ASSERT_EQ(lines[2].substr(0, 6), "0010: ");
    ASSERT_EQ(lines[3].substr(0, 6), "0020: ");
    ASSERT_EQ(lines[2].substr(lines[2].size() - 16), std::string(16, 'x'));
}

TEST(Util, GetEnvironmentVariable) {
    ASSERT_EQ(::setenv("CANONICAL_CBOR_TEST_VARIABLE", "some value", 1), 0);
    ASSERT_EQ(ccb::get_environment_variable("CANONICAL_CBOR_TEST_VARIABLE"), "some value");
    ASSERT_EQ(ccb::get_environment_variable(std::string{"CANONICAL_CBOR_TEST_VARIABLE"}), "some value");

    ASSERT_EQ(::unsetenv("CANONICAL_CBOR_TEST_VARIABLE"), 0);
    ASSERT_FALSE(ccb::get_environment_variable("CANONICAL_CBOR_TEST_VARIABLE"));
}
