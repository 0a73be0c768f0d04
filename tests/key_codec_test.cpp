#include "storage/key_codec.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace diskmap {

TEST(KeyCodecTest, StringIsIdentity) {
    EXPECT_EQ(KeyCodec<std::string>::to_string("alpha"), "alpha");
    EXPECT_EQ(KeyCodec<std::string>::from_string("alpha"), "alpha");
}

TEST(KeyCodecTest, IntegersRenderAsDecimal) {
    EXPECT_EQ(KeyCodec<int>::to_string(42), "42");
    EXPECT_EQ(KeyCodec<int>::to_string(-7), "-7");
    EXPECT_EQ(KeyCodec<uint64_t>::to_string(std::numeric_limits<uint64_t>::max()),
              "18446744073709551615");
}

TEST(KeyCodecTest, IntegersParseBack) {
    EXPECT_EQ(KeyCodec<int>::from_string("42"), 42);
    EXPECT_EQ(KeyCodec<int>::from_string("-7"), -7);
    EXPECT_EQ(KeyCodec<int64_t>::from_string(KeyCodec<int64_t>::to_string(
                  std::numeric_limits<int64_t>::min())),
              std::numeric_limits<int64_t>::min());
}

TEST(KeyCodecTest, IntegerParseRejectsForeignNames) {
    EXPECT_THROW(KeyCodec<int>::from_string("abc"), std::invalid_argument);
    EXPECT_THROW(KeyCodec<int>::from_string("12x"), std::invalid_argument);
    EXPECT_THROW(KeyCodec<int>::from_string(""), std::invalid_argument);
    EXPECT_THROW(KeyCodec<uint8_t>::from_string("300"), std::invalid_argument);
}

} // namespace diskmap
