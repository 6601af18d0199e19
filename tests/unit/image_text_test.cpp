#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "tagpack/codec/binary_codec.hpp"
#include "tagpack/codec/image_text.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::codec {
namespace {

class ImageTextTest : public ::testing::Test {};

TEST_F(ImageTextTest, ParsesSpacedPairs) {
  auto image = ParseHexImage("01 00 00 00 e8 03");
  ASSERT_TRUE(image.has_value()) << image.error().Message();
  EXPECT_EQ(*image, (BinaryImage{0x01, 0x00, 0x00, 0x00, 0xE8, 0x03}));
}

TEST_F(ImageTextTest, IgnoresPrefixSeparatorsAndCase) {
  auto image = ParseHexImage("  0xDEAD_beef\n0a ");
  ASSERT_TRUE(image.has_value()) << image.error().Message();
  EXPECT_EQ(*image, (BinaryImage{0xDE, 0xAD, 0xBE, 0xEF, 0x0A}));
}

TEST_F(ImageTextTest, EmptyTextIsEmptyImage) {
  auto image = ParseHexImage("   ");
  ASSERT_TRUE(image.has_value());
  EXPECT_TRUE(image->empty());
}

TEST_F(ImageTextTest, InvalidDigitRejected) {
  auto image = ParseHexImage("01 0g");
  ASSERT_FALSE(image.has_value());
  EXPECT_EQ(image.error().kind, ErrorKind::kMalformedValue);
  EXPECT_NE(
      image.error().detail.find("invalid hex digit 'g'"), std::string::npos);
}

TEST_F(ImageTextTest, OddDigitCountRejected) {
  auto image = ParseHexImage("01 2");
  ASSERT_FALSE(image.has_value());
  EXPECT_EQ(image.error().kind, ErrorKind::kMalformedValue);
  EXPECT_EQ(image.error().detail, "odd number of hex digits");
}

TEST_F(ImageTextTest, FormatsLowercasePairs) {
  BinaryImage image = {0x00, 0x7F, 0xAB, 0xFF};
  EXPECT_EQ(FormatHexImage(image), "00 7f ab ff");
  EXPECT_EQ(FormatHexImage(BinaryImage{}), "");
}

TEST_F(ImageTextTest, FormattedTextParsesBack) {
  BinaryImage image = {0x10, 0x20, 0x30, 0x00, 0xC8};
  auto parsed = ParseHexImage(FormatHexImage(image));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, image);
}

}  // namespace
}  // namespace tagpack::codec
