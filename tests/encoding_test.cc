#include "talon_encoding.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace talon {

namespace {

std::string AsString(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace

TEST(Base64Test, DecodesPaddedAndUnpaddedInput) {
  std::vector<uint8_t> out;
  ASSERT_TRUE(Base64Decode("aGVsbG8=", out));
  EXPECT_EQ("hello", AsString(out));

  ASSERT_TRUE(Base64Decode("aGk=", out));
  EXPECT_EQ("hi", AsString(out));

  ASSERT_TRUE(Base64Decode("aGk", out));
  EXPECT_EQ("hi", AsString(out));

  ASSERT_TRUE(Base64Decode("", out));
  EXPECT_TRUE(out.empty());
}

TEST(Base64Test, SkipsWhitespace) {
  std::vector<uint8_t> out;
  ASSERT_TRUE(Base64Decode("aGVs\nbG8g\r\nd29y bGQ=", out));
  EXPECT_EQ("hello world", AsString(out));
}

TEST(Base64Test, DecodesBinary) {
  std::vector<uint8_t> out;
  ASSERT_TRUE(Base64Decode("AP+A", out));
  std::vector<uint8_t> expected = {0x00, 0xff, 0x80};
  EXPECT_EQ(expected, out);
}

TEST(Base64Test, RejectsMalformedInput) {
  std::vector<uint8_t> out = {1, 2, 3};
  EXPECT_FALSE(Base64Decode("aGV$bG8=", out));
  EXPECT_FALSE(Base64Decode("aGk=aGk=", out));
  EXPECT_FALSE(Base64Decode("aGk===", out));
  EXPECT_FALSE(Base64Decode("a", out));

  // Output is untouched on failure
  std::vector<uint8_t> expected = {1, 2, 3};
  EXPECT_EQ(expected, out);
}

TEST(DataURITest, Base64Payload) {
  std::string mime;
  std::vector<uint8_t> out;
  ASSERT_TRUE(ParseDataURI("data:image/png;base64,iVBORw==", mime, out));
  EXPECT_EQ("image/png", mime);
  std::vector<uint8_t> expected = {0x89, 'P', 'N', 'G'};
  EXPECT_EQ(expected, out);
}

TEST(DataURITest, PlainPayloadIsPercentDecoded) {
  std::string mime;
  std::vector<uint8_t> out;
  ASSERT_TRUE(ParseDataURI("data:text/plain;charset=utf-8,a%20b%2Cc%zz", mime, out));
  EXPECT_EQ("text/plain", mime);
  EXPECT_EQ("a b,c%zz", AsString(out));
}

TEST(DataURITest, EmptyMimeType) {
  std::string mime = "stale";
  std::vector<uint8_t> out;
  ASSERT_TRUE(ParseDataURI("data:,", mime, out));
  EXPECT_TRUE(mime.empty());
  EXPECT_TRUE(out.empty());
}

TEST(DataURITest, RejectsOtherSchemesAndBadPayloads) {
  std::string mime;
  std::vector<uint8_t> out;
  EXPECT_FALSE(ParseDataURI("http://example.com/a.png", mime, out));
  EXPECT_FALSE(ParseDataURI("data:image/png;base64", mime, out));
  EXPECT_FALSE(ParseDataURI("data:image/png;base64,***", mime, out));
}

}  // namespace talon
