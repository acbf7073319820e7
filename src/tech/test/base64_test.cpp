#include "base64.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "tnc_invalid_argument_exception.hpp"

namespace tnc {

TEST(Base64, EncodeEmpty) { EXPECT_EQ(B64Encode(std::string_view("")), ""); }
TEST(Base64, Encode1) { EXPECT_EQ(B64Encode(std::string_view("f")), "Zg=="); }
TEST(Base64, Encode2) { EXPECT_EQ(B64Encode(std::string_view("fo")), "Zm8="); }
TEST(Base64, Encode3) { EXPECT_EQ(B64Encode(std::string_view("foo")), "Zm9v"); }
TEST(Base64, Encode4) { EXPECT_EQ(B64Encode(std::string_view("foob")), "Zm9vYg=="); }
TEST(Base64, Encode5) { EXPECT_EQ(B64Encode(std::string_view("fooba")), "Zm9vYmE="); }
TEST(Base64, Encode6) { EXPECT_EQ(B64Encode(std::string_view("foobar")), "Zm9vYmFy"); }

TEST(Base64, EncodeWithoutPadding) {
  EXPECT_EQ(B64Encode(std::string_view("f"), Base64Alphabet::standard, Base64Padding::kNo), "Zg");
  EXPECT_EQ(B64Encode(std::string_view("fo"), Base64Alphabet::standard, Base64Padding::kNo), "Zm8");
  EXPECT_EQ(B64Encode(std::string_view("foo"), Base64Alphabet::standard, Base64Padding::kNo), "Zm9v");
  EXPECT_EQ(B64Encode(std::string_view("foobarz"), Base64Alphabet::standard, Base64Padding::kNo), "Zm9vYmFyeg");
}

TEST(Base64, EncodeUrlSafe) {
  EXPECT_EQ(B64Encode(std::string_view("\xfb\xff"), Base64Alphabet::standard), "+/8=");
  EXPECT_EQ(B64Encode(std::string_view("\xfb\xff"), Base64Alphabet::urlsafe), "-_8=");
  EXPECT_EQ(B64Encode(std::string_view("\xfb\xef\xbe\xff\xff\xff"), Base64Alphabet::urlsafe, Base64Padding::kNo),
            "----____");
}

TEST(Base64, EncodedLen) {
  EXPECT_EQ(B64EncodedLen(0), 0);
  EXPECT_EQ(B64EncodedLen(1), 4);
  EXPECT_EQ(B64EncodedLen(12), 16);
  EXPECT_EQ(B64EncodedLen(0, Base64Padding::kNo), 0);
  EXPECT_EQ(B64EncodedLen(1, Base64Padding::kNo), 2);
  EXPECT_EQ(B64EncodedLen(2, Base64Padding::kNo), 3);
  EXPECT_EQ(B64EncodedLen(12, Base64Padding::kNo), 16);
  EXPECT_EQ(B64EncodedLen(24, Base64Padding::kNo), 32);
}

TEST(Base64, DecodeEmpty) { EXPECT_EQ(B64Decode(std::string_view("")), ""); }
TEST(Base64, Decode1) { EXPECT_EQ(B64Decode(std::string_view("Zg==")), "f"); }
TEST(Base64, Decode2) { EXPECT_EQ(B64Decode(std::string_view("Zm8=")), "fo"); }
TEST(Base64, Decode3) { EXPECT_EQ(B64Decode(std::string_view("Zm9v")), "foo"); }
TEST(Base64, Decode7) { EXPECT_EQ(B64Decode(std::string_view("Zm9vYmFyeg==")), "foobarz"); }
TEST(Base64, DecodeUnpadded) { EXPECT_EQ(B64Decode(std::string_view("Zm9vYmFyeg")), "foobarz"); }

TEST(Base64, DecodeBothAlphabets) {
  EXPECT_EQ(B64Decode(std::string_view("+/8=")), "\xfb\xff");
  EXPECT_EQ(B64Decode(std::string_view("-_8=")), "\xfb\xff");
}

TEST(Base64, DecodeSkipsWhitespace) { EXPECT_EQ(B64Decode(std::string_view("Zm9v\nYmFy")), "foobar"); }

TEST(Base64, DecodeIllegalCharacter) {
  EXPECT_THROW(B64Decode(std::string_view("Zm9v*mFy")), invalid_argument);
  EXPECT_THROW(B64Decode(std::string_view("Zm9v\x7f")), invalid_argument);
  EXPECT_THROW(B64Decode(std::string_view("Zm9v\xc3\xa9")), invalid_argument);
}

}  // namespace tnc
