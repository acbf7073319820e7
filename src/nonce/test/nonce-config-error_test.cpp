#include "nonce-config-error.hpp"

#include <gtest/gtest.h>

#include "enum-string.hpp"

namespace tnc {

TEST(NonceConfigErrorTest, ValidLengths) {
  EXPECT_EQ(ValidateNonceLength(16), std::nullopt);
  EXPECT_EQ(ValidateNonceLength(32), std::nullopt);
  EXPECT_EQ(ValidateNonceLength(1024), std::nullopt);
}

TEST(NonceConfigErrorTest, TooShortCheckedFirst) {
  EXPECT_EQ(ValidateNonceLength(0), NonceConfigError::tooshort);
  EXPECT_EQ(ValidateNonceLength(12), NonceConfigError::tooshort);
  EXPECT_EQ(ValidateNonceLength(15), NonceConfigError::tooshort);
}

TEST(NonceConfigErrorTest, NotAligned) {
  EXPECT_EQ(ValidateNonceLength(17), NonceConfigError::notaligned);
  EXPECT_EQ(ValidateNonceLength(47), NonceConfigError::notaligned);
}

TEST(NonceConfigErrorTest, Constexpr) {
  static_assert(!ValidateNonceLength(20));
  static_assert(ValidateNonceLength(18) == NonceConfigError::notaligned);
}

TEST(NonceConfigErrorTest, Exception) {
  nonce_config_error tooShort(NonceConfigError::tooshort, 15);
  EXPECT_EQ(tooShort.code(), NonceConfigError::tooshort);
  EXPECT_STREQ(tooShort.what(), "Invalid nonce length 15: should be at least 16");

  nonce_config_error notAligned(NonceConfigError::notaligned, 17);
  EXPECT_EQ(notAligned.code(), NonceConfigError::notaligned);
  EXPECT_STREQ(notAligned.what(), "Invalid nonce length 17: should be a multiple of 4");
}

TEST(NonceConfigErrorTest, Names) {
  EXPECT_EQ(EnumToString(NonceConfigError::tooshort), "tooshort");
  EXPECT_EQ(EnumToString(NonceConfigError::notaligned), "notaligned");
}

}  // namespace tnc
