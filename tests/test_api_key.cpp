#include <gtest/gtest.h>

#include <string>

#include "domain/ApiKey.hpp"

using prowl::client::domain::is_valid_api_key;
using prowl::client::domain::mask_api_key;

TEST(ApiKey, AcceptsFortyLowercaseHexDigits)
{
  EXPECT_TRUE(is_valid_api_key("0123456789abcdef0123456789abcdef01234567"));
  EXPECT_TRUE(is_valid_api_key(std::string(40, 'f')));
  EXPECT_TRUE(is_valid_api_key(std::string(40, '0')));
}

TEST(ApiKey, AcceptsEveryHexDigitInEveryPosition)
{
  const std::string digits = "0123456789abcdef";
  for (std::size_t pos = 0; pos < 40; ++pos)
  {
    for (char d : digits)
    {
      std::string key(40, 'a');
      key[pos] = d;
      EXPECT_TRUE(is_valid_api_key(key)) << key;
    }
  }
}

TEST(ApiKey, RejectsWrongLength)
{
  EXPECT_FALSE(is_valid_api_key(""));
  EXPECT_FALSE(is_valid_api_key(std::string(39, 'a')));
  EXPECT_FALSE(is_valid_api_key(std::string(41, 'a')));
  EXPECT_FALSE(is_valid_api_key(std::string(80, 'a')));
}

TEST(ApiKey, RejectsUppercaseAndNonHex)
{
  std::string key(40, 'a');
  for (char bad : {'A', 'F', 'g', 'z', ' ', '-', '\n', 'x'})
  {
    key[17] = bad;
    EXPECT_FALSE(is_valid_api_key(key)) << "char: " << bad;
  }
}

TEST(ApiKey, MaskKeepsLastFourDigits)
{
  EXPECT_EQ(mask_api_key("0123456789abcdef0123456789abcdef01234567"),
            std::string(36, '*') + "4567");
  EXPECT_EQ(mask_api_key("abc"), "***");
}
