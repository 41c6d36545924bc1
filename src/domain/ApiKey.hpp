#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "shared/hex/Hex.hpp"

namespace prowl::client::domain
{

constexpr std::size_t kApiKeyLength = 40;
constexpr const char* kDefaultApiKeySetting = "default-api-key";

// Prowl keys are exactly 40 lowercase hex digits.
inline bool is_valid_api_key(std::string_view key)
{
  return key.size() == kApiKeyLength && shared::hex::is_lower_hex(key);
}

// Shows only the last 4 digits, for logs.
inline std::string mask_api_key(std::string_view key)
{
  if (key.size() <= 4) return std::string(key.size(), '*');
  return std::string(key.size() - 4, '*') + std::string(key.substr(key.size() - 4));
}

}  // namespace prowl::client::domain
