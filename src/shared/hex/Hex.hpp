#pragma once

#include <string_view>

namespace prowl::client::shared::hex
{

// -----------------------------------------------------------------------------
// is_lower_hex_digit(c)
// -----------------------------------------------------------------------------
constexpr bool is_lower_hex_digit(char c)
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

// -----------------------------------------------------------------------------
// is_lower_hex(text)
//  - true for a non-empty string made only of [0-9a-f]
// -----------------------------------------------------------------------------
constexpr bool is_lower_hex(std::string_view text)
{
  if (text.empty()) return false;
  for (const char c : text)
  {
    if (!is_lower_hex_digit(c)) return false;
  }
  return true;
}

}  // namespace prowl::client::shared::hex
