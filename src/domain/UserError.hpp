#pragma once

#include <stdexcept>
#include <string>

namespace prowl::client::domain
{

// Raised for anything the user can fix: bad arguments, missing key, rejected request.
class UserError : public std::runtime_error
{
 public:
  explicit UserError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace prowl::client::domain
