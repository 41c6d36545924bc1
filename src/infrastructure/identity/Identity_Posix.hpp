#pragma once

#include <string>

#include "application/ports/IIdentity.hpp"

namespace prowl::client::infrastructure::identity
{

class Identity_Posix final : public prowl::client::application::ports::IIdentity
{
 public:
  // LOGNAME, USER, LNAME, USERNAME, then the password database.
  std::string user_name() const override;

  std::string host_name() const override;
};

}  // namespace prowl::client::infrastructure::identity
