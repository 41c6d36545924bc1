#pragma once

#include <string>

namespace prowl::client::application::ports
{

struct IIdentity
{
  virtual ~IIdentity() = default;
  virtual std::string user_name() const = 0;
  virtual std::string host_name() const = 0;
};

}  // namespace prowl::client::application::ports
