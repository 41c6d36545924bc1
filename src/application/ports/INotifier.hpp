#pragma once

#include <string>

#include "domain/Notification.hpp"

namespace prowl::client::application::ports
{

struct NotifyResult
{
  unsigned status{0};
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

struct INotifier
{
  virtual ~INotifier() = default;

  // One round-trip to the remote API. Transport failures throw.
  virtual NotifyResult send(const prowl::client::domain::Notification& n) = 0;
};

}  // namespace prowl::client::application::ports
