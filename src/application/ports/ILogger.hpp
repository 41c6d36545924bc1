#pragma once

#include <string>

#include "domain/Config.hpp"

namespace prowl::client::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const prowl::client::domain::Config& c) = 0;
  virtual void app(LogLevel level, const std::string& msg) = 0;
};

}  // namespace prowl::client::application::ports
