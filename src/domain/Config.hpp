#pragma once

#include <string>

namespace prowl::client::domain
{

struct Config
{
  struct Api
  {
    std::string host{"api.prowlapp.com"};
    std::string port{"443"};
    std::string target{"/publicapi/add"};
  } api;

  struct Store
  {
    std::string path{"~/opt/etc/prowl.json"};
  } store;

  // Console / Logs
  bool showConsole{false};
  bool saveLog{false};
  std::string logsDir{"~/opt/var/log"};
  std::string appLogFilename{"prowl.log"};
  std::string logLevel{"info"};
  std::string configPath{"~/opt/etc/prowl.toml"};
};

}  // namespace prowl::client::domain
