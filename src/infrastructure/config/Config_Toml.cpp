#include "infrastructure/config/Config_Toml.hpp"

#include <pwd.h>
#include <unistd.h>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <toml++/toml.hpp>

using prowl::client::domain::Config;
namespace fs = boost::filesystem;

namespace prowl::client::infrastructure::config
{

namespace
{
constexpr const char* kConfigEnv = "PROWL_CONFIG";
constexpr const char* kDefaultConfigPath = "~/opt/etc/prowl.toml";

std::string home_dir()
{
  if (const char* h = std::getenv("HOME"); h && *h) return h;
  if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
  return {};
}
}  // namespace

std::string Config_Toml::expand_user(const std::string& path)
{
  if (path.empty() || path[0] != '~') return path;
  if (path.size() > 1 && path[1] != '/') return path;  // ~otheruser is left alone

  const auto home = home_dir();
  if (home.empty()) return path;
  return home + path.substr(1);
}

std::string Config_Toml::default_path()
{
  if (const char* p = std::getenv(kConfigEnv); p && *p) return p;
  return kDefaultConfigPath;
}

void Config_Toml::finalize(Config& c)
{
  const Config defaults;

  if (c.api.host.empty()) c.api.host = defaults.api.host;
  if (c.api.port.empty()) c.api.port = defaults.api.port;
  if (c.api.target.empty()) c.api.target = defaults.api.target;
  if (c.store.path.empty()) c.store.path = defaults.store.path;
  if (c.logsDir.empty()) c.logsDir = defaults.logsDir;
  if (c.appLogFilename.empty()) c.appLogFilename = defaults.appLogFilename;
  if (c.logLevel.empty()) c.logLevel = defaults.logLevel;

  c.configPath = expand_user(c.configPath);
  c.store.path = expand_user(c.store.path);
  c.logsDir = expand_user(c.logsDir);
}

Config Config_Toml::load(const std::string& configPath)
{
  Config c;
  c.configPath = configPath;
  const fs::path path{expand_user(configPath)};

  if (!fs::exists(path))
  {
    finalize(c);
    return c;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // unreadable config is not fatal; run with defaults
    finalize(c);
    return c;
  }

  // ---------------------------
  // [api]
  // ---------------------------
  if (auto api = tbl["api"].as_table())
  {
    if (auto v = (*api)["host"].value<std::string>()) c.api.host = *v;
    if (auto v = (*api)["target"].value<std::string>()) c.api.target = *v;

    // port may be written either as "443" or 443
    if (auto v = (*api)["port"].value<std::string>())
      c.api.port = *v;
    else if (auto n = (*api)["port"].value<int64_t>())
      c.api.port = std::to_string(*n);
  }

  // ---------------------------
  // [store]
  // ---------------------------
  if (auto st = tbl["store"].as_table())
  {
    if (auto v = (*st)["path"].value<std::string>()) c.store.path = *v;
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) c.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) c.saveLog = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) c.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) c.appLogFilename = *v;
    if (auto v = (*log)["level"].value<std::string>()) c.logLevel = *v;
  }

  finalize(c);
  return c;
}

}  // namespace prowl::client::infrastructure::config
