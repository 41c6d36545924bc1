#include "adapters/inbound/cli/CliApp.hpp"

#include <boost/filesystem/path.hpp>

#include "adapters/inbound/cli/CliParser.hpp"
#include "application/services/NotifyService.hpp"
#include "application/services/RequestComposer.hpp"
#include "domain/UserError.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/http/Notifier_Beast.hpp"
#include "infrastructure/identity/Identity_Posix.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "infrastructure/store/SettingsStore_Json.hpp"

namespace infra_cfg = prowl::client::infrastructure::config;
namespace infra_log = prowl::client::infrastructure::logging;
namespace app_srv = prowl::client::application::services;
using prowl::client::application::ports::LogLevel;

namespace prowl::client::adapters::cli
{

namespace
{
void report(std::ostream& err, const std::string& program, const std::string& msg)
{
  err << program << ": Error: " << msg << std::endl;
}
}  // namespace

std::string program_name(int argc, const char* const* argv)
{
  if (argc < 1 || !argv[0] || !*argv[0]) return "prowl";
  return boost::filesystem::path(argv[0]).filename().string();
}

int run(int argc, const char* const* argv, std::ostream& err)
{
  const std::string program = program_name(argc, argv);

  CliParser parser;
  domain::RawInvocation raw;
  try
  {
    raw = parser.parse(argc, argv);
  }
  catch (const CLI::Success& e)
  {
    return parser.exit(e);
  }
  catch (const CLI::ParseError& e)
  {
    report(err, program, e.what());
    return kExitError;
  }

  infra_cfg::Config_Toml cfg_impl;
  infra_log::Logger_Spdlog log_impl;

  try
  {
    const auto cfg = cfg_impl.load(infra_cfg::Config_Toml::default_path());
    log_impl.init(cfg);
    log_impl.app(LogLevel::debug, "Config file: " + cfg.configPath);

    const auto cmd = app_srv::RequestComposer{}.compose(raw);

    infrastructure::store::SettingsStore_Json store{cfg.store.path, log_impl};
    infrastructure::http::Notifier_Beast notifier{cfg.api, log_impl};
    infrastructure::identity::Identity_Posix identity;

    app_srv::NotifyService svc{store, notifier, identity, log_impl};
    svc.run(cmd);
  }
  catch (const domain::UserError& e)
  {
    log_impl.app(LogLevel::warn, e.what());
    report(err, program, e.what());
    return kExitError;
  }
  catch (const std::exception& e)
  {
    log_impl.app(LogLevel::err, e.what());
    report(err, program, e.what());
    return kExitError;
  }

  return kExitOk;
}

}  // namespace prowl::client::adapters::cli
