#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/filesystem.hpp>
#include <vector>

namespace fs = boost::filesystem;
using prowl::client::application::ports::LogLevel;

namespace prowl::client::infrastructure::logging {

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts our app-level enum (ports::LogLevel) to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

LogLevel Logger_Spdlog::parse_level(const std::string& name) {
  if (name == "trace")    return LogLevel::trace;
  if (name == "debug")    return LogLevel::debug;
  if (name == "info")     return LogLevel::info;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "err" || name == "error")    return LogLevel::err;
  if (name == "critical") return LogLevel::critical;
  if (name == "off")      return LogLevel::off;
  return LogLevel::info;
}

// -------------------------------------------------------------------------------------------------
// configure_console_colors_
//  - Per-level ANSI colors on the stderr sink only.
// -------------------------------------------------------------------------------------------------
static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stderr_sink_mt>& sink) {
  const std::string BGRAY   = "\x1b[90m"; // bright black (gray)
  const std::string CYAN    = "\x1b[36m";
  const std::string GREEN   = "\x1b[32m";
  const std::string YELLOW  = "\x1b[33m";
  const std::string RED     = "\x1b[31m";
  const std::string MAGENTA = "\x1b[35m";

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}

// -------------------------------------------------------------------------------------------------
// init(config)
//  - Optional rotating file sink (config.saveLog), no color.
//  - Optional colored stderr sink (config.showConsole). stdout stays clean for the user.
//  - With neither enabled the logger has no sinks and every call is a no-op.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const prowl::client::domain::Config& c) {
  // Re-init safety: drop the old named logger if it exists
  if (auto prev = spdlog::get("app")) spdlog::drop(prev->name());

  std::vector<spdlog::sink_ptr> sinks;

  if (c.saveLog) {
    const fs::path dir     = c.logsDir.empty() ? fs::path{"logs"} : fs::path{c.logsDir};
    const fs::path appPath = dir / (c.appLogFilename.empty() ? "prowl.log" : c.appLogFilename);

    boost::system::error_code ec;
    fs::create_directories(dir, ec);

    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), 1024 * 1024, 3);
    file->set_level(spdlog::level::trace);
    sinks.push_back(file);
  }

  if (c.showConsole) {
    auto console = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    configure_console_colors_(console);
    console->set_level(spdlog::level::trace);
    sinks.push_back(console);
  }

  app_ = std::make_shared<spdlog::logger>("app", sinks.begin(), sinks.end());
  spdlog::register_logger(app_);

  // ONLY console renders colors between %^ and %$.
  app_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v");
  app_->set_level(map_level(parse_level(c.logLevel)));

  // short-lived process: flush every line so nothing is lost on exit(2)
  app_->flush_on(spdlog::level::trace);
}

// -------------------------------------------------------------------------------------------------
// app(level, msg)
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

} // namespace prowl::client::infrastructure::logging
