#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

#include "application/ports/ILogger.hpp"
#include "domain/Config.hpp"

namespace prowl::client::infrastructure::logging
{

class Logger_Spdlog final : public prowl::client::application::ports::ILogger
{
 public:
  void init(const prowl::client::domain::Config& c) override;

  void app(prowl::client::application::ports::LogLevel level, const std::string& msg) override;

  // "trace" .. "off"; unknown names read as info
  static prowl::client::application::ports::LogLevel parse_level(const std::string& name);

 private:
  std::shared_ptr<spdlog::logger> app_;

  // Helpers
  static spdlog::level::level_enum map_level(prowl::client::application::ports::LogLevel l);
};

}  // namespace prowl::client::infrastructure::logging
