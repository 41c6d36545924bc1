#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace prowl::client::application::ports
{

// String-keyed map of JSON values that outlives the process.
struct ISettingsStore
{
  virtual ~ISettingsStore() = default;

  virtual nlohmann::json get(const std::string& key, const nlohmann::json& fallback = nullptr) = 0;

  virtual void set(const std::string& key, nlohmann::json value) = 0;
};

}  // namespace prowl::client::application::ports
