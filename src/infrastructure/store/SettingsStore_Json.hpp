#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

#include "application/ports/ILogger.hpp"
#include "application/ports/ISettingsStore.hpp"

namespace prowl::client::infrastructure::store
{

// Settings file unreadable, malformed, or not writable.
class StoreError : public std::runtime_error
{
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// JSON object on disk, loaded on first access and rewritten in full after every set().
// Writes go to "<path>~" first and are renamed over <path>, so readers see either the old or
// the new file, never a partial one. No locking between processes.
class SettingsStore_Json final : public prowl::client::application::ports::ISettingsStore
{
 public:
  SettingsStore_Json(std::string path, prowl::client::application::ports::ILogger& log);

  nlohmann::json get(const std::string& key, const nlohmann::json& fallback = nullptr) override;

  void set(const std::string& key, nlohmann::json value) override;

  std::string temp_path() const { return path_ + "~"; }
  bool loaded() const { return values_.has_value(); }

 private:
  void load_values();
  void save_values();

  std::string path_;
  prowl::client::application::ports::ILogger& log_;

  // nullopt until the file has been read
  std::optional<nlohmann::json> values_;
};

}  // namespace prowl::client::infrastructure::store
