#include "infrastructure/store/SettingsStore_Json.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fstream>
#include <iterator>
#include <utility>

namespace fs = boost::filesystem;
using prowl::client::application::ports::LogLevel;

namespace prowl::client::infrastructure::store
{

SettingsStore_Json::SettingsStore_Json(std::string path,
                                       prowl::client::application::ports::ILogger& log)
    : path_(std::move(path)), log_(log)
{
}

// -------------------- load --------------------
void SettingsStore_Json::load_values()
{
  if (values_) return;

  // "~" survives only when no home directory could be found; never create "./~/..."
  if (path_ == "~" || path_.rfind("~/", 0) == 0)
    throw StoreError("Cannot resolve home directory for settings file " + path_);

  const fs::path path{path_};
  boost::system::error_code ec;
  const bool present = fs::exists(path, ec);
  if (ec) throw StoreError("Cannot access settings file " + path_ + ": " + ec.message());

  if (!present)
  {
    log_.app(LogLevel::debug, "No settings file at " + path_ + ", starting empty");
    values_ = nlohmann::json::object();
    return;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) throw StoreError("Cannot read settings file " + path_);
  const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) throw StoreError("Cannot read settings file " + path_);

  nlohmann::json parsed;
  try
  {
    parsed = nlohmann::json::parse(text);
  }
  catch (const nlohmann::json::parse_error& e)
  {
    throw StoreError("Malformed settings file " + path_ + ": " + e.what());
  }

  if (!parsed.is_object())
    throw StoreError("Settings file " + path_ + " does not contain a JSON object");

  values_ = std::move(parsed);
  log_.app(LogLevel::debug, "Loaded settings from " + path_);
}

// -------------------- save --------------------
void SettingsStore_Json::save_values()
{
  if (!values_) return;

  const fs::path target{path_};
  const fs::path temp{temp_path()};
  boost::system::error_code ec;

  if (target.has_parent_path())
  {
    fs::create_directories(target.parent_path(), ec);
    if (ec)
      throw StoreError("Cannot create directory " + target.parent_path().string() + ": " +
                       ec.message());
  }

  {
    std::ofstream out(temp.string(), std::ios::binary | std::ios::trunc);
    if (!out) throw StoreError("Cannot write settings file " + temp.string());
    out << values_->dump();
    out.flush();
    if (!out) throw StoreError("Cannot write settings file " + temp.string());
  }

  fs::rename(temp, target, ec);
  if (ec) throw StoreError("Cannot replace settings file " + path_ + ": " + ec.message());

  log_.app(LogLevel::debug, "Saved settings to " + path_);
}

// -------------------- public API --------------------
nlohmann::json SettingsStore_Json::get(const std::string& key, const nlohmann::json& fallback)
{
  load_values();

  const auto it = values_->find(key);
  if (it == values_->end()) return fallback;
  return *it;
}

void SettingsStore_Json::set(const std::string& key, nlohmann::json value)
{
  load_values();

  (*values_)[key] = std::move(value);

  save_values();
}

}  // namespace prowl::client::infrastructure::store
