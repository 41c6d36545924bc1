#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace prowl::client::infrastructure::config
{

class Config_Toml : public prowl::client::application::ports::IConfigProvider
{
 public:
  // Missing or unparsable file: built-in defaults. The file is never written.
  prowl::client::domain::Config load(const std::string& path) override;

  // "~" or "~/..." -> $HOME (or the password database home) prefix.
  static std::string expand_user(const std::string& path);

  // $PROWL_CONFIG if set, else ~/opt/etc/prowl.toml
  static std::string default_path();

 private:
  static void finalize(prowl::client::domain::Config& c);
};

}  // namespace prowl::client::infrastructure::config
