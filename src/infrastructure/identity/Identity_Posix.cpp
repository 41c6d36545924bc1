#include "infrastructure/identity/Identity_Posix.hpp"

#include <pwd.h>
#include <unistd.h>

#include <boost/asio/ip/host_name.hpp>
#include <cstdlib>

#include "domain/UserError.hpp"

namespace prowl::client::infrastructure::identity
{

namespace
{
constexpr const char* kUserEnv[] = {"LOGNAME", "USER", "LNAME", "USERNAME"};
}

std::string Identity_Posix::user_name() const
{
  for (const char* name : kUserEnv)
  {
    if (const char* v = std::getenv(name); v && *v) return v;
  }

  if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_name) return pw->pw_name;

  throw prowl::client::domain::UserError(
      "Cannot determine the current user name; use --application.");
}

std::string Identity_Posix::host_name() const
{
  return boost::asio::ip::host_name();
}

}  // namespace prowl::client::infrastructure::identity
