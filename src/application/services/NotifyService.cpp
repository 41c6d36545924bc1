#include "application/services/NotifyService.hpp"

#include <sstream>
#include <string>
#include <variant>

#include "application/services/RequestComposer.hpp"
#include "domain/ApiKey.hpp"
#include "domain/UserError.hpp"

using prowl::client::application::ports::LogLevel;
using prowl::client::domain::Notification;
using prowl::client::domain::NotificationDraft;
using prowl::client::domain::SetDefaultApiKey;
using prowl::client::domain::UserError;

namespace prowl::client::application::services
{

namespace
{
template <class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string describe(const Notification& n)
{
  std::ostringstream oss;
  oss << "apikey=" << domain::mask_api_key(n.apiKey) << " application=" << n.application;
  if (n.url) oss << " url=" << *n.url;
  if (n.event) oss << " event=" << *n.event;
  if (n.description) oss << " description.len=" << n.description->size();
  if (n.priority) oss << " priority=" << n.priority;
  return oss.str();
}
}  // namespace

void NotifyService::run(const domain::Command& cmd)
{
  std::visit(overloaded{[this](const SetDefaultApiKey& c) { set_default_api_key(c); },
                        [this](const NotificationDraft& d) { send(d); }},
             cmd);
}

void NotifyService::set_default_api_key(const SetDefaultApiKey& cmd)
{
  store.set(domain::kDefaultApiKeySetting, cmd.apiKey);
  log.app(LogLevel::info, "Default API key set to " + domain::mask_api_key(cmd.apiKey));
}

Notification NotifyService::resolve(const NotificationDraft& draft)
{
  Notification n;

  if (draft.apiKey)
  {
    n.apiKey = *draft.apiKey;
  }
  else
  {
    const auto stored = store.get(domain::kDefaultApiKeySetting);
    if (stored.is_null())
      throw UserError("--api-key is mandatory because no default API key has been set.");
    if (!stored.is_string()) throw UserError("Invalid API key specified.");

    n.apiKey = stored.get<std::string>();
    log.app(LogLevel::debug, "Using default API key from settings");
  }
  RequestComposer::require_valid_api_key(n.apiKey);

  if (draft.application)
    n.application = *draft.application;
  else
    n.application = identity.user_name() + "@" + identity.host_name();

  n.url = draft.url;
  n.event = draft.event;
  n.description = draft.description;
  n.priority = draft.priority;
  return n;
}

void NotifyService::send(const NotificationDraft& draft)
{
  const Notification n = resolve(draft);

  log.app(LogLevel::info, "Sending notification: " + describe(n));

  const auto result = notifier.send(n);
  log.app(LogLevel::debug, "Server replied with status " + std::to_string(result.status));

  if (!result.ok())
  {
    log.app(LogLevel::err, "Server rejected notification: " + result.body);
    throw UserError("Error received from server: " + result.body);
  }
}

}  // namespace prowl::client::application::services
