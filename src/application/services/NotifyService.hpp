#pragma once

#include "application/ports/IIdentity.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/INotifier.hpp"
#include "application/ports/ISettingsStore.hpp"
#include "domain/Invocation.hpp"
#include "domain/Notification.hpp"

namespace prowl::client::application::services
{

// Carries out a composed Command: one store write, or one notification sent.
struct NotifyService
{
  ports::ISettingsStore& store;
  ports::INotifier& notifier;
  ports::IIdentity& identity;
  ports::ILogger& log;

  void run(const domain::Command& cmd);

  void set_default_api_key(const domain::SetDefaultApiKey& cmd);

  void send(const domain::NotificationDraft& draft);

  // Fills in the stored API key and the <user>@<host> application.
  domain::Notification resolve(const domain::NotificationDraft& draft);
};

}  // namespace prowl::client::application::services
