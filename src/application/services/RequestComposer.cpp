#include "application/services/RequestComposer.hpp"

#include "domain/ApiKey.hpp"
#include "domain/UserError.hpp"

using prowl::client::domain::Command;
using prowl::client::domain::NotificationDraft;
using prowl::client::domain::PositionalShape;
using prowl::client::domain::RawInvocation;
using prowl::client::domain::SetDefaultApiKey;
using prowl::client::domain::UserError;

namespace prowl::client::application::services
{

namespace
{
// Which positional feeds which field; -1 means the field is not taken from a positional.
struct PositionalMapping
{
  PositionalShape shape;
  int event;
  int description;
};

constexpr PositionalMapping kPositionalTable[] = {
    {PositionalShape::none, -1, -1},
    {PositionalShape::one, -1, 0},
    {PositionalShape::two, 0, 1},
};

const PositionalMapping& mapping_for(PositionalShape shape)
{
  for (const auto& m : kPositionalTable)
  {
    if (m.shape == shape) return m;
  }
  return kPositionalTable[0];
}
}  // namespace

PositionalShape RequestComposer::classify(const std::vector<std::string>& positionals)
{
  switch (positionals.size())
  {
    case 0:
      return PositionalShape::none;
    case 1:
      return PositionalShape::one;
    case 2:
      return PositionalShape::two;
    default:
      throw UserError("Too many arguments: expected at most <event> and <description>.");
  }
}

std::string RequestComposer::api_argument(std::string value)
{
  if (value == "0") value += ' ';
  return value;
}

void RequestComposer::require_valid_api_key(const std::string& key)
{
  if (!domain::is_valid_api_key(key)) throw UserError("Invalid API key specified.");
}

Command RequestComposer::compose(const RawInvocation& in) const
{
  // keys are validated as soon as they are parsed, like any other typed option
  if (in.setApiKey) require_valid_api_key(*in.setApiKey);
  if (in.apiKey) require_valid_api_key(*in.apiKey);

  if (in.setApiKey) return compose_set_key(in);
  return compose_notification(in);
}

SetDefaultApiKey RequestComposer::compose_set_key(const RawInvocation& in)
{
  const bool others = !in.positionals.empty() || in.application || in.url || in.apiKey ||
                      in.priority != 0;
  if (others) throw UserError("Cannot use --set-api-key with any other arguments or options.");

  return SetDefaultApiKey{*in.setApiKey};
}

NotificationDraft RequestComposer::compose_notification(const RawInvocation& in)
{
  const auto& m = mapping_for(classify(in.positionals));

  NotificationDraft d;
  if (m.event >= 0) d.event = api_argument(in.positionals[m.event]);

  if (m.description >= 0)
  {
    d.description = api_argument(in.positionals[m.description]);
  }
  else if (in.url)
  {
    d.description = *in.url;
  }
  else
  {
    throw UserError("Required argument `description' missing.");
  }

  if (in.priority < domain::kMinPriority || in.priority > domain::kMaxPriority)
    throw UserError("Invalid value for --priority: " + std::to_string(in.priority));

  d.application = in.application;
  d.url = in.url;
  d.apiKey = in.apiKey;
  d.priority = in.priority;
  return d;
}

}  // namespace prowl::client::application::services
