#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prowl::client::domain
{

constexpr int kMinPriority = -2;
constexpr int kMaxPriority = 2;

// What the command line said, before any interpretation.
struct RawInvocation
{
  std::vector<std::string> positionals;
  std::optional<std::string> application;
  std::optional<std::string> url;
  std::optional<std::string> apiKey;
  std::optional<std::string> setApiKey;
  int priority{0};
};

// How many free-form positionals were given; drives the event/description mapping.
enum class PositionalShape
{
  none,
  one,
  two
};

struct SetDefaultApiKey
{
  std::string apiKey;
};

// A notification whose application and API key may still need defaults.
struct NotificationDraft
{
  std::optional<std::string> event;
  std::string description;
  std::optional<std::string> application;
  std::optional<std::string> url;
  std::optional<std::string> apiKey;
  int priority{0};
};

using Command = std::variant<SetDefaultApiKey, NotificationDraft>;

}  // namespace prowl::client::domain
