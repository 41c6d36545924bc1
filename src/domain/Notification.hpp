#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prowl::client::domain
{

using FormField = std::pair<std::string, std::string>;

struct Notification
{
  std::string apiKey;
  std::string application;
  std::optional<std::string> url;
  std::optional<std::string> event;
  std::optional<std::string> description;
  int priority{0};

  // Fields in the order the API documents them. Empty description and zero priority are
  // left out.
  std::vector<FormField> fields() const
  {
    std::vector<FormField> out;
    out.emplace_back("apikey", apiKey);
    out.emplace_back("application", application);
    if (url) out.emplace_back("url", *url);
    if (event) out.emplace_back("event", *event);
    if (description && !description->empty()) out.emplace_back("description", *description);
    if (priority != 0) out.emplace_back("priority", std::to_string(priority));
    return out;
  }
};

}  // namespace prowl::client::domain
