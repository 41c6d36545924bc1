#pragma once

#include <string>
#include <vector>

#include "domain/Invocation.hpp"

namespace prowl::client::application::services
{

// Turns loosely structured command-line input into exactly one Command. Pure: no I/O, so every
// rule can be checked before the store or the network is touched.
class RequestComposer
{
 public:
  // Throws domain::UserError when the invocation is contradictory or incomplete.
  domain::Command compose(const domain::RawInvocation& in) const;

  static domain::PositionalShape classify(const std::vector<std::string>& positionals);

  // The API rejects a bare "0" as a field value; "0 " goes through.
  static std::string api_argument(std::string value);

  static void require_valid_api_key(const std::string& key);

 private:
  static domain::SetDefaultApiKey compose_set_key(const domain::RawInvocation& in);
  static domain::NotificationDraft compose_notification(const domain::RawInvocation& in);
};

}  // namespace prowl::client::application::services
