#pragma once

#include <string>
#include <vector>

#include "domain/Notification.hpp"

namespace prowl::client::infrastructure::http
{

// name=value pairs joined with '&', in the given order. Names and values are percent-escaped
// by libcurl. Throws std::runtime_error if no curl handle can be created.
std::string form_body(const std::vector<prowl::client::domain::FormField>& fields);

}  // namespace prowl::client::infrastructure::http
