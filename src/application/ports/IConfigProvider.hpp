#pragma once
#include <string>
#include "domain/Config.hpp"

namespace prowl::client::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual prowl::client::domain::Config load(const std::string& path) = 0;
};

} // namespace prowl::client::application::ports
