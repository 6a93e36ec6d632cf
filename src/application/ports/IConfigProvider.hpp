#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace uoe::arp::application::ports {

// Source of Settings. A missing or unreadable source yields defaults, and
// implementations may persist those defaults for the next run.
struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual uoe::arp::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace uoe::arp::application::ports
