#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace hookline::proxy::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual hookline::proxy::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace hookline::proxy::application::ports
