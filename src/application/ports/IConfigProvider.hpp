#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace scanbridge::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual scanbridge::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace scanbridge::application::ports
