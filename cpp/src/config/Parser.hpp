#pragma once

#include <istream>
#include <string>

#include "config/Settings.hpp"

namespace fcs {

AppConfig parseConfigFile(const std::string& path);
AppConfig parseConfigStream(std::istream& input);
AppConfig parseConfigStream(std::istream& input, AppConfig defaults);

// "tws" or "replay", case-insensitive. Throws std::runtime_error otherwise.
std::string parseBroker(const std::string& token);

}  // namespace fcs
