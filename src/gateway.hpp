#pragma once
#include <string>

namespace webscout {

// HTTP front-end. Empty host / port <= 0 fall back to the config file.
int cmd_serve(const std::string& config_path, const std::string& host, int port);

} // namespace webscout
