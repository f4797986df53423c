#pragma once
#include "config.hpp"

namespace webscout {
int cmd_status(const std::string& config_path);
std::string mask_secret(const std::string& secret);
} // namespace webscout
