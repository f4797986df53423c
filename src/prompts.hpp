#pragma once
#include <string>

namespace webscout {

std::string build_system_prompt();

} // namespace webscout
