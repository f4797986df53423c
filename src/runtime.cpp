#include "runtime.hpp"
#include "tools/bright_data.hpp"
#include <iostream>

namespace webscout {

Runtime::Runtime(Config cfg)
    : config(std::move(cfg)),
      provider(config.provider),
      audit(config.log_dir),
      agent(config, tools, provider, audit) {
    auto bright_data = std::make_shared<const BrightDataTools>(
        config.bright_data, config.download, make_bright_data_transport(config.bright_data));
    register_bright_data_tools(tools, bright_data);
}

void print_missing_credentials(const Config& cfg) {
    if (cfg.provider.api_key.empty()) {
        std::cerr << "[warn] No provider API key (OPENAI_API_KEY); requests are sent without auth\n";
    }
    if (cfg.bright_data.api_token.empty()) {
        std::cerr << "[warn] No Bright Data token (BRIGHT_DATA_API_TOKEN); tool calls will fail\n";
    }
}

} // namespace webscout
