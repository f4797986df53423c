#include "status.hpp"
#include "runtime.hpp"
#include <iostream>

namespace webscout {

std::string mask_secret(const std::string& secret) {
    if (secret.empty()) return "(not set)";
    if (secret.size() <= 8) return "****";
    return secret.substr(0, 4) + "..." + secret.substr(secret.size() - 4);
}

int cmd_status(const std::string& config_path) {
    Runtime rt(Config::load(config_path));
    const Config& cfg = rt.config;
    auto run = resolve_chat_runtime(cfg);

    std::cout << "=== webscout status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Model        : " << run.model << "\n";
    std::cout << "Max tokens   : " << (run.max_tokens ? std::to_string(*run.max_tokens) : "(provider default)") << "\n";
    std::cout << "Temperature  : " << run.temperature << "\n";
    std::cout << "Tool budget  : " << run.max_tool_calls << "\n";
    std::cout << "Provider     : " << cfg.provider.api_base << "\n";
    std::cout << "Auth mode    : " << run.auth_mode << "\n";
    std::cout << "API key      : " << mask_secret(cfg.provider.api_key) << "\n";
    std::cout << "Bright Data  : " << cfg.bright_data.api_host << " (serp " << cfg.bright_data.serp_zone
              << ", unlocker " << cfg.bright_data.web_unlocker_zone << ")\n";
    std::cout << "BD token     : " << mask_secret(cfg.bright_data.api_token) << "\n";
    std::cout << "Downloads    : " << cfg.download_dir() << "\n";
    std::cout << "Audit log    : " << (rt.audit.enabled() ? rt.audit.file_path() : "(disabled)") << "\n";
    std::cout << "HTTP         : " << cfg.http_channel.host << ":" << cfg.http_channel.port
              << (cfg.http_channel.api_key.empty() ? "" : " (bearer auth)");
    if (cfg.http_channel.rate_limit_rpm > 0) std::cout << ", " << cfg.http_channel.rate_limit_rpm << " req/min";
    std::cout << "\n";

    std::cout << "Tools (v" << TOOL_SCHEMA_VERSION << ") : ";
    bool first = true;
    for (auto& name : rt.tools.tool_names()) {
        if (!first) std::cout << ", ";
        std::cout << name;
        first = false;
    }
    std::cout << "\n";
    std::cout << "Prompts      : " << cfg.prebuilt_prompts.size() << " prebuilt\n";
    return 0;
}

} // namespace webscout
