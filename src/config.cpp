#include "config.hpp"
#include <fstream>
#include <iostream>

namespace webscout {

nlohmann::json PrebuiltPrompt::to_json() const {
    return {{"id", id}, {"label", label}, {"message", message}, {"prefill", prefill}};
}

Config Config::make_default() {
    Config c;
    c.prebuilt_prompts.push_back(PrebuiltPrompt{
        "annual-report",
        "Find an annual report",
        "Find the most recent annual report for ",
        true
    });
    return c;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c = make_default();

    if (j.contains("agent")) {
        auto& ag = j["agent"];
        c.model = ag.value("model", c.model);
        c.max_tool_calls = ag.value("max_tool_calls", c.max_tool_calls);
        c.temperature = ag.value("temperature", c.temperature);
        if (ag.contains("max_tokens") && ag["max_tokens"].is_number_integer()) {
            c.max_tokens = ag["max_tokens"].get<int>();
        }
    }

    c.log_dir = j.value("log_dir", c.log_dir);

    if (j.contains("provider")) {
        auto& pv = j["provider"];
        c.provider.api_key = pv.value("api_key", "");
        c.provider.api_base = pv.value("api_base", c.provider.api_base);
        c.provider.timeout_sec = pv.value("timeout_sec", c.provider.timeout_sec);
    }

    if (j.contains("bright_data")) {
        auto& bd = j["bright_data"];
        c.bright_data.api_token = bd.value("api_token", "");
        c.bright_data.api_host = bd.value("api_host", c.bright_data.api_host);
        c.bright_data.serp_zone = bd.value("serp_zone", c.bright_data.serp_zone);
        c.bright_data.web_unlocker_zone = bd.value("web_unlocker_zone", c.bright_data.web_unlocker_zone);
        c.bright_data.search_timeout_sec = bd.value("search_timeout_sec", c.bright_data.search_timeout_sec);
        c.bright_data.scrape_timeout_sec = bd.value("scrape_timeout_sec", c.bright_data.scrape_timeout_sec);
        c.bright_data.download_timeout_sec = bd.value("download_timeout_sec", c.bright_data.download_timeout_sec);
    }

    if (j.contains("download")) {
        c.download.base_dir = j["download"].value("base_dir", c.download.base_dir);
    }

    if (j.contains("http")) {
        auto& hc = j["http"];
        c.http_channel.host = hc.value("host", c.http_channel.host);
        c.http_channel.port = hc.value("port", c.http_channel.port);
        c.http_channel.api_key = hc.value("api_key", "");
        c.http_channel.rate_limit_rpm = hc.value("rate_limit_rpm", 0);
    }

    if (j.contains("prebuilt_prompts") && j["prebuilt_prompts"].is_array()) {
        c.prebuilt_prompts.clear();
        for (auto& p : j["prebuilt_prompts"]) {
            PrebuiltPrompt pp;
            pp.id = p.at("id").get<std::string>();
            pp.label = p.at("label").get<std::string>();
            pp.message = p.at("message").get<std::string>();
            pp.prefill = p.value("prefill", false);
            c.prebuilt_prompts.push_back(std::move(pp));
        }
    }

    return c;
}

void Config::apply_env() {
    provider.api_key = env_or("OPENAI_API_KEY", provider.api_key);
    provider.api_base = env_or("OPENAI_BASE_URL", provider.api_base);
    bright_data.api_token = env_or("BRIGHT_DATA_API_TOKEN", bright_data.api_token);
}

Config Config::load(const std::string& path) {
    Config c;
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        c = make_default();
    } else {
        try {
            nlohmann::json j = nlohmann::json::parse(f);
            c = from_json(j);
        } catch (const std::exception& e) {
            std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
            c = make_default();
        }
    }
    c.apply_env();
    return c;
}

ChatRuntime resolve_chat_runtime(const Config& cfg) {
    ChatRuntime rt;
    rt.model = cfg.model;
    if (cfg.max_tokens && *cfg.max_tokens > 0) rt.max_tokens = cfg.max_tokens;
    rt.auth_mode = cfg.provider.api_key.empty() ? "none" : "api_key";
    rt.temperature = cfg.temperature;
    rt.max_tool_calls = cfg.max_tool_calls;
    return rt;
}

} // namespace webscout
