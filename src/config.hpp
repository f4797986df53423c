#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace webscout {

struct ProviderConfig {
    std::string api_key;
    std::string api_base = "https://api.openai.com/v1";
    int timeout_sec = 120;
};

struct BrightDataConfig {
    std::string api_token;
    std::string api_host = "api.brightdata.com";
    std::string serp_zone = "serp_api1";
    std::string web_unlocker_zone = "web_unlocker1";
    int search_timeout_sec = 30;
    int scrape_timeout_sec = 60;
    int download_timeout_sec = 90;
};

struct DownloadConfig {
    std::string base_dir = "downloads";
};

struct HTTPChannelConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string api_key;       // Optional Bearer token auth
    int rate_limit_rpm = 0;    // 0 = unlimited, per client address
};

struct PrebuiltPrompt {
    std::string id;
    std::string label;
    std::string message;
    bool prefill = false;      // true = put in the input box, false = send directly

    nlohmann::json to_json() const;
};

struct Config {
    // agent
    std::string model = "gpt-4.1";
    int max_tool_calls = 50;
    double temperature = 0.2;
    std::optional<int> max_tokens;

    std::string log_dir = "logs";

    ProviderConfig provider;
    BrightDataConfig bright_data;
    DownloadConfig download;
    HTTPChannelConfig http_channel;
    std::vector<PrebuiltPrompt> prebuilt_prompts;

    std::string download_dir() const { return expand_path(download.base_dir); }

    // OPENAI_API_KEY, OPENAI_BASE_URL, BRIGHT_DATA_API_TOKEN win over the file.
    void apply_env();

    static Config make_default();
    static Config load(const std::string& path);
    static Config from_json(const nlohmann::json& j);
};

// Settings a single agent run uses, resolved once at its start.
struct ChatRuntime {
    std::string model;
    std::optional<int> max_tokens;
    std::string auth_mode;   // "api_key" or "none"
    double temperature = 0.2;
    int max_tool_calls = 50;
};

ChatRuntime resolve_chat_runtime(const Config& cfg);

} // namespace webscout
