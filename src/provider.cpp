#include "provider.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <iostream>
#include <stdexcept>

namespace webscout {

BaseUrl parse_base_url(const std::string& url) {
    BaseUrl u;
    size_t pos = 0;
    if (starts_with(url, "https://")) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (starts_with(url, "http://")) {
        u.scheme = "http"; pos = 7; u.port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path_prefix = url.substr(slash);
        while (!u.path_prefix.empty() && u.path_prefix.back() == '/') u.path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        u.host = host_port.substr(0, colon);
        std::string port = host_port.substr(colon + 1);
        try {
            size_t used = 0;
            u.port = std::stoi(port, &used);
            if (used != port.size() || u.port <= 0 || u.port > 65535) throw std::out_of_range(port);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid port '" + port + "' in provider.api_base: " + url);
        }
    } else if (!host_port.empty()) {
        u.host = host_port;
    }
    return u;
}

Provider::Provider(const ProviderConfig& cfg) : config_(cfg), url_(parse_base_url(cfg.api_base)) {
    base_url_ = url_.scheme + "://" + url_.host + ":" + std::to_string(url_.port);
}

nlohmann::json build_chat_request(const std::vector<TranscriptEntry>& transcript,
                                  const nlohmann::json& tools_spec,
                                  const ChatOptions& options) {
    nlohmann::json body;
    body["model"] = options.model;
    body["temperature"] = options.temperature;
    if (options.max_tokens) body["max_tokens"] = *options.max_tokens;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& e : transcript) {
        msgs.push_back(e.to_json());
    }

    if (tools_spec.is_array() && !tools_spec.empty()) {
        body["tools"] = tools_spec;
    }
    return body;
}

ProviderResponse parse_chat_response(const std::string& body) {
    ProviderResponse resp;
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            throw std::runtime_error("no choices in response");
        }
        auto& choice = j["choices"][0];
        if (!choice.contains("message")) throw std::runtime_error("choice without message");

        resp.turn = to_assistant_turn(TranscriptEntry::from_json(choice["message"]));

        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            resp.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (j.contains("usage") && j["usage"].is_object()) {
            auto& usage = j["usage"];
            if (usage.contains("prompt_tokens") && usage["prompt_tokens"].is_number_integer()) {
                resp.prompt_tokens = usage["prompt_tokens"].get<int>();
            }
            if (usage.contains("completion_tokens") && usage["completion_tokens"].is_number_integer()) {
                resp.completion_tokens = usage["completion_tokens"].get<int>();
            }
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse provider response: ") + e.what());
    }
    return resp;
}

ProviderResponse Provider::chat(const std::vector<TranscriptEntry>& transcript,
                                const nlohmann::json& tools_spec,
                                const ChatOptions& options) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(30);
    cli.set_read_timeout(config_.timeout_sec);

    std::string path = url_.path_prefix + "/chat/completions";
    std::string payload = dump_json(build_chat_request(transcript, tools_spec, options));

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        throw std::runtime_error("Provider request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("Provider returned status " + std::to_string(res->status) + ": " +
                                 truncate_utf8(res->body, 500));
    }
    return parse_chat_response(res->body);
}

} // namespace webscout
