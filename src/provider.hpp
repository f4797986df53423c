#pragma once
#include "config.hpp"
#include "message.hpp"
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>

namespace webscout {

struct ChatOptions {
    std::string model;
    double temperature = 0.2;
    std::optional<int> max_tokens;
};

struct ProviderResponse {
    AssistantTurn turn;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    std::optional<std::string> finish_reason;
};

// The model backend as the agent loop sees it. Throws on transport or
// protocol failure.
class ChatClient {
public:
    virtual ~ChatClient() = default;
    virtual ProviderResponse chat(const std::vector<TranscriptEntry>& transcript,
                                  const nlohmann::json& tools_spec,
                                  const ChatOptions& options) = 0;
};

nlohmann::json build_chat_request(const std::vector<TranscriptEntry>& transcript,
                                  const nlohmann::json& tools_spec,
                                  const ChatOptions& options);

// Strict: a body without choices[0].message, or with a malformed message, throws.
ProviderResponse parse_chat_response(const std::string& body);

struct BaseUrl {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    std::string path_prefix;
};

BaseUrl parse_base_url(const std::string& url);

// OpenAI-compatible /chat/completions over cpp-httplib.
class Provider : public ChatClient {
public:
    explicit Provider(const ProviderConfig& cfg);

    ProviderResponse chat(const std::vector<TranscriptEntry>& transcript,
                          const nlohmann::json& tools_spec,
                          const ChatOptions& options) override;

    const ProviderConfig& config() const { return config_; }

private:
    ProviderConfig config_;
    BaseUrl url_;
    std::string base_url_;  // scheme://host:port
};

} // namespace webscout
