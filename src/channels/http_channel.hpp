#pragma once
#include "../chat_service.hpp"
#include "../config.hpp"
#include "../rate_limiter.hpp"
#include "../tool_registry.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

namespace webscout {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

struct FileLookup {
    int status = 200;
    std::string path;    // absolute path when status == 200
    std::string error;
};

// Route logic of the HTTP API, independent of the server so it can be
// exercised directly.
class ChatApi {
public:
    ChatApi(const Config& cfg, const ToolRegistry& tools, ChatService& service);

    // POST /api/chat {"message", "chat_id"?}
    ApiResponse post_chat(const std::string& request_body);
    // GET /api/chat/<id>?since=N
    ApiResponse get_chat(const std::string& chat_id, const std::string& since) const;
    // GET /api/config/prompts
    ApiResponse prompts() const;
    // GET /api/config/system
    ApiResponse system_config() const;
    // GET /api/files/download?path=<name>, confined to the download directory
    FileLookup resolve_download(const std::string& path) const;

private:
    const Config& cfg_;
    const ToolRegistry& tools_;
    ChatService& service_;
};

class HTTPChannel {
public:
    HTTPChannel(const HTTPChannelConfig& cfg, ChatApi& api);

    // Blocks until stop() is called or the socket cannot be bound.
    bool listen(const std::string& host, int port);
    void stop() { server_.stop(); }

private:
    void register_routes();
    bool check_auth(const httplib::Request& req, httplib::Response& res);
    bool check_rate_limit(const httplib::Request& req, httplib::Response& res);

    HTTPChannelConfig config_;
    ChatApi& api_;
    httplib::Server server_;
    RateLimiter rate_limiter_;
};

std::string mime_type_for(const std::string& filename);

} // namespace webscout
