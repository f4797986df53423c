#pragma once
#include <string>

namespace webscout {

struct HttpsResponse {
    int status = 0;
    std::string body;
    std::string content_type;
    std::string error;   // set when no HTTP response arrived
    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// JSON POST over TLS (cpp-httplib + OpenSSL). Never throws for transport
// errors; they come back in `error`.
HttpsResponse https_post(
    const std::string& host,
    const std::string& path,
    const std::string& body,
    const std::string& bearer_token,
    int timeout_sec = 30
);

} // namespace webscout
