#include "https_client.hpp"
#include <httplib.h>

namespace webscout {

HttpsResponse https_post(
    const std::string& host,
    const std::string& path,
    const std::string& body,
    const std::string& bearer_token,
    int timeout_sec)
{
    HttpsResponse resp;

    httplib::SSLClient cli(host, 443);
    cli.set_connection_timeout(timeout_sec);
    cli.set_read_timeout(timeout_sec);
    cli.set_follow_location(true);

    httplib::Headers headers;
    if (!bearer_token.empty()) {
        headers.emplace("Authorization", "Bearer " + bearer_token);
    }

    auto res = cli.Post(path, headers, body, "application/json");
    if (!res) {
        resp.error = "HTTPS request to " + host + " failed: " + httplib::to_string(res.error());
        return resp;
    }
    resp.status = res->status;
    resp.body = res->body;
    resp.content_type = res->get_header_value("Content-Type");
    return resp;
}

} // namespace webscout
