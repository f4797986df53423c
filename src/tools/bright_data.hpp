#pragma once
#include "../config.hpp"
#include "../https_client.hpp"
#include "../tool_registry.hpp"
#include <functional>
#include <memory>

namespace webscout {

// Sends one {"zone", "url", "format"} payload to the Bright Data request API.
using BrightDataTransport = std::function<HttpsResponse(const nlohmann::json& payload, int timeout_sec)>;

BrightDataTransport make_bright_data_transport(const BrightDataConfig& cfg);

// search / scrape_page / download_file on top of the Bright Data SERP and
// Web Unlocker zones. Failures come back as {"error": ...} results.
class BrightDataTools {
public:
    BrightDataTools(BrightDataConfig cfg, DownloadConfig download, BrightDataTransport transport);

    nlohmann::json search(const nlohmann::json& args) const;
    nlohmann::json scrape_page(const nlohmann::json& args) const;
    nlohmann::json download_file(const nlohmann::json& args) const;

private:
    BrightDataConfig cfg_;
    DownloadConfig download_;
    BrightDataTransport transport_;
};

// Organic results of a SERP response, at most 10.
nlohmann::json parse_serp_results(const HttpsResponse& resp);

// "https://host/a/b/report.pdf?x=1" -> "report.pdf"
std::string url_filename(const std::string& url);

void register_bright_data_tools(ToolRegistry& reg, std::shared_ptr<const BrightDataTools> tools);

} // namespace webscout
