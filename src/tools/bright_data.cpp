#include "bright_data.hpp"
#include "file_inspection.hpp"
#include "html_text.hpp"
#include <fstream>
#include <iostream>

namespace webscout {

namespace {

constexpr size_t kContentLimit = 12000;
constexpr size_t kMaxSearchResults = 10;
constexpr size_t kPreviewLimit = 800;

std::string arg_string(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) return "";
    return args[key].get<std::string>();
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string failure_text(const HttpsResponse& resp) {
    if (!resp.error.empty()) return resp.error;
    return "Bright Data returned HTTP " + std::to_string(resp.status) +
           (resp.body.empty() ? "" : ": " + truncate_utf8(resp.body, 300));
}

nlohmann::json download_failure(const std::string& url, const std::string& filename, const std::string& error) {
    return {{"url", url}, {"filename", filename}, {"error", error}, {"success", false}};
}

bool is_bare_filename(const std::string& name) {
    if (name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return false;
    return fs::path(name).filename().string() == name;
}

} // namespace

BrightDataTransport make_bright_data_transport(const BrightDataConfig& cfg) {
    return [host = cfg.api_host, token = cfg.api_token](const nlohmann::json& payload, int timeout_sec) {
        return https_post(host, "/request", dump_json(payload), token, timeout_sec);
    };
}

BrightDataTools::BrightDataTools(BrightDataConfig cfg, DownloadConfig download, BrightDataTransport transport)
    : cfg_(std::move(cfg)), download_(std::move(download)), transport_(std::move(transport)) {}

std::string url_filename(const std::string& url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    size_t path = url.find('/', start);
    if (path == std::string::npos) return "";
    size_t end = url.find_first_of("?#", path);
    std::string p = url.substr(path, end == std::string::npos ? std::string::npos : end - path);
    return p.substr(p.rfind('/') + 1);
}

// ── search ───────────────────────────────────────────────────────────

nlohmann::json parse_serp_results(const HttpsResponse& resp) {
    nlohmann::json data = nlohmann::json::object();
    bool json_body = resp.content_type.find("json") != std::string::npos ||
                     starts_with(trim(resp.body), "{");
    if (json_body) {
        data = nlohmann::json::parse(resp.body, nullptr, false);
        if (data.is_discarded() || !data.is_object()) data = nlohmann::json::object();
    }

    nlohmann::json results = nlohmann::json::array();
    if (data.contains("organic") && data["organic"].is_array()) {
        for (auto& item : data["organic"]) {
            if (results.size() >= kMaxSearchResults) break;
            if (!item.is_object()) continue;
            auto pick = [&](const char* a, const char* b) -> std::string {
                if (item.contains(a) && item[a].is_string()) return item[a].get<std::string>();
                if (item.contains(b) && item[b].is_string()) return item[b].get<std::string>();
                return "";
            };
            results.push_back({
                {"title", item.contains("title") && item["title"].is_string() ? item["title"].get<std::string>() : ""},
                {"url", pick("link", "url")},
                {"snippet", pick("description", "snippet")}
            });
        }
    }

    if (results.empty() && !resp.body.empty()) {
        return {{"results", nlohmann::json::array()},
                {"note", "SERP returned HTML instead of structured data. Try a different query."}};
    }
    return {{"results", results}};
}

nlohmann::json BrightDataTools::search(const nlohmann::json& args) const {
    std::string query = arg_string(args, "query");
    if (trim(query).empty()) {
        return {{"error", "query is required"}, {"results", nlohmann::json::array()}};
    }

    nlohmann::json payload = {
        {"zone", cfg_.serp_zone},
        {"url", "https://www.google.com/search?q=" + url_encode(query) + "&num=10&brd_json=1"},
        {"format", "raw"}
    };
    auto resp = transport_(payload, cfg_.search_timeout_sec);
    if (!resp.ok()) {
        std::cerr << "[tools] SERP search failed: " << failure_text(resp) << "\n";
        return {{"error", failure_text(resp)}, {"results", nlohmann::json::array()}};
    }
    return parse_serp_results(resp);
}

// ── scrape_page ──────────────────────────────────────────────────────

nlohmann::json BrightDataTools::scrape_page(const nlohmann::json& args) const {
    std::string url = arg_string(args, "url");
    if (trim(url).empty()) {
        return {{"error", "url is required"}, {"url", url}, {"content", ""}};
    }

    nlohmann::json payload = {{"zone", cfg_.web_unlocker_zone}, {"url", url}, {"format", "raw"}};
    auto resp = transport_(payload, cfg_.scrape_timeout_sec);
    if (!resp.ok()) {
        std::cerr << "[tools] Scrape failed for " << url << ": " << failure_text(resp) << "\n";
        return {{"error", failure_text(resp)}, {"url", url}, {"content", ""}};
    }

    std::string content;
    if (to_lower(resp.content_type).find("html") != std::string::npos || starts_with(trim(resp.body), "<")) {
        content = html_to_markdown(resp.body);
    } else {
        content = resp.body;
    }
    return {
        {"url", url},
        {"content", truncate_utf8(content, kContentLimit)},
        {"content_type", resp.content_type}
    };
}

// ── download_file ────────────────────────────────────────────────────

nlohmann::json BrightDataTools::download_file(const nlohmann::json& args) const {
    std::string url = arg_string(args, "url");
    std::string filename = trim(arg_string(args, "filename"));

    if (filename.empty()) {
        return download_failure(url, filename, "Filename is required.");
    }
    if (!is_bare_filename(filename)) {
        return download_failure(url, filename, "Invalid filename. Provide a basename only, without directories.");
    }
    if (trim(url).empty()) {
        return download_failure(url, filename, "url is required");
    }

    nlohmann::json payload = {{"zone", cfg_.web_unlocker_zone}, {"url", url}, {"format", "raw"}};
    auto resp = transport_(payload, cfg_.download_timeout_sec);
    if (!resp.ok()) {
        std::cerr << "[tools] Download failed for " << url << ": " << failure_text(resp) << "\n";
        return download_failure(url, filename, failure_text(resp));
    }

    std::string lower_name = to_lower(filename);
    bool is_pdf = ends_with(lower_name, ".pdf");
    bool is_xlsx = ends_with(lower_name, ".xlsx");
    bool is_xls = ends_with(lower_name, ".xls");
    if ((is_pdf || is_xlsx || is_xls) && to_lower(resp.content_type).find("html") != std::string::npos) {
        return download_failure(url, filename,
            "URL returned HTML (content-type: " + resp.content_type + ") instead of the expected file. "
            "This URL likely points to a web page, not a downloadable file. Try finding the direct download link.");
    }

    fs::path dir(expand_path(download_.base_dir));
    fs::path filepath = dir / filename;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return download_failure(url, filename, "Cannot create download directory: " + ec.message());
    }
    {
        std::ofstream f(filepath, std::ios::binary | std::ios::trunc);
        if (!f) return download_failure(url, filename, "Cannot write " + filepath.string());
        f.write(resp.body.data(), static_cast<std::streamsize>(resp.body.size()));
        if (!f) return download_failure(url, filename, "Write failed for " + filepath.string());
    }
    auto size = fs::file_size(filepath, ec);
    if (ec) size = resp.body.size();

    nlohmann::json result = {
        {"url", url},
        {"filename", filename},
        {"path", filepath.string()},
        {"size_bytes", static_cast<int64_t>(size)},
        {"content_type", resp.content_type},
        {"url_filename", url_filename(url)},
        {"success", true}
    };

    if (is_pdf) {
        auto inspection = inspect_pdf(filepath.string());
        result["file_inspection"] = inspection;
        if (!inspection.value("valid", false)) {
            result["warning"] = "File does not appear to be a valid PDF: " + inspection.value("error", std::string("invalid header"));
        } else if (inspection.contains("first_pages_text")) {
            result["first_pages_preview"] = truncate_utf8(inspection["first_pages_text"].get<std::string>(), kPreviewLimit);
            result["page_count"] = inspection["pages"];
        }
    } else if (is_xlsx || is_xls) {
        auto inspection = is_xlsx ? inspect_xlsx(filepath.string()) : inspect_xls(filepath.string());
        result["file_inspection"] = inspection;
        if (!inspection.value("valid", false)) {
            result["warning"] = "File does not appear to be a valid Excel file: " + inspection.value("error", std::string("invalid format"));
        }
    }
    return result;
}

// ── Registration ─────────────────────────────────────────────────────

void register_bright_data_tools(ToolRegistry& reg, std::shared_ptr<const BrightDataTools> tools) {
    reg.register_tool({
        ToolId::search,
        "Search Google through the Bright Data SERP API. Returns organic results with title, url and snippet. "
        "Use it to find pages, documents, download links and general information.",
        {
            {"type", "object"},
            {"properties", {
                {"query", {{"type", "string"}, {"description", "The Google search query."}}}
            }},
            {"required", nlohmann::json::array({"query"})}
        },
        [tools](const nlohmann::json& args) { return tools->search(args); }
    });

    reg.register_tool({
        ToolId::scrape_page,
        "Fetch a web page through the Bright Data Web Unlocker and return its content as clean markdown. "
        "Scripts, styles and navigation are removed. Use it to read pages, find links and navigate sites.",
        {
            {"type", "object"},
            {"properties", {
                {"url", {{"type", "string"}, {"description", "Full URL of the page."}}}
            }},
            {"required", nlohmann::json::array({"url"})}
        },
        [tools](const nlohmann::json& args) { return tools->scrape_page(args); }
    });

    reg.register_tool({
        ToolId::download_file,
        "Download a file (PDF, XLSX, CSV, ...) through Bright Data and save it to disk. Returns size, content type, "
        "the filename found in the URL, a structural inspection and, for PDFs, a text preview of the first pages. Check that PDFs exceed 20KB and XLSX files 5KB, "
        "that the content type matches and that url_filename fits the intended document.",
        {
            {"type", "object"},
            {"properties", {
                {"url", {{"type", "string"}, {"description", "Direct download URL of the file."}}},
                {"filename", {{"type", "string"}, {"description",
                    "Local filename to save as. Keep the original filename from the URL whenever possible."}}}
            }},
            {"required", nlohmann::json::array({"url", "filename"})}
        },
        [tools](const nlohmann::json& args) { return tools->download_file(args); }
    });
}

} // namespace webscout
