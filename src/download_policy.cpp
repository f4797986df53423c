#include "download_policy.hpp"
#include <vector>

namespace webscout {

namespace {

struct SizeFloor {
    const char* ext;
    int64_t min_bytes;
};

const SizeFloor kSizeFloors[] = {
    {".pdf", 20000},
    {".xlsx", 5000},
    {".xls", 5000},
};

std::string string_arg(const nlohmann::json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return "";
    if (args[key].is_string()) return args[key].get<std::string>();
    return dump_json(args[key]);
}

} // namespace

bool result_flag(const nlohmann::json& result, const char* key) {
    if (!result.is_object() || !result.contains(key)) return false;
    auto& v = result[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) return !v.get<std::string>().empty();
    if (v.is_number()) return v.get<double>() != 0.0;
    return !v.is_null();
}

DownloadKey make_download_key(const nlohmann::json& args) {
    return {string_arg(args, "url"), to_lower(string_arg(args, "filename"))};
}

nlohmann::json mark_deduplicated(nlohmann::json cached) {
    cached["deduplicated"] = true;
    cached["deduplicated_reason"] = "Skipped duplicate download_file call for identical url+filename.";
    return cached;
}

ToolInvocation dispatch_download(const ToolRegistry& tools, const nlohmann::json& args,
                                 DownloadCache& cache) {
    auto key = make_download_key(args);
    if (auto* hit = cache.find(key)) {
        return ToolInvocation{tool_name(ToolId::download_file), args, mark_deduplicated(*hit), 0};
    }

    auto inv = tools.dispatch(tool_name(ToolId::download_file), args);
    if (result_flag(inv.result, "success")) {
        cache.store(key, inv.result);
    }
    return inv;
}

std::optional<std::string> verify_download(const nlohmann::json& result) {
    std::vector<std::string> warnings;

    std::string filename;
    if (result.contains("filename") && result["filename"].is_string()) {
        filename = to_lower(result["filename"].get<std::string>());
    }
    int64_t size = 0;
    if (result.contains("size_bytes") && result["size_bytes"].is_number()) {
        size = result["size_bytes"].get<int64_t>();
    }

    for (auto& floor : kSizeFloors) {
        if (!ends_with(filename, floor.ext)) continue;
        if (size < floor.min_bytes) {
            warnings.push_back(
                "File size (" + format_thousands(size) + " bytes) is suspiciously small for a " +
                to_upper(floor.ext) + " file. Expected at least " + format_thousands(floor.min_bytes) +
                " bytes. The URL may have returned an error page.");
        }
        break;
    }

    if (result_flag(result, "warning")) {
        auto& w = result["warning"];
        warnings.push_back(w.is_string() ? w.get<std::string>() : dump_json(w));
    }

    if (warnings.empty()) return std::nullopt;
    std::string text = "DOWNLOAD VERIFICATION WARNING:";
    for (auto& w : warnings) text += "\n- " + w;
    return text;
}

DownloadOutcome review_download(const nlohmann::json& result, EmittedFiles& emitted) {
    DownloadOutcome out;
    if (!result_flag(result, "success") || result_flag(result, "deduplicated")) return out;

    if (auto warning = verify_download(result)) {
        out.action = DownloadAction::warning;
        out.warning = *warning;
        return out;
    }

    std::string filename = result.contains("filename") && result["filename"].is_string()
                           ? result["filename"].get<std::string>() : "";
    out.action = emitted.claim(filename) ? DownloadAction::announce : DownloadAction::already_announced;
    return out;
}

} // namespace webscout
