#pragma once
#include "tool_registry.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace webscout {

// (exact url, case-folded filename)
using DownloadKey = std::pair<std::string, std::string>;

DownloadKey make_download_key(const nlohmann::json& args);

// Successful download results of the current run, keyed by DownloadKey.
class DownloadCache {
public:
    const nlohmann::json* find(const DownloadKey& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }
    void store(const DownloadKey& key, nlohmann::json result) {
        entries_[key] = std::move(result);
    }
    size_t size() const { return entries_.size(); }

private:
    std::map<DownloadKey, nlohmann::json> entries_;
};

// Filenames already announced to the user during the current run.
class EmittedFiles {
public:
    // true the first time a (case-folded) filename is seen
    bool claim(const std::string& filename) {
        return names_.insert(to_lower(filename)).second;
    }

private:
    std::set<std::string> names_;
};

// Created fresh for every loop invocation.
struct RunScope {
    DownloadCache downloads;
    EmittedFiles emitted;
};

nlohmann::json mark_deduplicated(nlohmann::json cached);

// Runs download_file unless an identical call already succeeded in this run.
ToolInvocation dispatch_download(const ToolRegistry& tools, const nlohmann::json& args,
                                 DownloadCache& cache);

// Size floor plus any warning the download tool attached.
// Returns the combined "DOWNLOAD VERIFICATION WARNING" text, or nothing.
std::optional<std::string> verify_download(const nlohmann::json& result);

enum class DownloadAction { ignored, warning, announce, already_announced };

struct DownloadOutcome {
    DownloadAction action = DownloadAction::ignored;
    std::string warning;
};

DownloadOutcome review_download(const nlohmann::json& result, EmittedFiles& emitted);

bool result_flag(const nlohmann::json& result, const char* key);

} // namespace webscout
