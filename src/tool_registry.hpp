#pragma once
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace webscout {

// Bump when a tool's name, description or parameter schema changes.
constexpr int TOOL_SCHEMA_VERSION = 2;

enum class ToolId { search, scrape_page, download_file };

inline const char* tool_name(ToolId id) {
    switch (id) {
        case ToolId::search: return "search";
        case ToolId::scrape_page: return "scrape_page";
        case ToolId::download_file: return "download_file";
    }
    return "";
}

inline std::optional<ToolId> parse_tool_id(const std::string& name) {
    if (name == "search") return ToolId::search;
    if (name == "scrape_page") return ToolId::scrape_page;
    if (name == "download_file") return ToolId::download_file;
    return std::nullopt;
}

// Ordinary failures come back as {"error": ...}; exceptions are reserved for faults.
using ToolFunction = std::function<nlohmann::json(const nlohmann::json&)>;

struct ToolDef {
    ToolId id;
    std::string description;
    nlohmann::json parameters;
    ToolFunction func;
};

struct ToolInvocation {
    std::string name;
    nlohmann::json args;
    nlohmann::json result;
    int64_t duration_ms = 0;
};

// Filled once at startup, then only read, so workers can share it.
class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        tools_[def.id] = std::move(def);
        rebuild_spec();
    }

    bool has(ToolId id) const {
        return tools_.count(id) > 0;
    }

    ToolInvocation dispatch(const std::string& name, const nlohmann::json& args) const {
        ToolInvocation inv{name, args, nlohmann::json::object(), 0};
        auto id = parse_tool_id(name);
        auto it = id ? tools_.find(*id) : tools_.end();
        if (it == tools_.end()) {
            inv.result = {{"error", "Unknown tool: " + name}};
            return inv;
        }

        auto start = std::chrono::steady_clock::now();
        try {
            inv.result = it->second.func(args);
        } catch (const std::exception& e) {
            std::cerr << "[tools] " << name << " threw after " << elapsed_ms(start)
                      << " ms: " << e.what() << "\n";
            throw;
        }
        inv.duration_ms = elapsed_ms(start);
        return inv;
    }

    const nlohmann::json& tools_spec() const { return spec_; }

    std::vector<std::string> tool_names() const {
        std::vector<std::string> names;
        for (auto& [id, _] : tools_) names.push_back(tool_name(id));
        return names;
    }

private:
    void rebuild_spec() {
        spec_ = nlohmann::json::array();
        for (auto& [id, def] : tools_) {
            spec_.push_back({
                {"type", "function"},
                {"function", {
                    {"name", tool_name(id)},
                    {"description", def.description},
                    {"parameters", def.parameters}
                }}
            });
        }
    }

    std::map<ToolId, ToolDef> tools_;
    nlohmann::json spec_ = nlohmann::json::array();
};

} // namespace webscout
