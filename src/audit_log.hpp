#pragma once
#include "tool_registry.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace webscout {

struct LlmCallRecord {
    std::string model;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int64_t duration_ms = 0;
    size_t tool_calls_count = 0;
    std::optional<std::string> finish_reason;
    std::string response_preview;
    std::optional<int> request_max_tokens;
    std::string auth_mode;
    std::vector<std::string> tool_names;
};

// Append-only JSONL trail at <log_dir>/tool_calls.jsonl.
// An empty log_dir turns it off. A failed write is reported on stderr and
// otherwise ignored; the agent never sees it.
class AuditLog {
public:
    explicit AuditLog(std::string log_dir);

    void log_tool_call(const std::string& conversation_id, const ToolInvocation& inv);
    void log_llm_call(const std::string& conversation_id, const LlmCallRecord& rec);
    void log_event(const std::string& conversation_id, const std::string& event,
                   const nlohmann::json& details);

    bool enabled() const { return !dir_.empty(); }
    std::string file_path() const;

private:
    void append(nlohmann::json record);

    std::string dir_;
    std::mutex mutex_;
};

} // namespace webscout
