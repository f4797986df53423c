#include "audit_log.hpp"
#include <fstream>
#include <iostream>

namespace webscout {

AuditLog::AuditLog(std::string log_dir) : dir_(std::move(log_dir)) {}

std::string AuditLog::file_path() const {
    return dir_ + "/tool_calls.jsonl";
}

void AuditLog::append(nlohmann::json record) {
    if (!enabled()) return;
    record["timestamp"] = epoch_now_f();

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        fs::create_directories(dir_);
        std::ofstream f(file_path(), std::ios::app);
        if (!f) {
            std::cerr << "[audit] Cannot open " << file_path() << "\n";
            return;
        }
        f << dump_json(record) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[audit] Write failed: " << e.what() << "\n";
    }
}

void AuditLog::log_tool_call(const std::string& conversation_id, const ToolInvocation& inv) {
    append({
        {"type", "tool_call"},
        {"conversation_id", conversation_id},
        {"tool_name", inv.name},
        {"tool_args", inv.args},
        {"tool_result", inv.result},
        {"duration_ms", inv.duration_ms}
    });
}

void AuditLog::log_llm_call(const std::string& conversation_id, const LlmCallRecord& rec) {
    nlohmann::json j = {
        {"type", "llm_call"},
        {"conversation_id", conversation_id},
        {"model", rec.model},
        {"prompt_tokens", rec.prompt_tokens},
        {"completion_tokens", rec.completion_tokens},
        {"duration_ms", rec.duration_ms},
        {"tool_calls_count", rec.tool_calls_count},
        {"response_preview", truncate_utf8(rec.response_preview, 500)},
        {"auth_mode", rec.auth_mode},
        {"tool_names", rec.tool_names}
    };
    j["finish_reason"] = rec.finish_reason ? nlohmann::json(*rec.finish_reason) : nlohmann::json();
    j["request_max_tokens"] = rec.request_max_tokens ? nlohmann::json(*rec.request_max_tokens) : nlohmann::json();
    append(std::move(j));
}

void AuditLog::log_event(const std::string& conversation_id, const std::string& event,
                         const nlohmann::json& details) {
    append({
        {"type", "agent_event"},
        {"conversation_id", conversation_id},
        {"event", event},
        {"details", details}
    });
}

} // namespace webscout
