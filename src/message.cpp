#include "message.hpp"
#include <stdexcept>

namespace webscout {

const char* role_name(MessageRole role) {
    switch (role) {
        case MessageRole::user: return "user";
        case MessageRole::assistant: return "assistant";
        case MessageRole::tool_activity: return "tool_activity";
        case MessageRole::file: return "file";
        case MessageRole::system: return "system";
    }
    return "user";
}

nlohmann::json ChatMessage::to_json() const {
    nlohmann::json j;
    j["role"] = role_name(role);
    j["content"] = content;
    j["timestamp"] = timestamp;
    if (role == MessageRole::tool_activity) {
        j["tool_name"] = tool_name;
        j["tool_args"] = tool_args;
        j["tool_result"] = tool_result;
        j["tool_duration_ms"] = tool_duration_ms;
    }
    if (role == MessageRole::file) {
        j["filename"] = filename;
        j["file_path"] = file_path;
        j["file_size"] = file_size;
    }
    return j;
}

// ── TranscriptEntry ──────────────────────────────────────────────────

TranscriptEntry TranscriptEntry::system(std::string text) {
    TranscriptEntry e;
    e.role = TurnRole::system;
    e.content = std::move(text);
    return e;
}

TranscriptEntry TranscriptEntry::user(std::string text) {
    TranscriptEntry e;
    e.role = TurnRole::user;
    e.content = std::move(text);
    return e;
}

TranscriptEntry TranscriptEntry::assistant(std::string text) {
    TranscriptEntry e;
    e.role = TurnRole::assistant;
    e.content = std::move(text);
    return e;
}

TranscriptEntry TranscriptEntry::assistant_tool_calls(std::string text, std::vector<ToolCall> calls) {
    TranscriptEntry e;
    e.role = TurnRole::assistant;
    e.content = std::move(text);
    e.tool_calls = std::move(calls);
    return e;
}

TranscriptEntry TranscriptEntry::tool_result(std::string call_id, std::string content) {
    TranscriptEntry e;
    e.role = TurnRole::tool;
    e.tool_call_id = std::move(call_id);
    e.content = std::move(content);
    return e;
}

static const char* turn_role_name(TurnRole role) {
    switch (role) {
        case TurnRole::system: return "system";
        case TurnRole::user: return "user";
        case TurnRole::assistant: return "assistant";
        case TurnRole::tool: return "tool";
    }
    return "user";
}

static TurnRole parse_turn_role(const std::string& s) {
    if (s == "system") return TurnRole::system;
    if (s == "user") return TurnRole::user;
    if (s == "assistant") return TurnRole::assistant;
    if (s == "tool") return TurnRole::tool;
    throw std::runtime_error("Unknown transcript role: " + s);
}

nlohmann::json TranscriptEntry::to_json() const {
    nlohmann::json j;
    j["role"] = turn_role_name(role);
    if (role == TurnRole::assistant && !tool_calls.empty() && content.empty()) {
        j["content"] = nullptr;
    } else {
        j["content"] = content;
    }
    if (role == TurnRole::tool) j["tool_call_id"] = tool_call_id;
    if (!tool_calls.empty()) {
        auto& arr = j["tool_calls"];
        for (auto& tc : tool_calls) {
            arr.push_back({
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
            });
        }
    }
    return j;
}

TranscriptEntry TranscriptEntry::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("Transcript entry is not an object");
    if (!j.contains("role") || !j["role"].is_string()) {
        throw std::runtime_error("Transcript entry has no role");
    }

    TranscriptEntry e;
    e.role = parse_turn_role(j["role"].get<std::string>());

    if (j.contains("content") && !j["content"].is_null()) {
        if (!j["content"].is_string()) throw std::runtime_error("Transcript content must be a string");
        e.content = j["content"].get<std::string>();
    }

    if (e.role == TurnRole::tool) {
        if (!j.contains("tool_call_id") || !j["tool_call_id"].is_string() ||
            j["tool_call_id"].get<std::string>().empty()) {
            throw std::runtime_error("Tool entry without tool_call_id");
        }
        e.tool_call_id = j["tool_call_id"].get<std::string>();
    }

    if (j.contains("tool_calls") && !j["tool_calls"].is_null()) {
        if (e.role != TurnRole::assistant) throw std::runtime_error("Only assistant entries carry tool_calls");
        if (!j["tool_calls"].is_array()) throw std::runtime_error("tool_calls must be an array");
        for (auto& tc : j["tool_calls"]) {
            if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object()) {
                throw std::runtime_error("Malformed tool call");
            }
            auto& fn = tc["function"];
            ToolCall t;
            if (!tc.contains("id") || !tc["id"].is_string()) throw std::runtime_error("Tool call without id");
            if (!fn.contains("name") || !fn["name"].is_string()) throw std::runtime_error("Tool call without name");
            t.id = tc["id"].get<std::string>();
            t.name = fn["name"].get<std::string>();
            if (fn.contains("arguments") && fn["arguments"].is_string()) {
                t.arguments = fn["arguments"].get<std::string>();
            } else if (fn.contains("arguments") && fn["arguments"].is_object()) {
                t.arguments = fn["arguments"].dump();
            } else {
                throw std::runtime_error("Tool call '" + t.name + "' without arguments");
            }
            if (t.id.empty() || t.name.empty()) throw std::runtime_error("Tool call with empty id or name");
            e.tool_calls.push_back(std::move(t));
        }
    }
    return e;
}

AssistantTurn to_assistant_turn(const TranscriptEntry& entry) {
    if (entry.role != TurnRole::assistant) {
        throw std::runtime_error(std::string("Expected assistant entry, got ") + turn_role_name(entry.role));
    }
    if (entry.tool_calls.empty()) return TextReply{entry.content};
    return ToolCallReply{entry.content, entry.tool_calls};
}

TranscriptEntry to_transcript_entry(const AssistantTurn& turn) {
    if (auto* text = std::get_if<TextReply>(&turn)) {
        return TranscriptEntry::assistant(text->content);
    }
    auto& calls = std::get<ToolCallReply>(turn);
    return TranscriptEntry::assistant_tool_calls(calls.content, calls.tool_calls);
}

} // namespace webscout
