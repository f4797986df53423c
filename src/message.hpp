#pragma once
#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace webscout {

// ── Human-visible conversation messages ──────────────────────────────

enum class MessageRole { user, assistant, tool_activity, file, system };

const char* role_name(MessageRole role);

struct ChatMessage {
    MessageRole role = MessageRole::user;
    std::string content;
    double timestamp = 0.0;

    // tool_activity payload
    std::string tool_name;
    nlohmann::json tool_args;
    nlohmann::json tool_result;
    int64_t tool_duration_ms = 0;

    // file payload
    std::string filename;
    std::string file_path;
    int64_t file_size = 0;

    nlohmann::json to_json() const;
};

// ── Model-facing transcript ──────────────────────────────────────────

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // JSON string
};

enum class TurnRole { system, user, assistant, tool };

struct TranscriptEntry {
    TurnRole role = TurnRole::user;
    std::string content;
    std::string tool_call_id;          // role == tool
    std::vector<ToolCall> tool_calls;  // role == assistant

    static TranscriptEntry system(std::string text);
    static TranscriptEntry user(std::string text);
    static TranscriptEntry assistant(std::string text);
    static TranscriptEntry assistant_tool_calls(std::string text, std::vector<ToolCall> calls);
    static TranscriptEntry tool_result(std::string call_id, std::string content);

    nlohmann::json to_json() const;
    // Throws std::runtime_error on anything that is not a well-formed entry.
    static TranscriptEntry from_json(const nlohmann::json& j);
};

// ── Assistant turn as returned by the provider ───────────────────────

struct TextReply {
    std::string content;
};

struct ToolCallReply {
    std::string content; // optional prose alongside the calls
    std::vector<ToolCall> tool_calls;
};

using AssistantTurn = std::variant<TextReply, ToolCallReply>;

// An assistant entry with calls becomes a ToolCallReply, otherwise a TextReply.
AssistantTurn to_assistant_turn(const TranscriptEntry& entry);
TranscriptEntry to_transcript_entry(const AssistantTurn& turn);

} // namespace webscout
