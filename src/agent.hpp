#pragma once
#include "audit_log.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "download_policy.hpp"
#include "provider.hpp"
#include "tool_registry.hpp"

namespace webscout {

constexpr size_t MAX_TOOL_RESULT_CHARS = 15000;

enum class LoopOutcome { final_text, budget_exceeded, fatal_error };

struct LoopResult {
    LoopOutcome outcome = LoopOutcome::final_text;
    int tool_calls = 0;   // executed, including unknown-tool and deduplicated calls
    int llm_calls = 0;
    std::string error;    // set for fatal_error
};

// Drives one conversation from its latest user message to a terminal outcome:
// call the model, run the requested tools, feed results back, repeat.
class Agent {
public:
    Agent(const Config& config, const ToolRegistry& tools, ChatClient& client, AuditLog& audit);

    // Every failure ends as a system message in the conversation, never as an exception.
    LoopResult process(Conversation& conv);

private:
    void run_tool_call(Conversation& conv, const ToolCall& call, RunScope& scope);

    const Config& config_;
    const ToolRegistry& tools_;
    ChatClient& client_;
    AuditLog& audit_;
};

// Serialized tool result as it goes back to the model, capped at
// MAX_TOOL_RESULT_CHARS bytes plus a "... [truncated]" marker.
std::string tool_result_content(const nlohmann::json& result);

nlohmann::json parse_tool_arguments(const std::string& arguments);

} // namespace webscout
