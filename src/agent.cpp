#include "agent.hpp"
#include "prompts.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace webscout {

Agent::Agent(const Config& config, const ToolRegistry& tools, ChatClient& client, AuditLog& audit)
    : config_(config), tools_(tools), client_(client), audit_(audit) {}

std::string tool_result_content(const nlohmann::json& result) {
    std::string s = dump_json(result);
    if (s.size() > MAX_TOOL_RESULT_CHARS) {
        s = truncate_utf8(s, MAX_TOOL_RESULT_CHARS) + "... [truncated]";
    }
    return s;
}

nlohmann::json parse_tool_arguments(const std::string& arguments) {
    if (arguments.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::object();
    }
    auto args = nlohmann::json::parse(arguments);
    if (!args.is_object()) {
        throw std::runtime_error("Tool arguments are not a JSON object: " + truncate_utf8(arguments, 200));
    }
    return args;
}

static nlohmann::json nullable(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json();
}

static nlohmann::json nullable(const std::optional<int>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json();
}

void Agent::run_tool_call(Conversation& conv, const ToolCall& call, RunScope& scope) {
    auto args = parse_tool_arguments(call.arguments);

    auto id = parse_tool_id(call.name);
    bool is_download = id && *id == ToolId::download_file && tools_.has(ToolId::download_file);
    ToolInvocation inv = is_download
        ? dispatch_download(tools_, args, scope.downloads)
        : tools_.dispatch(call.name, args);

    audit_.log_tool_call(conv.id(), inv);
    conv.add_tool_activity(inv.name, inv.args, inv.result, inv.duration_ms);

    if (is_download) {
        auto review = review_download(inv.result, scope.emitted);
        switch (review.action) {
            case DownloadAction::warning:
                conv.add_system_message(review.warning);
                break;
            case DownloadAction::announce:
                conv.add_file_message(inv.result.value("filename", std::string()),
                                      inv.result.value("path", std::string()),
                                      inv.result.value("size_bytes", int64_t{0}));
                break;
            case DownloadAction::ignored:
            case DownloadAction::already_announced:
                break;
        }
    }

    conv.append_transcript(TranscriptEntry::tool_result(call.id, tool_result_content(inv.result)));
}

LoopResult Agent::process(Conversation& conv) {
    LoopResult out;
    auto rt = resolve_chat_runtime(config_);
    audit_.log_event(conv.id(), "conversation_started", {
        {"model", rt.model},
        {"auth_mode", rt.auth_mode},
        {"request_max_tokens", nullable(rt.max_tokens)},
        {"max_tool_calls", rt.max_tool_calls},
        {"temperature", rt.temperature}
    });

    conv.ensure_system_prompt(build_system_prompt());

    RunScope scope;
    ChatOptions options{rt.model, rt.temperature, rt.max_tokens};
    std::vector<std::string> pending;  // call ids of the current batch without a result

    try {
        while (out.tool_calls < rt.max_tool_calls) {
            auto start = std::chrono::steady_clock::now();
            auto resp = client_.chat(conv.transcript(), tools_.tools_spec(), options);
            out.llm_calls++;

            const std::vector<ToolCall>* calls = nullptr;
            std::string text;
            if (auto* reply = std::get_if<ToolCallReply>(&resp.turn)) {
                calls = &reply->tool_calls;
                text = reply->content;
            } else {
                text = std::get<TextReply>(resp.turn).content;
            }

            LlmCallRecord rec;
            rec.model = rt.model;
            rec.prompt_tokens = resp.prompt_tokens;
            rec.completion_tokens = resp.completion_tokens;
            rec.duration_ms = elapsed_ms(start);
            rec.tool_calls_count = calls ? calls->size() : 0;
            rec.finish_reason = resp.finish_reason;
            rec.response_preview = text;
            rec.request_max_tokens = rt.max_tokens;
            rec.auth_mode = rt.auth_mode;
            if (calls) {
                for (auto& c : *calls) rec.tool_names.push_back(c.name);
            }
            audit_.log_llm_call(conv.id(), rec);

            if (!calls) {
                audit_.log_event(conv.id(), "loop_stopped_no_tool_calls", {
                    {"finish_reason", nullable(resp.finish_reason)},
                    {"tool_call_count_total", out.tool_calls},
                    {"response_preview", truncate_utf8(text, 500)}
                });
                conv.add_assistant_message(text);
                conv.append_transcript(TranscriptEntry::assistant(text));
                out.outcome = LoopOutcome::final_text;
                return out;
            }

            audit_.log_event(conv.id(), "llm_requested_tools", {
                {"tool_names", rec.tool_names},
                {"count", rec.tool_names.size()}
            });
            conv.append_transcript(to_transcript_entry(resp.turn));
            if (!text.empty()) conv.add_assistant_message(text);

            pending.clear();
            for (auto& c : *calls) pending.push_back(c.id);

            for (auto& call : *calls) {
                if (out.tool_calls >= rt.max_tool_calls) {
                    // Keep the transcript well-formed without running over the budget.
                    nlohmann::json skipped = {
                        {"error", "Tool call budget of " + std::to_string(rt.max_tool_calls) +
                                  " reached; call not executed."},
                        {"skipped", true}
                    };
                    conv.append_transcript(TranscriptEntry::tool_result(call.id, dump_json(skipped)));
                } else {
                    out.tool_calls++;
                    run_tool_call(conv, call, scope);
                }
                pending.erase(std::find(pending.begin(), pending.end(), call.id));
            }
        }

        audit_.log_event(conv.id(), "loop_stopped_max_tool_calls", {
            {"max_tool_calls", rt.max_tool_calls},
            {"tool_call_count_total", out.tool_calls}
        });
        conv.add_system_message("Reached maximum of " + std::to_string(rt.max_tool_calls) +
                                " tool calls. Stopping.");
        out.outcome = LoopOutcome::budget_exceeded;
        return out;
    } catch (const std::exception& e) {
        for (auto& id : pending) {
            nlohmann::json missing = {{"error", std::string("Not executed: ") + e.what()}};
            conv.append_transcript(TranscriptEntry::tool_result(id, dump_json(missing)));
        }
        audit_.log_event(conv.id(), "loop_exception", {
            {"error", e.what()},
            {"tool_call_count_total", out.tool_calls}
        });
        std::cerr << "[agent] Error in conversation " << conv.id() << ": " << e.what() << "\n";
        conv.add_system_message(std::string("Error: ") + e.what());
        out.outcome = LoopOutcome::fatal_error;
        out.error = e.what();
        return out;
    }
}

} // namespace webscout
