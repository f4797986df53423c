#pragma once
#include <cstdio>
#include <deque>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "provider.hpp"
#include "tool_registry.hpp"
#include "utils.hpp"

namespace webscout::testing {

class TempDir {
public:
    TempDir() {
        root_ = std::filesystem::temp_directory_path() / ("webscout_test_" + generate_chat_id());
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::string str() const { return root_.string(); }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// A well-formed PDF with one text line per page and a correct xref table.
// `padding` bytes of comment after the header inflate the file size.
inline std::string make_pdf(const std::vector<std::string>& page_texts, size_t padding = 0) {
    std::string out = "%PDF-1.4\n";
    if (padding > 0) out += "%" + std::string(padding, 'x') + "\n";

    std::vector<size_t> offsets;
    auto add_object = [&](const std::string& body) {
        offsets.push_back(out.size());
        out += std::to_string(offsets.size()) + " 0 obj\n" + body + "\nendobj\n";
    };

    std::string kids;
    for (size_t i = 0; i < page_texts.size(); i++) kids += std::to_string(4 + 2 * i) + " 0 R ";
    add_object("<< /Type /Catalog /Pages 2 0 R >>");
    add_object("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(page_texts.size()) + " >>");
    add_object("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
    for (size_t i = 0; i < page_texts.size(); i++) {
        add_object("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Resources << /Font << /F1 3 0 R >> >> "
                   "/Contents " + std::to_string(5 + 2 * i) + " 0 R >>");
        std::string stream = "BT /F1 24 Tf 72 700 Td (" + page_texts[i] + ") Tj ET";
        add_object("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "\nendstream");
    }

    size_t xref = out.size();
    out += "xref\n0 " + std::to_string(offsets.size() + 1) + "\n0000000000 65535 f \n";
    char entry[32];
    for (size_t off : offsets) {
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", off);
        out += entry;
    }
    out += "trailer\n<< /Size " + std::to_string(offsets.size() + 1) + " /Root 1 0 R >>\n";
    out += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return out;
}

inline ToolCall make_call(const std::string& id, const std::string& name, const nlohmann::json& args) {
    return ToolCall{id, name, args.dump()};
}

inline ProviderResponse text_reply(const std::string& text) {
    ProviderResponse r;
    r.turn = TextReply{text};
    r.finish_reason = "stop";
    r.prompt_tokens = 10;
    r.completion_tokens = 5;
    return r;
}

inline ProviderResponse tool_reply(std::vector<ToolCall> calls, const std::string& text = "") {
    ProviderResponse r;
    r.turn = ToolCallReply{text, std::move(calls)};
    r.finish_reason = "tool_calls";
    return r;
}

// Plays back canned replies in order and records what it was sent.
class ScriptedClient : public ChatClient {
public:
    void push(ProviderResponse r) { replies_.push_back(std::move(r)); }

    // Once the script runs out, keep answering with this reply.
    void repeat_forever(ProviderResponse r) { fallback_ = std::move(r); has_fallback_ = true; }

    void fail_with(const std::string& msg) { fail_message_ = msg; }

    ProviderResponse chat(const std::vector<TranscriptEntry>& transcript,
                          const nlohmann::json& tools_spec,
                          const ChatOptions& options) override {
        calls++;
        last_transcript = transcript;
        last_tools = tools_spec;
        last_options = options;
        if (!fail_message_.empty()) throw std::runtime_error(fail_message_);
        if (!replies_.empty()) {
            auto r = std::move(replies_.front());
            replies_.pop_front();
            return r;
        }
        if (has_fallback_) {
            auto r = fallback_;
            // fresh ids per round so the transcript stays unambiguous
            if (auto* tc = std::get_if<ToolCallReply>(&r.turn)) {
                for (auto& c : tc->tool_calls) c.id += "_" + std::to_string(calls);
            }
            return r;
        }
        throw std::runtime_error("script exhausted");
    }

    int calls = 0;
    std::vector<TranscriptEntry> last_transcript;
    nlohmann::json last_tools;
    ChatOptions last_options;

private:
    std::deque<ProviderResponse> replies_;
    ProviderResponse fallback_;
    bool has_fallback_ = false;
    std::string fail_message_;
};

// Registry with in-memory tools that count their executions.
struct FakeTools {
    int searches = 0;
    int scrapes = 0;
    int downloads = 0;
    int64_t download_size = 50000;
    nlohmann::json download_extra = nlohmann::json::object();
    std::string scrape_content = "page text";
    bool search_throws = false;

    ToolRegistry registry() {
        ToolRegistry reg;
        reg.register_tool({ToolId::search, "search", {{"type", "object"}},
            [this](const nlohmann::json& args) -> nlohmann::json {
                searches++;
                if (search_throws) throw std::runtime_error("search backend exploded");
                return {{"results", nlohmann::json::array({{{"title", "t"}, {"url", "https://x"}, {"snippet", args.value("query", "")}}})}};
            }});
        reg.register_tool({ToolId::scrape_page, "scrape", {{"type", "object"}},
            [this](const nlohmann::json& args) -> nlohmann::json {
                scrapes++;
                return {{"url", args.value("url", "")}, {"content", scrape_content}};
            }});
        reg.register_tool({ToolId::download_file, "download", {{"type", "object"}},
            [this](const nlohmann::json& args) -> nlohmann::json {
                downloads++;
                nlohmann::json r = {
                    {"url", args.value("url", "")},
                    {"filename", args.value("filename", "")},
                    {"path", "downloads/" + args.value("filename", "")},
                    {"size_bytes", download_size},
                    {"success", true}
                };
                r.update(download_extra);
                return r;
            }});
        return reg;
    }
};

} // namespace webscout::testing
