#pragma once
#include "message.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace webscout {

// One chat session: the human-visible message log plus the transcript sent
// to the model. Both only ever grow. Pollers may read while a worker appends.
class Conversation {
public:
    explicit Conversation(std::string id) : id_(std::move(id)) {}

    const std::string& id() const { return id_; }

    void add_user_message(const std::string& text);
    void add_assistant_message(const std::string& text);
    void add_tool_activity(const std::string& tool_name, const nlohmann::json& args,
                           const nlohmann::json& result, int64_t duration_ms);
    void add_file_message(const std::string& filename, const std::string& path, int64_t size);
    // Visible to the user, and echoed to the model as "[SYSTEM CHECK] ..."
    void add_system_message(const std::string& text);

    void ensure_system_prompt(const std::string& prompt);
    void append_transcript(TranscriptEntry entry);

    std::vector<TranscriptEntry> transcript() const;
    std::vector<ChatMessage> messages() const;
    size_t message_count() const;
    nlohmann::json messages_since(size_t index) const;

    bool is_processing() const { return processing_.load(); }
    // false when a run is already in flight
    bool try_begin_processing();
    void end_processing() { processing_.store(false); }

private:
    void push_message(ChatMessage msg);

    std::string id_;
    mutable std::mutex mutex_;
    std::vector<ChatMessage> messages_;
    std::vector<TranscriptEntry> transcript_;
    std::atomic<bool> processing_{false};
};

// Clears the processing flag when the worker leaves, however it leaves.
class ProcessingGuard {
public:
    explicit ProcessingGuard(Conversation& conv) : conv_(conv) {}
    ~ProcessingGuard() { conv_.end_processing(); }
    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    Conversation& conv_;
};

} // namespace webscout
