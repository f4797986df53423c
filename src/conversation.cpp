#include "conversation.hpp"
#include "utils.hpp"

namespace webscout {

void Conversation::push_message(ChatMessage msg) {
    msg.timestamp = epoch_now_f();
    messages_.push_back(std::move(msg));
}

void Conversation::add_user_message(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChatMessage m;
    m.role = MessageRole::user;
    m.content = text;
    push_message(std::move(m));
    transcript_.push_back(TranscriptEntry::user(text));
}

void Conversation::add_assistant_message(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChatMessage m;
    m.role = MessageRole::assistant;
    m.content = text;
    push_message(std::move(m));
}

void Conversation::add_tool_activity(const std::string& tool_name, const nlohmann::json& args,
                                     const nlohmann::json& result, int64_t duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChatMessage m;
    m.role = MessageRole::tool_activity;
    m.content = "Called " + tool_name;
    m.tool_name = tool_name;
    m.tool_args = args;
    m.tool_result = result;
    m.tool_duration_ms = duration_ms;
    push_message(std::move(m));
}

void Conversation::add_file_message(const std::string& filename, const std::string& path, int64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChatMessage m;
    m.role = MessageRole::file;
    m.content = "Downloaded " + filename;
    m.filename = filename;
    m.file_path = path;
    m.file_size = size;
    push_message(std::move(m));
}

void Conversation::add_system_message(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChatMessage m;
    m.role = MessageRole::system;
    m.content = text;
    push_message(std::move(m));
    transcript_.push_back(TranscriptEntry::user("[SYSTEM CHECK] " + text));
}

void Conversation::ensure_system_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transcript_.empty() && transcript_.front().role == TurnRole::system) return;
    transcript_.insert(transcript_.begin(), TranscriptEntry::system(prompt));
}

void Conversation::append_transcript(TranscriptEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    transcript_.push_back(std::move(entry));
}

std::vector<TranscriptEntry> Conversation::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

std::vector<ChatMessage> Conversation::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

size_t Conversation::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

nlohmann::json Conversation::messages_since(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json arr = nlohmann::json::array();
    for (size_t i = index; i < messages_.size(); i++) {
        arr.push_back(messages_[i].to_json());
    }
    return arr;
}

bool Conversation::try_begin_processing() {
    bool expected = false;
    return processing_.compare_exchange_strong(expected, true);
}

} // namespace webscout
