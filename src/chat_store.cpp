#include "chat_store.hpp"
#include "utils.hpp"

namespace webscout {

std::shared_ptr<Conversation> ChatStore::create() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = generate_chat_id();
    while (chats_.count(id)) id = generate_chat_id();
    auto conv = std::make_shared<Conversation>(id);
    chats_[id] = conv;
    return conv;
}

std::shared_ptr<Conversation> ChatStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chats_.find(id);
    return it == chats_.end() ? nullptr : it->second;
}

std::optional<nlohmann::json> ChatStore::messages_since(const std::string& id, size_t since) const {
    auto conv = get(id);
    if (!conv) return std::nullopt;
    // Read the flag first: a poller that sees is_processing == false is then
    // guaranteed to also see every message of the finished run.
    bool processing = conv->is_processing();
    auto messages = conv->messages_since(since);
    size_t total = since + messages.size();
    if (messages.empty()) total = conv->message_count();
    return nlohmann::json{
        {"id", conv->id()},
        {"messages", std::move(messages)},
        {"total_messages", total},
        {"is_processing", processing}
    };
}

size_t ChatStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chats_.size();
}

} // namespace webscout
