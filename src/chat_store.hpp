#pragma once
#include "conversation.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace webscout {

// In-memory session store. Conversations live as long as the process.
class ChatStore {
public:
    std::shared_ptr<Conversation> create();
    std::shared_ptr<Conversation> get(const std::string& id) const;

    // {id, messages, total_messages, is_processing}, or nothing for an unknown id.
    std::optional<nlohmann::json> messages_since(const std::string& id, size_t since) const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Conversation>> chats_;
};

} // namespace webscout
