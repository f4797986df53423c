#pragma once
#include "chat_store.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace webscout {

enum class SubmitStatus { accepted, not_found, busy };

struct SubmitResult {
    SubmitStatus status = SubmitStatus::accepted;
    std::string chat_id;
};

// Accepts user messages and runs the agent for each on its own worker thread.
// At most one run per conversation: the processing flag is claimed before the
// worker starts and released by the worker when it ends.
class ChatService {
public:
    using Runner = std::function<void(Conversation&)>;

    ChatService(ChatStore& store, Runner runner);
    ~ChatService();

    ChatService(const ChatService&) = delete;
    ChatService& operator=(const ChatService&) = delete;

    // No chat_id starts a new conversation.
    SubmitResult submit(const std::optional<std::string>& chat_id, const std::string& message);

    // Blocks until every worker started so far has finished.
    void wait_idle();

    ChatStore& store() { return store_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void start_worker(std::shared_ptr<Conversation> conv);
    void reap_finished();

    ChatStore& store_;
    Runner runner_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace webscout
