#include "chat_service.hpp"
#include <iostream>
#include <system_error>

namespace webscout {

ChatService::ChatService(ChatStore& store, Runner runner)
    : store_(store), runner_(std::move(runner)) {}

ChatService::~ChatService() {
    wait_idle();
}

SubmitResult ChatService::submit(const std::optional<std::string>& chat_id, const std::string& message) {
    std::shared_ptr<Conversation> conv;
    if (chat_id) {
        conv = store_.get(*chat_id);
        if (!conv) return {SubmitStatus::not_found, *chat_id};
    } else {
        conv = store_.create();
    }

    if (!conv->try_begin_processing()) {
        return {SubmitStatus::busy, conv->id()};
    }
    conv->add_user_message(message);

    reap_finished();
    start_worker(conv);
    return {SubmitStatus::accepted, conv->id()};
}

void ChatService::start_worker(std::shared_ptr<Conversation> conv) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread t([this, conv, done]() {
            {
                ProcessingGuard guard(*conv);
                try {
                    runner_(*conv);
                } catch (const std::exception& e) {
                    std::cerr << "[chat] Worker for " << conv->id() << " failed: " << e.what() << "\n";
                    conv->add_system_message(std::string("Error: ") + e.what());
                } catch (...) {
                    std::cerr << "[chat] Worker for " << conv->id() << " failed with a non-standard exception\n";
                    conv->add_system_message("Error: unexpected failure while processing the message");
                }
            }
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::move(t), done});
    } catch (const std::system_error& e) {
        std::cerr << "[chat] Cannot start worker for " << conv->id() << ": " << e.what() << "\n";
        conv->end_processing();
        throw;
    }
}

void ChatService::reap_finished() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void ChatService::wait_idle() {
    for (;;) {
        std::vector<Worker> running;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            running.swap(workers_);
        }
        if (running.empty()) return;
        for (auto& w : running) {
            if (w.thread.joinable()) w.thread.join();
        }
    }
}

} // namespace webscout
