#pragma once
#include "conversation.hpp"
#include <ostream>
#include <string>

namespace webscout {

// Prints the messages a terminal user has not seen yet. The renderer owns
// the last-rendered index; messages themselves carry no display state.
class ConsoleRenderer {
public:
    // Returns the number of messages consumed (user messages are skipped
    // but still consumed).
    size_t render_new(const Conversation& conv, std::ostream& out);
    size_t rendered() const { return next_; }

private:
    size_t next_ = 0;
};

int cmd_chat(const std::string& config_path);

} // namespace webscout
