#include "cli_chat.hpp"
#include "chat_service.hpp"
#include "runtime.hpp"
#include "utils.hpp"
#include <chrono>
#include <iostream>
#include <thread>

namespace webscout {

size_t ConsoleRenderer::render_new(const Conversation& conv, std::ostream& out) {
    auto msgs = conv.messages();
    size_t consumed = 0;
    for (; next_ < msgs.size(); next_++, consumed++) {
        auto& m = msgs[next_];
        switch (m.role) {
            case MessageRole::user:
                break;
            case MessageRole::assistant:
                out << "\n" << m.content << "\n\n";
                break;
            case MessageRole::tool_activity:
                out << "  -> " << m.tool_name << " " << truncate_utf8(dump_json(m.tool_args), 120)
                    << " (" << m.tool_duration_ms << " ms)";
                if (m.tool_result.is_object() && m.tool_result.contains("error")) {
                    out << " error: " << truncate_utf8(dump_json(m.tool_result["error"]), 160);
                }
                out << "\n";
                break;
            case MessageRole::file:
                out << "  [file] " << m.filename << " (" << format_thousands(m.file_size)
                    << " bytes) -> " << m.file_path << "\n";
                break;
            case MessageRole::system:
                out << "  [system] " << m.content << "\n";
                break;
        }
    }
    out << std::flush;
    return consumed;
}

int cmd_chat(const std::string& config_path) {
    Runtime rt(Config::load(config_path));
    print_missing_credentials(rt.config);

    ChatStore store;
    ChatService service(store, [&rt](Conversation& conv) { rt.agent.process(conv); });

    std::optional<std::string> chat_id;
    ConsoleRenderer renderer;

    std::cerr << "[chat] Model " << rt.config.model << ", up to " << rt.config.max_tool_calls
              << " tool calls per message. Type 'exit' to quit.\n";

    std::string line;
    while (true) {
        std::cout << "you> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        if (line == "exit" || line == "quit" || line == ":q") break;

        auto result = service.submit(chat_id, line);
        if (result.status != SubmitStatus::accepted) {
            std::cerr << "[chat] Message rejected\n";
            continue;
        }
        chat_id = result.chat_id;

        auto conv = store.get(result.chat_id);
        while (conv->is_processing()) {
            renderer.render_new(*conv, std::cout);
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
        }
        renderer.render_new(*conv, std::cout);
    }
    service.wait_idle();
    return 0;
}

} // namespace webscout
