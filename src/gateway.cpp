#include "gateway.hpp"
#include "chat_service.hpp"
#include "channels/http_channel.hpp"
#include "runtime.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace webscout {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& config_path, const std::string& host, int port) {
    Runtime rt(Config::load(config_path));
    print_missing_credentials(rt.config);

    std::string bind_host = host.empty() ? rt.config.http_channel.host : host;
    int bind_port = port > 0 ? port : rt.config.http_channel.port;

    ChatStore store;
    ChatService service(store, [&rt](Conversation& conv) {
        auto result = rt.agent.process(conv);
        std::cerr << "[gateway] Chat " << conv.id() << " finished after "
                  << result.tool_calls << " tool calls, " << result.llm_calls << " model calls\n";
    });
    ChatApi api(rt.config, rt.tools, service);
    HTTPChannel http_ch(rt.config.http_channel, api);

    std::atomic<bool> listen_failed{false};
    std::thread server([&]() {
        if (!http_ch.listen(bind_host, bind_port)) {
            listen_failed = true;
            g_running = false;
        }
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::cerr << "[gateway] Ready. Ctrl+C to quit.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    http_ch.stop();
    server.join();
    service.wait_idle();
    std::cerr << "[gateway] Done.\n";
    return listen_failed ? 1 : 0;
}

} // namespace webscout
