#include <iostream>
#include <string>
#include <vector>
#include "cli_chat.hpp"
#include "gateway.hpp"
#include "status.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: webscout <command> [options]\n\n"
              << "Commands:\n"
              << "  serve [--host H] [--port P] [--config PATH]\n"
              << "                              Start the HTTP chat server\n"
              << "  chat [--config PATH]        Interactive research chat in the terminal\n"
              << "  status [--config PATH]      Show the effective configuration\n\n"
              << "The config path defaults to $WEBSCOUT_CONFIG, then ./config.json.\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    std::string config_path = webscout::default_config_path();
    std::string host;
    int port = 0;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--host" && i + 1 < args.size()) {
            host = args[++i];
        } else if (args[i] == "--port" && i + 1 < args.size()) {
            try {
                port = std::stoi(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << args[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << args[i] << "\n";
            print_usage();
            return 1;
        }
    }

    try {
        if (cmd == "serve") {
            return webscout::cmd_serve(config_path, host, port);
        } else if (cmd == "chat") {
            return webscout::cmd_chat(config_path);
        } else if (cmd == "status") {
            return webscout::cmd_status(config_path);
        } else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}
