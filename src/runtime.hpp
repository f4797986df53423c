#pragma once
#include "agent.hpp"
#include "audit_log.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "tool_registry.hpp"

namespace webscout {

// Everything one process needs to run the agent, wired from a Config.
struct Runtime {
    explicit Runtime(Config cfg);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    Config config;
    ToolRegistry tools;
    Provider provider;
    AuditLog audit;
    Agent agent;
};

void print_missing_credentials(const Config& cfg);

} // namespace webscout
