#pragma once

#include <memory>
#include <thread>

#include "agent/context_builder.hpp"
#include "agent/memory_store.hpp"
#include "agent/subagent_manager.hpp"
#include "agent/tools/dispatcher.hpp"
#include "agent/tools/tool_registry.hpp"
#include "bus/message_bus.hpp"
#include "config/config_schema.hpp"
#include "cron/cron_service.hpp"
#include "heartbeat/heartbeat_service.hpp"
#include "providers/llm_provider.hpp"
#include "utils/clock.hpp"
#include "workspace/workspace_state.hpp"

namespace kestrel::cli {

// Wires the services of one kestrel process around a single workspace.
// Without a provider, spawned tasks run as sandboxed shell commands.
class Runtime {
public:
    explicit Runtime(config::Config config,
                     providers::LLMProvider* provider = nullptr,
                     const utils::Clock& clock = utils::SystemClock::Instance());
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Starts cron, heartbeat and outbound delivery threads.
    void Start();
    void Stop();

    agent::tools::ToolResult Dispatch(const agent::tools::ToolCallRequest& request,
                                      const agent::tools::ToolContext& context);

    const config::Config& Settings() const { return config_; }
    workspace::WorkspaceState& Workspace() { return workspace_; }
    agent::MemoryStore& Memory() { return memory_; }
    bus::MessageBus& Bus() { return bus_; }
    agent::SubagentManager& Subagents() { return *subagents_; }
    cron::CronService& Cron() { return *cron_; }
    heartbeat::HeartbeatService& Heartbeat() { return *heartbeat_; }
    const agent::tools::ToolDispatcher& Dispatcher() const { return *dispatcher_; }

private:
    void RegisterWorkerTools(agent::tools::ToolRegistry& registry);
    void OnSubagentFinished(const agent::SubagentTask& task);

    config::Config config_;
    const utils::Clock& clock_;
    workspace::WorkspaceState workspace_;
    agent::MemoryStore memory_;
    bus::MessageBus bus_;
    agent::ContextBuilder context_;

    agent::tools::ToolRegistry subagent_registry_;
    std::unique_ptr<agent::tools::ToolDispatcher> subagent_dispatcher_;
    std::unique_ptr<agent::SubagentManager> subagents_;
    std::unique_ptr<cron::CronService> cron_;

    agent::tools::ToolRegistry registry_;
    std::unique_ptr<agent::tools::ToolDispatcher> dispatcher_;
    std::unique_ptr<heartbeat::HeartbeatService> heartbeat_;

    std::thread outbound_thread_;
    bool started_ = false;
};

}  // namespace kestrel::cli
