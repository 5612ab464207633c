#include "cli/runtime.hpp"

#include <utility>

#include "agent/task_runner.hpp"
#include "agent/tools/cron.hpp"
#include "agent/tools/filesystem.hpp"
#include "agent/tools/message.hpp"
#include "agent/tools/shell.hpp"
#include "agent/tools/spawn.hpp"
#include "agent/tools/web.hpp"
#include "cron/cron_delivery.hpp"
#include "utils/logging.hpp"

namespace kestrel::cli {
namespace {

agent::tools::DispatcherOptions ToDispatcherOptions(const config::ToolsConfig& tools) {
    agent::tools::DispatcherOptions options{};
    options.default_timeout = std::chrono::seconds(tools.exec_timeout_s);
    options.max_timeout = std::chrono::seconds(tools.max_timeout_s);
    options.log_history = tools.log_history;
    return options;
}

agent::SpawnerConfig ToSpawnerConfig(const config::SpawnerConfig& spawner) {
    agent::SpawnerConfig result{};
    result.max_running = static_cast<std::size_t>(spawner.max_running);
    result.max_pending = static_cast<std::size_t>(spawner.max_pending);
    result.overflow = spawner.overflow == "reject" ? agent::OverflowPolicy::kReject
                                                   : agent::OverflowPolicy::kQueue;
    result.retain_finished = std::chrono::seconds(spawner.retain_finished_s);
    return result;
}

}  // namespace

Runtime::Runtime(config::Config config, providers::LLMProvider* provider, const utils::Clock& clock)
    : config_(std::move(config))
    , clock_(clock)
    , workspace_(config_.agents.defaults.workspace)
    , memory_(workspace_, clock_)
    , context_(workspace_, memory_, clock_) {
    const auto dispatcher_options = ToDispatcherOptions(config_.tools);

    RegisterWorkerTools(subagent_registry_);
    subagent_dispatcher_ = std::make_unique<agent::tools::ToolDispatcher>(
        subagent_registry_, dispatcher_options, &memory_);

    agent::SubagentManager::TaskRunner runner;
    if (provider) {
        agent::AgentRunnerOptions runner_options{};
        runner_options.model = config_.agents.defaults.model;
        runner_options.max_tokens = config_.agents.defaults.max_tokens;
        runner_options.temperature = config_.agents.defaults.temperature;
        runner_options.max_iterations = config_.agents.defaults.max_tool_iterations;
        runner = agent::AgentTaskRunner(*provider, *subagent_dispatcher_, context_, runner_options);
    } else {
        runner = agent::SandboxTaskRunner(workspace_.Root().string(),
                                          std::chrono::seconds(config_.spawner.task_timeout_s));
    }
    subagents_ = std::make_unique<agent::SubagentManager>(
        std::move(runner),
        ToSpawnerConfig(config_.spawner),
        [this](const agent::SubagentTask& task) { OnSubagentFinished(task); },
        clock_);

    cron_ = std::make_unique<cron::CronService>(
        workspace_,
        config_.cron.store_path,
        cron::MakeBusDelivery(bus_),
        clock_,
        std::chrono::seconds(config_.cron.tick_seconds));

    RegisterWorkerTools(registry_);
    registry_.Register(std::make_unique<agent::tools::MessageTool>(
        [this](const bus::OutboundMessage& msg) { bus_.PublishOutbound(msg); }));
    registry_.Register(std::make_unique<agent::tools::SpawnTool>(*subagents_));
    registry_.Register(std::make_unique<agent::tools::SubagentsTool>(*subagents_));
    registry_.Register(std::make_unique<agent::tools::CronTool>(*cron_));
    dispatcher_ = std::make_unique<agent::tools::ToolDispatcher>(registry_, dispatcher_options, &memory_);

    heartbeat::HeartbeatOptions heartbeat_options{};
    heartbeat_options.interval = std::chrono::seconds(config_.heartbeat.interval_s);
    heartbeat_options.enabled = config_.heartbeat.enabled;
    heartbeat_options.channel = config_.heartbeat.channel;
    heartbeat_options.to = config_.heartbeat.to;
    heartbeat_ = std::make_unique<heartbeat::HeartbeatService>(workspace_, *dispatcher_, heartbeat_options);
}

Runtime::~Runtime() {
    Stop();
}

void Runtime::Start() {
    if (started_) {
        return;
    }
    started_ = true;
    outbound_thread_ = std::thread([this]() { bus_.DispatchOutbound(); });
    cron_->Start();
    heartbeat_->Start();
    utils::LogInfo("runtime", "started", {{"workspace", workspace_.Root().string()}});
}

void Runtime::Stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    heartbeat_->Stop();
    cron_->Stop();
    bus_.Stop();
    if (outbound_thread_.joinable()) {
        outbound_thread_.join();
    }
    utils::LogInfo("runtime", "stopped");
}

agent::tools::ToolResult Runtime::Dispatch(const agent::tools::ToolCallRequest& request,
                                           const agent::tools::ToolContext& context) {
    return dispatcher_->Dispatch(request, context);
}

void Runtime::RegisterWorkerTools(agent::tools::ToolRegistry& registry) {
    const bool restrict = config_.tools.restrict_to_workspace;
    registry.Register(std::make_unique<agent::tools::ReadFileTool>(workspace_, restrict));
    registry.Register(std::make_unique<agent::tools::WriteFileTool>(workspace_, restrict));
    registry.Register(std::make_unique<agent::tools::EditFileTool>(workspace_, restrict));
    registry.Register(std::make_unique<agent::tools::ListDirTool>(workspace_, restrict));
    registry.Register(std::make_unique<agent::tools::ExecTool>(workspace_.Root().string()));
    registry.Register(std::make_unique<agent::tools::WebSearchTool>(config_.tools.brave_api_key));
    registry.Register(std::make_unique<agent::tools::WebFetchTool>());
}

void Runtime::OnSubagentFinished(const agent::SubagentTask& task) {
    bus::InboundMessage msg{};
    msg.channel = "system";
    msg.sender_id = "subagent";
    msg.chat_id = task.origin_channel + ":" + task.origin_chat_id;
    msg.content = "[Subagent '" + task.DisplayLabel() + "' " + agent::ToString(task.status) + "]\n\n" +
                  "Task: " + task.description + "\n\n" +
                  "Result:\n" + task.result.value_or("");
    msg.metadata["task_id"] = task.id;
    bus_.PublishInbound(msg);
    memory_.AppendHistory("[" + msg.chat_id + "] subagent " + task.id + " '" + task.DisplayLabel() + "' " +
                          agent::ToString(task.status));
}

}  // namespace kestrel::cli
