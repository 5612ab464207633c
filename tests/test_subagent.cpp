#include "test_framework.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agent/context_builder.hpp"
#include "agent/memory_store.hpp"
#include "agent/subagent_manager.hpp"
#include "agent/task_runner.hpp"
#include "agent/tools/dispatcher.hpp"
#include "agent/tools/filesystem.hpp"
#include "agent/tools/spawn.hpp"
#include "agent/tools/tool_registry.hpp"
#include "providers/llm_provider.hpp"
#include "utils/errors.hpp"
#include "workspace/workspace_state.hpp"

namespace {

using kestrel::agent::CancelToken;
using kestrel::agent::SubagentManager;
using kestrel::agent::SubagentTask;
using kestrel::agent::TaskStatus;

// Blocks every task until released or cancelled.
struct Gate {
    std::atomic<bool> open{false};
    std::atomic<int> started{0};
    std::mutex mutex;
    std::vector<std::string> order;

    SubagentManager::TaskRunner Runner() {
        return [this](const SubagentTask& task, const CancelToken& token) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(task.id);
            }
            ++started;
            while (!open.load() && !token.IsCancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            if (token.IsCancelled()) {
                throw kestrel::utils::Error(kestrel::utils::ErrorKind::kCancelled, "task", "stopped");
            }
            return "done: " + task.description;
        };
    }
};

struct Completions {
    std::mutex mutex;
    std::vector<SubagentTask> tasks;

    SubagentManager::CompletionHandler Handler() {
        return [this](const SubagentTask& task) {
            std::lock_guard<std::mutex> lock(mutex);
            tasks.push_back(task);
        };
    }
    std::size_t Count() {
        std::lock_guard<std::mutex> lock(mutex);
        return tasks.size();
    }
};

bool IsResourceExhausted(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const kestrel::utils::Error& ex) {
        return ex.Kind() == kestrel::utils::ErrorKind::kResourceExhausted;
    }
    return false;
}

class ScriptedProvider : public kestrel::providers::LLMProvider {
public:
    kestrel::providers::LLMResponse Chat(const std::vector<kestrel::providers::Message>& messages,
                                         const std::vector<kestrel::providers::ToolDefinition>& tools,
                                         const std::string&,
                                         int,
                                         double) override {
        ++calls;
        seen_tools = tools.size();
        kestrel::providers::LLMResponse response{};
        if (calls == 1) {
            kestrel::providers::ToolCallRequest call{};
            call.id = "t1";
            call.name = "write_file";
            call.arguments = {{"path", "report.md"}, {"content", "summary"}};
            response.tool_calls.push_back(call);
            return response;
        }
        last_tool_message = messages.back().content;
        response.content = "wrote the report";
        return response;
    }
    std::string GetDefaultModel() const override { return "scripted"; }

    int calls = 0;
    std::size_t seen_tools = 0;
    std::string last_tool_message;
};

}  // namespace

void register_subagent_tests(std::vector<kestrel::tests::TestCase>& tests) {
    using kestrel::tests::require;
    using kestrel::tests::wait_until;

    tests.push_back({"subagent_spawn_returns_before_completion", [] {
        Gate gate;
        Completions done;
        SubagentManager manager(gate.Runner(), {}, done.Handler());
        const auto id = manager.Spawn("summarise the logs", "logs", "telegram", "42");
        require(id.size() == 8, "task id should be 8 hex characters");
        require(wait_until([&] { return gate.started.load() == 1; }), "task should start");
        require(manager.Get(id)->status == TaskStatus::kRunning, "task should still be running");
        gate.open = true;
        require(manager.WaitFor(id, std::chrono::seconds(5)), "task should finish");
        const auto task = manager.Get(id);
        require(task->status == TaskStatus::kCompleted, "task should complete");
        require(task->result == std::string("done: summarise the logs"), "result should be recorded");
        require(wait_until([&] { return done.Count() == 1; }), "completion handler runs once");
        require(done.tasks[0].origin_channel == "telegram" && done.tasks[0].origin_chat_id == "42",
                "completion carries the origin session");
    }});

    tests.push_back({"subagent_rejects_empty_description", [] {
        Gate gate;
        SubagentManager manager(gate.Runner());
        bool threw = false;
        try {
            manager.Spawn("   ");
        } catch (const kestrel::utils::Error& ex) {
            threw = ex.Kind() == kestrel::utils::ErrorKind::kValidation && ex.Field() == "task";
        }
        require(threw, "blank task should be a validation error");
    }});

    tests.push_back({"subagent_reject_policy_bounds_concurrency", [] {
        Gate gate;
        kestrel::agent::SpawnerConfig config{};
        config.max_running = 2;
        config.overflow = kestrel::agent::OverflowPolicy::kReject;
        SubagentManager manager(gate.Runner(), config);
        manager.Spawn("one");
        manager.Spawn("two");
        require(IsResourceExhausted([&] { manager.Spawn("three"); }), "third task should be rejected");
        require(manager.RunningCount() == 2, "two tasks running");
        gate.open = true;
    }});

    tests.push_back({"subagent_queue_policy_starts_pending_in_order", [] {
        Gate gate;
        Completions done;
        kestrel::agent::SpawnerConfig config{};
        config.max_running = 1;
        config.max_pending = 2;
        SubagentManager manager(gate.Runner(), config, done.Handler());
        const auto first = manager.Spawn("first");
        const auto second = manager.Spawn("second");
        const auto third = manager.Spawn("third");
        require(IsResourceExhausted([&] { manager.Spawn("fourth"); }), "queue beyond max_pending is rejected");
        require(manager.Get(second)->status == TaskStatus::kPending, "second task should wait");
        require(manager.RunningCount() == 1, "only one task at a time");
        gate.open = true;
        require(manager.WaitFor(third, std::chrono::seconds(5)), "queued tasks should drain");
        require(wait_until([&] { return done.Count() == 3; }), "three completions");
        std::lock_guard<std::mutex> lock(gate.mutex);
        require(gate.order.size() == 3, "every queued task should start");
        require(gate.order[0] == first && gate.order[1] == second && gate.order[2] == third,
                "queued tasks start first-in first-out");
    }});

    tests.push_back({"subagent_cancel_pending_and_running", [] {
        Gate gate;
        Completions done;
        kestrel::agent::SpawnerConfig config{};
        config.max_running = 1;
        SubagentManager manager(gate.Runner(), config, done.Handler());
        const auto running = manager.Spawn("long job");
        const auto pending = manager.Spawn("queued job");
        require(wait_until([&] { return gate.started.load() == 1; }), "first task should start");

        require(manager.Cancel(pending), "pending task can be cancelled");
        const auto pending_task = manager.Get(pending);
        require(pending_task->status == TaskStatus::kCancelled, "pending task is cancelled at once");

        require(manager.Cancel(running), "running task can be signalled");
        require(manager.WaitFor(running, std::chrono::seconds(5)), "running task reaches a safe point");
        require(manager.Get(running)->status == TaskStatus::kCancelled, "running task ends cancelled");
        require(gate.started.load() == 1, "cancelled pending task never starts");

        require(!manager.Cancel(running), "terminal task cannot be cancelled again");
        require(!manager.Cancel("ffffffff"), "unknown task cannot be cancelled");
        require(wait_until([&] { return done.Count() == 2; }), "both cancellations are announced");
    }});

    tests.push_back({"subagent_failure_is_recorded", [] {
        SubagentManager manager([](const SubagentTask&, const CancelToken&) -> std::string {
            throw std::runtime_error("model unavailable");
        });
        const auto id = manager.Spawn("doomed");
        require(manager.WaitFor(id, std::chrono::seconds(5)), "task should finish");
        const auto task = manager.Get(id);
        require(task->status == TaskStatus::kFailed, "exception should fail the task");
        require(task->result->find("model unavailable") != std::string::npos, "error text should be kept");
    }});

    tests.push_back({"subagent_consume_only_takes_terminal_tasks", [] {
        Gate gate;
        SubagentManager manager(gate.Runner());
        const auto id = manager.Spawn("wait for me");
        require(!manager.Consume(id).has_value(), "running task is not consumable");
        gate.open = true;
        require(manager.WaitFor(id, std::chrono::seconds(5)), "task should finish");
        require(manager.Consume(id).has_value(), "finished task is consumable");
        require(!manager.Get(id).has_value(), "consumed task is forgotten");
    }});

    tests.push_back({"subagent_unclaimed_finished_tasks_expire", [] {
        kestrel::utils::ManualClock clock(1800000000000LL);
        Gate gate;
        gate.open = true;
        kestrel::agent::SpawnerConfig config{};
        config.retain_finished = std::chrono::minutes(1);
        SubagentManager manager(gate.Runner(), config, {}, clock);
        const auto id = manager.Spawn("quick job");
        require(manager.WaitFor(id, std::chrono::seconds(5)), "task should finish");

        clock.AdvanceMs(59999);
        require(manager.List().size() == 1, "finished task is kept within the retention window");
        clock.AdvanceMs(1);
        require(manager.List().empty(), "unclaimed task is dropped after the retention window");
        require(!manager.Get(id).has_value(), "dropped task is gone");

        kestrel::agent::SpawnerConfig keep{};
        keep.retain_finished = std::chrono::milliseconds(0);
        SubagentManager keeper(gate.Runner(), keep, {}, clock);
        const auto kept = keeper.Spawn("kept job");
        require(keeper.WaitFor(kept, std::chrono::seconds(5)), "task should finish");
        clock.AdvanceMs(24LL * 3600 * 1000);
        require(keeper.Consume(kept).has_value(), "zero retention keeps tasks until consumed");
    }});

    tests.push_back({"subagent_destructor_cancels_running_tasks", [] {
        Gate gate;
        const auto started = std::chrono::steady_clock::now();
        {
            SubagentManager manager(gate.Runner());
            manager.Spawn("never released");
            require(wait_until([&] { return gate.started.load() == 1; }), "task should start");
        }
        require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                "destruction should not hang on a running task");
    }});

    tests.push_back({"subagents_tool_reports_conflicts_and_missing_tasks", [] {
        Gate gate;
        SubagentManager manager(gate.Runner());
        kestrel::agent::tools::ToolRegistry registry;
        registry.Register(std::make_unique<kestrel::agent::tools::SpawnTool>(manager));
        registry.Register(std::make_unique<kestrel::agent::tools::SubagentsTool>(manager));
        kestrel::agent::tools::ToolDispatcher dispatcher(registry);

        kestrel::agent::tools::ToolCallRequest spawn{};
        spawn.name = "spawn";
        spawn.arguments = {{"task", "index the repository"}, {"label", "indexer"}};
        const auto spawned = dispatcher.Dispatch(spawn);
        require(spawned.Ok(), spawned.output);
        const auto open = spawned.output.find("id: ");
        require(open != std::string::npos, "spawn output should carry the id");
        const auto id = spawned.output.substr(open + 4, 8);

        kestrel::agent::tools::ToolCallRequest result{};
        result.name = "subagents";
        result.arguments = {{"action", "result"}, {"task_id", id}};
        const auto early = dispatcher.Dispatch(result);
        require(early.error == kestrel::utils::ErrorKind::kConflict, "result of a running task is a conflict");

        kestrel::agent::tools::ToolCallRequest missing{};
        missing.name = "subagents";
        missing.arguments = {{"action", "status"}, {"task_id", "00000000"}};
        const auto unknown = dispatcher.Dispatch(missing);
        require(unknown.error == kestrel::utils::ErrorKind::kJobNotFound, "unknown task is not found");

        gate.open = true;
        require(manager.WaitFor(id, std::chrono::seconds(5)), "task should finish");
        const auto collected = dispatcher.Dispatch(result);
        require(collected.Ok(), collected.output);
        require(collected.output.find("done: index the repository") != std::string::npos, "result text");
        require(!manager.Get(id).has_value(), "collected task is consumed");
    }});

    tests.push_back({"sandbox_task_runner_runs_shell_tasks", [] {
        const auto dir = kestrel::tests::make_temp_dir();
        SubagentManager manager(kestrel::agent::SandboxTaskRunner(dir.string(), std::chrono::seconds(10)));
        const auto ok = manager.Spawn("echo background");
        const auto blocked = manager.Spawn("rm -rf /");
        require(manager.WaitFor(ok, std::chrono::seconds(10)), "shell task should finish");
        require(manager.WaitFor(blocked, std::chrono::seconds(10)), "blocked task should finish");
        require(manager.Get(ok)->status == TaskStatus::kCompleted, "echo should complete");
        require(manager.Get(ok)->result == std::string("background\n"), "stdout is the result");
        require(manager.Get(blocked)->status == TaskStatus::kFailed, "destructive task should fail");
    }});

    tests.push_back({"agent_task_runner_drives_tool_loop", [] {
        kestrel::workspace::WorkspaceState state(kestrel::tests::make_temp_dir());
        kestrel::agent::MemoryStore memory(state);
        kestrel::agent::ContextBuilder context(state, memory);
        kestrel::agent::tools::ToolRegistry registry;
        registry.Register(std::make_unique<kestrel::agent::tools::WriteFileTool>(state, true));
        kestrel::agent::tools::ToolDispatcher dispatcher(registry);
        ScriptedProvider provider;

        SubagentManager manager(kestrel::agent::AgentTaskRunner(provider, dispatcher, context));
        const auto id = manager.Spawn("write a report");
        require(manager.WaitFor(id, std::chrono::seconds(5)), "task should finish");
        const auto task = manager.Get(id);
        require(task->status == TaskStatus::kCompleted, "agent task should complete");
        require(task->result == std::string("wrote the report"), "final content is the result");
        require(provider.calls == 2, "one tool round then a final answer");
        require(provider.seen_tools == 1, "only the isolated registry is offered");
        require(state.Read("report.md") == "summary", "tool call should run");
        require(provider.last_tool_message.find("Wrote 7 bytes") != std::string::npos,
                "tool result should be fed back");
    }});
}
