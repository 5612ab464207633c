#include "test_framework.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "cli/runtime.hpp"
#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "utils/clock.hpp"

namespace {

using kestrel::agent::tools::ToolCallRequest;
using kestrel::agent::tools::ToolContext;

kestrel::config::Config MakeConfig() {
    const auto dir = kestrel::tests::make_temp_dir("kestrel-runtime");
    kestrel::config::Config config{};
    config.agents.defaults.workspace = (dir / "workspace").string();
    config.cron.store_path = (dir / "cron" / "jobs.json").string();
    config.cron.tick_seconds = 1;
    config.heartbeat.enabled = false;
    config.tools.restrict_to_workspace = true;
    config.spawner.max_running = 2;
    config.spawner.task_timeout_s = 10;
    return config;
}

ToolCallRequest Call(const std::string& name, kestrel::agent::tools::ToolArguments arguments) {
    ToolCallRequest request{};
    request.id = "rt-" + name;
    request.name = name;
    request.arguments = std::move(arguments);
    return request;
}

ToolContext Session(const std::string& channel, const std::string& chat_id) {
    ToolContext context{};
    context.channel = channel;
    context.chat_id = chat_id;
    return context;
}

}  // namespace

void register_runtime_tests(std::vector<kestrel::tests::TestCase>& tests) {
    using kestrel::tests::require;

    tests.push_back({"runtime_registers_every_tool", [] {
        kestrel::cli::Runtime runtime(MakeConfig());
        for (const char* name : {"read_file", "write_file", "edit_file", "list_dir", "exec", "web_search",
                                 "web_fetch", "message", "spawn", "subagents", "cron"}) {
            require(runtime.Dispatcher().Registry().Has(name), std::string("missing tool ") + name);
        }
    }});

    tests.push_back({"runtime_spawn_announces_completion_to_origin", [] {
        kestrel::cli::Runtime runtime(MakeConfig());
        const auto spawned = runtime.Dispatch(
            Call("spawn", {{"task", "echo from the background"}, {"label", "echoer"}}), Session("telegram", "42"));
        require(spawned.Ok(), spawned.output);

        kestrel::bus::InboundMessage announced;
        require(runtime.Bus().TryConsumeInbound(announced, std::chrono::seconds(10)), "completion is announced");
        require(announced.channel == "system" && announced.sender_id == "subagent", "system message from subagent");
        require(announced.chat_id == "telegram:42", "keyed to the origin session");
        require(announced.content.rfind("[Subagent 'echoer' completed]", 0) == 0, "status header: " + announced.content);
        require(announced.content.find("from the background") != std::string::npos, "result included");
        require(kestrel::tests::wait_until([&] {
            return runtime.Memory().ReadHistory().find("subagent") != std::string::npos;
        }), "completion is logged to history");
    }});

    tests.push_back({"runtime_message_tool_delivers_through_bus", [] {
        kestrel::cli::Runtime runtime(MakeConfig());
        std::mutex mutex;
        std::vector<kestrel::bus::OutboundMessage> delivered;
        runtime.Bus().SubscribeOutbound("telegram", [&](const kestrel::bus::OutboundMessage& msg) {
            std::lock_guard<std::mutex> lock(mutex);
            delivered.push_back(msg);
        });
        runtime.Start();
        const auto sent = runtime.Dispatch(Call("message", {{"content", "hi there"}}), Session("telegram", "7"));
        require(sent.Ok(), sent.output);
        require(kestrel::tests::wait_until([&] {
            std::lock_guard<std::mutex> lock(mutex);
            return delivered.size() == 1;
        }), "outbound dispatcher delivers the message");
        runtime.Stop();
        require(delivered[0].chat_id == "7" && delivered[0].content == "hi there", "message defaults to the session");
    }});

    tests.push_back({"runtime_cron_reminder_reaches_recipient_once", [] {
        kestrel::utils::ManualClock clock(1800000000000LL);
        kestrel::cli::Runtime runtime(MakeConfig(), nullptr, clock);
        const auto added = runtime.Dispatch(
            Call("cron", {{"action", "add"}, {"name", "stretch"}, {"message", "stand up"},
                          {"mode", "reminder"}, {"at_ms", std::to_string(clock.NowMs() + 5000)}}),
            Session("telegram", "42"));
        require(added.Ok(), added.output);

        clock.AdvanceMs(5000);
        require(runtime.Cron().RunDueJobs() == 1, "reminder fires");
        require(runtime.Cron().RunDueJobs() == 0, "reminder fires once");
        kestrel::bus::OutboundMessage outbound;
        require(runtime.Bus().TryConsumeOutbound(outbound, std::chrono::milliseconds(100)), "reminder is queued");
        require(outbound.channel == "telegram" && outbound.chat_id == "42" && outbound.content == "stand up",
                "reminder goes to the recipient");
        require(!runtime.Bus().TryConsumeOutbound(outbound, std::chrono::milliseconds(50)), "no duplicate delivery");

        const auto listed = runtime.Dispatch(Call("cron", {{"action", "list"}}), Session("cli", "direct"));
        require(listed.Ok() && nlohmann::json::parse(listed.output).empty(), "one-time job is gone");
    }});

    tests.push_back({"runtime_heartbeat_uses_full_tool_surface", [] {
        kestrel::cli::Runtime runtime(MakeConfig());
        runtime.Workspace().Replace("HEARTBEAT.md", "- [ ] write_file {\"path\":\"beat.txt\",\"content\":\"alive\"}\n");
        const auto report = runtime.Heartbeat().RunOnce();
        require(report.succeeded == 1, "heartbeat item runs");
        require(runtime.Workspace().Read("beat.txt") == "alive", "item effect is visible");
        require(runtime.Workspace().Read("HEARTBEAT.md").rfind("- [x]", 0) == 0, "item is checked off");
    }});
}
