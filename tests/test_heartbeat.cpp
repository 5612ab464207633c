#include "test_framework.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "agent/tools/dispatcher.hpp"
#include "agent/tools/filesystem.hpp"
#include "agent/tools/message.hpp"
#include "agent/tools/shell.hpp"
#include "agent/tools/tool_registry.hpp"
#include "heartbeat/checklist.hpp"
#include "heartbeat/heartbeat_service.hpp"
#include "workspace/workspace_state.hpp"

namespace {

using kestrel::heartbeat::Checklist;
using kestrel::heartbeat::HeartbeatOptions;
using kestrel::heartbeat::HeartbeatService;

struct Fixture {
    explicit Fixture(HeartbeatOptions options = {})
        : state(kestrel::tests::make_temp_dir()) {
        registry.Register(std::make_unique<kestrel::agent::tools::WriteFileTool>(state, true));
        registry.Register(std::make_unique<kestrel::agent::tools::ExecTool>(state.Root().string()));
        registry.Register(std::make_unique<kestrel::agent::tools::MessageTool>(
            [this](const kestrel::bus::OutboundMessage& msg) {
                std::lock_guard<std::mutex> lock(mutex);
                sent.push_back(msg);
            }));
        dispatcher = std::make_unique<kestrel::agent::tools::ToolDispatcher>(registry);
        service = std::make_unique<HeartbeatService>(state, *dispatcher, options);
    }

    kestrel::workspace::WorkspaceState state;
    kestrel::agent::tools::ToolRegistry registry;
    std::unique_ptr<kestrel::agent::tools::ToolDispatcher> dispatcher;
    std::unique_ptr<HeartbeatService> service;
    std::mutex mutex;
    std::vector<kestrel::bus::OutboundMessage> sent;
};

}  // namespace

void register_heartbeat_tests(std::vector<kestrel::tests::TestCase>& tests) {
    using kestrel::tests::require;

    tests.push_back({"heartbeat_runs_are_idempotent", [] {
        Fixture fx;
        fx.state.Replace(HeartbeatService::kHeartbeatFile,
                         "# Periodic tasks\n"
                         "- [ ] write_file {\"path\":\"status.txt\",\"content\":\"ok\"}\n"
                         "- [ ] ask how the launch went\n");
        const auto first = fx.service->RunOnce();
        require(first.attempted == 1 && first.succeeded == 1, "tool item should run once");
        require(first.skipped == 1, "plain text without a target is skipped");
        require(fx.state.Read("status.txt") == "ok", "tool call should take effect");
        const auto content = fx.state.Read(HeartbeatService::kHeartbeatFile);
        require(content == "# Periodic tasks\n"
                           "- [x] write_file {\"path\":\"status.txt\",\"content\":\"ok\"}\n"
                           "- [ ] ask how the launch went\n",
                "only the finished item is checked off: " + content);

        fx.state.Replace("status.txt", "changed");
        const auto second = fx.service->RunOnce();
        require(second.attempted == 0, "done items are not repeated");
        require(fx.state.Read("status.txt") == "changed", "second run has no effect");
    }});

    tests.push_back({"heartbeat_failure_does_not_stop_later_items", [] {
        Fixture fx;
        fx.state.Replace(HeartbeatService::kHeartbeatFile,
                         "- [ ] exec {\"command\":\"exit 4\"}\n"
                         "- [ ] write_file {\"path\":\"after.txt\",\"content\":\"done\"}\n");
        const auto report = fx.service->RunOnce();
        require(report.attempted == 2 && report.failed == 1 && report.succeeded == 1, "one failure, one success");
        const auto checklist = Checklist::Parse(fx.state.Read(HeartbeatService::kHeartbeatFile));
        require(!checklist.Items()[0].done, "failed item stays open for the next period");
        require(checklist.Items()[1].done, "later item still runs");

        const auto retry = fx.service->RunOnce();
        require(retry.attempted == 1 && retry.failed == 1, "failed item is retried next run");
    }});

    tests.push_back({"heartbeat_plain_items_go_to_configured_target", [] {
        HeartbeatOptions options{};
        options.channel = "telegram";
        options.to = "42";
        Fixture fx(options);
        fx.state.Replace(HeartbeatService::kHeartbeatFile, "* [ ] Remind me to water the plants\n");
        const auto report = fx.service->RunOnce();
        require(report.succeeded == 1, "message should be sent");
        require(fx.sent.size() == 1, "one message");
        require(fx.sent[0].channel == "telegram" && fx.sent[0].chat_id == "42", "message target");
        require(fx.sent[0].content == "Remind me to water the plants", "message text");
        require(fx.state.Read(HeartbeatService::kHeartbeatFile) == "* [x] Remind me to water the plants\n",
                "item is checked off after delivery");
    }});

    tests.push_back({"heartbeat_empty_checklist_does_nothing", [] {
        Fixture fx;
        fx.state.Replace(HeartbeatService::kHeartbeatFile, "# Tasks\n\n<!-- nothing yet -->\n- [ ]\n");
        const auto report = fx.service->RunOnce();
        require(report.attempted == 0 && report.skipped == 0, "empty checklist yields an empty report");
        require(Checklist::IsEffectivelyEmpty(""), "missing file is empty");
        require(!Checklist::IsEffectivelyEmpty("- [ ] real task"), "an open item is not empty");
    }});

    tests.push_back({"heartbeat_plan_rejects_unknown_tools_and_bad_json", [] {
        Fixture fx;
        kestrel::heartbeat::ChecklistItem item{3, "exec {not json", false};
        require(!fx.service->Plan(item).has_value(), "broken arguments fall back to text (skipped without a target)");
        item.text = "teleport {\"to\":\"mars\"}";
        require(!fx.service->Plan(item).has_value(), "unregistered tool name is plain text");
        item.text = "exec {\"command\":\"date\"}";
        const auto call = fx.service->Plan(item);
        require(call && call->name == "exec" && call->arguments.at("command") == "date", "tool directive");
        require(call->id == "heartbeat:3", "call id names the line");
    }});

    tests.push_back({"checklist_parse_recognises_items_only", [] {
        const auto checklist = Checklist::Parse(
            "# Heading\n"
            "- [ ] first\n"
            "  * [X] second\n"
            "- plain bullet\n"
            "-[ ] missing space\n"
            "- [?] odd mark\n");
        const auto& items = checklist.Items();
        require(items.size() == 2, "two items expected, got " + std::to_string(items.size()));
        require(items[0].line == 1 && items[0].text == "first" && !items[0].done, "first item");
        require(items[1].line == 2 && items[1].text == "second" && items[1].done, "second item");
        require(checklist.Pending().size() == 1, "one pending item");
    }});

    tests.push_back({"checklist_mark_done_picks_nearest_duplicate", [] {
        const std::string content =
            "- [ ] backup\n"
            "middle\n"
            "middle\n"
            "- [ ] backup\n";
        bool marked = false;
        const auto updated = Checklist::MarkDone(content, "backup", 3, &marked);
        require(marked, "item should be marked");
        require(updated == "- [ ] backup\nmiddle\nmiddle\n- [x] backup\n", "nearest duplicate is checked: " + updated);

        const auto shifted = Checklist::MarkDone("new line\n" + content, "backup", 0, &marked);
        require(shifted == "new line\n- [x] backup\nmiddle\nmiddle\n- [ ] backup\n",
                "nearest match survives inserted lines: " + shifted);

        const auto untouched = Checklist::MarkDone(content, "restore", 0, &marked);
        require(!marked && untouched == content, "missing item leaves content alone");
    }});
}
