#include "agent/tools/spawn.hpp"

#include <sstream>

#include "utils/common.hpp"

namespace kestrel::agent::tools {
namespace {

std::string Describe(const SubagentTask& task) {
    std::ostringstream oss;
    oss << task.id << " [" << ToString(task.status) << "] " << task.DisplayLabel();
    return oss.str();
}

SubagentTask RequireTask(const SubagentManager& manager, const std::string& task_id) {
    auto task = manager.Get(task_id);
    if (!task) {
        throw utils::Error(utils::ErrorKind::kJobNotFound, "task_id", "no subagent task " + task_id);
    }
    return *task;
}

}  // namespace

SpawnTool::SpawnTool(SubagentManager& manager)
    : manager_(manager) {}

std::string SpawnTool::ParametersJson() const {
    return R"({"type":"object","properties":{"task":{"type":"string","description":"what the subagent should do"},"label":{"type":"string","description":"short display name"}},"required":["task"]})";
}

std::string SpawnTool::Execute(const ToolArguments& params, const ToolContext& context) {
    const auto task = RequireParam(params, "task");
    const auto label = GetParam(params, "label");
    const auto channel = context.channel.empty() ? std::string("cli") : context.channel;
    const auto chat_id = context.chat_id.empty() ? std::string("direct") : context.chat_id;
    const auto id = manager_.Spawn(task, label, channel, chat_id);
    const auto spawned = manager_.Get(id);
    const auto display = spawned ? spawned->DisplayLabel() : label;
    return "Subagent [" + display + "] started (id: " + id + "). I'll notify you when it completes.";
}

SubagentsTool::SubagentsTool(SubagentManager& manager)
    : manager_(manager) {}

std::string SubagentsTool::ParametersJson() const {
    return R"({"type":"object","properties":{"action":{"type":"string","enum":["list","status","cancel","result"]},"task_id":{"type":"string"}},"required":["action"]})";
}

std::string SubagentsTool::Execute(const ToolArguments& params, const ToolContext&) {
    const auto action = RequireParam(params, "action");
    if (action == "list") {
        const auto tasks = manager_.List();
        if (tasks.empty()) {
            return "No subagent tasks.";
        }
        std::vector<std::string> lines;
        for (const auto& task : tasks) {
            lines.push_back("- " + Describe(task));
        }
        return "Subagent tasks:\n" + utils::Join(lines, "\n");
    }

    const auto task_id = RequireParam(params, "task_id");
    if (action == "status") {
        const auto task = RequireTask(manager_, task_id);
        std::string out = Describe(task) + "\nTask: " + task.description;
        if (task.result) {
            out += "\nResult: " + utils::Truncate(*task.result, 2000);
        }
        return out;
    }
    if (action == "cancel") {
        const auto task = RequireTask(manager_, task_id);
        if (!manager_.Cancel(task_id)) {
            throw utils::Error(utils::ErrorKind::kConflict, "task_id",
                               "task " + task_id + " already " + ToString(task.status));
        }
        return "Cancellation requested for " + task_id;
    }
    // result
    const auto task = RequireTask(manager_, task_id);
    if (!IsTerminal(task.status)) {
        throw utils::Error(utils::ErrorKind::kConflict, "task_id",
                           "task " + task_id + " is still " + ToString(task.status));
    }
    const auto consumed = manager_.Consume(task_id);
    if (!consumed) {
        throw utils::Error(utils::ErrorKind::kJobNotFound, "task_id", "no subagent task " + task_id);
    }
    return Describe(*consumed) + "\n" + consumed->result.value_or("");
}

}  // namespace kestrel::agent::tools
