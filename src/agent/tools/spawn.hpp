#pragma once

#include <string>

#include "agent/subagent_manager.hpp"
#include "agent/tools/tool.hpp"

namespace kestrel::agent::tools {

class SpawnTool : public Tool {
public:
    explicit SpawnTool(SubagentManager& manager);

    std::string Name() const override { return "spawn"; }
    std::string Description() const override {
        return "Spawn a subagent to handle a task in the background. Returns a task id at once; "
               "the result is reported back when the task finishes.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;

private:
    SubagentManager& manager_;
};

// Inspect and control spawned tasks.
class SubagentsTool : public Tool {
public:
    explicit SubagentsTool(SubagentManager& manager);

    std::string Name() const override { return "subagents"; }
    std::string Description() const override {
        return "List background subagent tasks, show one task's status, cancel a task, or collect a finished task's result.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;

private:
    SubagentManager& manager_;
};

}  // namespace kestrel::agent::tools
