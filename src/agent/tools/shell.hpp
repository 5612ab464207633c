#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace kestrel::agent::tools {

class ExecTool : public Tool {
public:
    explicit ExecTool(std::string working_dir);

    std::string Name() const override { return "exec"; }
    std::string Description() const override {
        return "Execute a shell command in the workspace. Destructive commands are refused.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;

private:
    std::string working_dir_;
};

}  // namespace kestrel::agent::tools
