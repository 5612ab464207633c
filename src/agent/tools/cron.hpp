#pragma once

#include <string>

#include "agent/tools/tool.hpp"
#include "cron/cron_service.hpp"

namespace kestrel::agent::tools {

class CronTool : public Tool {
public:
    explicit CronTool(kestrel::cron::CronService& cron);

    std::string Name() const override { return "cron"; }
    std::string Description() const override {
        return "Schedule reminders and recurring tasks. Exactly one of at, at_ms, every_seconds or "
               "cron_expr selects the schedule for add.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;

private:
    std::string Add(const ToolArguments& params, const ToolContext& context);

    kestrel::cron::CronService& cron_;
};

}  // namespace kestrel::agent::tools
