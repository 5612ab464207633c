#include "agent/tools/cron.hpp"

#include <stdexcept>
#include <string>

#include "cron/cron_store.hpp"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace kestrel::agent::tools {
namespace {

std::string GetParamAlias(const ToolArguments& params,
                          const std::string& primary,
                          const std::string& fallback) {
    auto value = GetParam(params, primary);
    if (!value.empty()) {
        return value;
    }
    return GetParam(params, fallback);
}

bool ParseBool(const std::string& value, bool fallback = false) {
    if (value.empty()) {
        return fallback;
    }
    const auto lowered = utils::ToLower(value);
    return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "y";
}

long long ParseInteger(const std::string& value, const std::string& field) {
    std::size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        throw utils::ValidationError(field, field + " must be an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw utils::ValidationError(field, field + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

std::string RequireJobId(const ToolArguments& params) {
    const auto id = GetParamAlias(params, "job_id", "id");
    if (id.empty()) {
        throw utils::ValidationError("job_id", "job_id is required");
    }
    return id;
}

utils::Error NotFound(const std::string& id) {
    return utils::Error(utils::ErrorKind::kJobNotFound, "job_id", "no cron job " + id);
}

nlohmann::json Summary(const kestrel::cron::CronJob& job) {
    return {
        {"id", job.id},
        {"name", job.name},
        {"enabled", job.enabled},
        {"next_run_at_ms", job.state.next_run_at_ms.has_value() ? nlohmann::json(*job.state.next_run_at_ms)
                                                                : nlohmann::json(nullptr)}
    };
}

}  // namespace

CronTool::CronTool(kestrel::cron::CronService& cron)
    : cron_(cron) {}

std::string CronTool::ParametersJson() const {
    return R"({"type":"object","properties":{"action":{"type":"string","enum":["add","list","remove","enable","disable","run","status"]},"job_id":{"type":"string"},"id":{"type":"string"},"name":{"type":"string"},"mode":{"type":"string","enum":["reminder","task"],"description":"reminder sends the message to the user; task hands it back to the agent"},"at":{"type":"string","description":"ISO local time: YYYY-MM-DDTHH:MM[:SS]"},"at_ms":{"type":"integer","minimum":0},"every_seconds":{"type":"integer","minimum":1,"maximum":316224000},"cron_expr":{"type":"string","description":"5-field cron expression"},"message":{"type":"string"},"deliver":{"type":"boolean"},"channel":{"type":"string"},"to":{"type":"string"},"force":{"type":"boolean"},"include_disabled":{"type":"boolean"}},"required":["action"]})";
}

std::string CronTool::Execute(const ToolArguments& params, const ToolContext& context) {
    const auto action = utils::ToLower(RequireParam(params, "action"));

    if (action == "status") {
        const auto status = cron_.GetStatus();
        nlohmann::json json = {
            {"enabled", status.enabled},
            {"jobs", status.jobs},
            {"next_wake_at_ms", status.next_wake_at_ms.has_value() ? nlohmann::json(*status.next_wake_at_ms)
                                                                     : nlohmann::json(nullptr)}
        };
        return json.dump(2);
    }

    if (action == "list") {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& job : cron_.ListJobs(ParseBool(GetParam(params, "include_disabled"), true))) {
            json.push_back(kestrel::cron::JobToJson(job));
        }
        return json.dump(2);
    }

    if (action == "remove") {
        const auto id = RequireJobId(params);
        if (!cron_.RemoveJob(id)) {
            throw NotFound(id);
        }
        return "Removed job " + id;
    }

    if (action == "enable" || action == "disable") {
        const auto id = RequireJobId(params);
        const auto updated = cron_.EnableJob(id, action == "enable");
        if (!updated.has_value()) {
            throw NotFound(id);
        }
        return Summary(*updated).dump(2);
    }

    if (action == "run") {
        const auto id = RequireJobId(params);
        if (!cron_.RunJob(id, ParseBool(GetParam(params, "force")))) {
            throw utils::Error(utils::ErrorKind::kJobNotFound, "job_id",
                               "no enabled cron job " + id + " (use force=true for disabled jobs)");
        }
        return "Ran job " + id;
    }

    if (action == "add") {
        return Add(params, context);
    }

    throw utils::ValidationError("action", "unsupported action '" + action + "'");
}

std::string CronTool::Add(const ToolArguments& params, const ToolContext& context) {
    kestrel::cron::CronJob job;
    job.name = GetParam(params, "name");
    job.payload.message = GetParam(params, "message");
    job.payload.kind = utils::ToLower(GetParam(params, "mode")) == "reminder" ? "reminder" : "agent_turn";
    job.payload.deliver = ParseBool(GetParam(params, "deliver"), job.payload.kind == "reminder");
    const auto channel = GetParam(params, "channel");
    const auto to = GetParam(params, "to");
    job.payload.channel = channel.empty() ? context.channel : channel;
    job.payload.to = to.empty() ? context.chat_id : to;

    const auto at = GetParam(params, "at");
    const auto at_ms = GetParam(params, "at_ms");
    const auto every = GetParam(params, "every_seconds");
    const auto expr = GetParam(params, "cron_expr");
    const int selected = (!at.empty() || !at_ms.empty()) + !every.empty() + !expr.empty();
    if (selected != 1) {
        throw utils::ValidationError("schedule", "give exactly one of at, at_ms, every_seconds or cron_expr");
    }
    if (!at.empty() || !at_ms.empty()) {
        job.schedule.kind = kestrel::cron::CronScheduleKind::At;
        job.schedule.at_ms = at_ms.empty() ? kestrel::cron::CronService::ParseAtTime(at)
                                           : ParseInteger(at_ms, "at_ms");
    } else if (!every.empty()) {
        job.schedule.kind = kestrel::cron::CronScheduleKind::Every;
        const auto seconds = ParseInteger(every, "every_seconds");
        if (seconds < 1 || seconds > kestrel::cron::CronService::kMaxEverySeconds) {
            throw utils::ValidationError("every_seconds", "every_seconds must be between 1 and " +
                                         std::to_string(kestrel::cron::CronService::kMaxEverySeconds));
        }
        job.schedule.every_ms = seconds * 1000;
    } else {
        job.schedule.kind = kestrel::cron::CronScheduleKind::Cron;
        job.schedule.expr = expr;
    }

    const auto added = cron_.AddJob(job);
    return Summary(added).dump(2);
}

}  // namespace kestrel::agent::tools
