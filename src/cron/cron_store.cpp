#include "cron/cron_store.hpp"

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace kestrel::cron {
namespace {

CronScheduleKind ScheduleKindFromString(const std::string& value) {
    if (value == "at") {
        return CronScheduleKind::At;
    }
    if (value == "cron") {
        return CronScheduleKind::Cron;
    }
    if (value == "every") {
        return CronScheduleKind::Every;
    }
    throw utils::InfrastructureError("schedule", "unknown schedule kind '" + value + "' in cron store");
}

nlohmann::json OptionalMs(const std::optional<long long>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json OptionalText(const std::string& value) {
    return value.empty() ? nlohmann::json(nullptr) : nlohmann::json(value);
}

std::optional<long long> ReadMs(const nlohmann::json& object, const char* key) {
    if (object.contains(key) && object[key].is_number_integer()) {
        return object[key].get<long long>();
    }
    return std::nullopt;
}

std::string ReadText(const nlohmann::json& object, const char* key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return {};
}

CronJob JobFromJson(const nlohmann::json& item) {
    if (!item.is_object()) {
        throw utils::InfrastructureError("jobs", "cron store entry is not an object");
    }
    CronJob job;
    job.id = ReadText(item, "id");
    if (job.id.empty()) {
        throw utils::InfrastructureError("id", "cron store entry without id");
    }
    job.name = ReadText(item, "name");
    job.enabled = item.value("enabled", true);
    job.created_at_ms = ReadMs(item, "createdAtMs").value_or(0);
    job.updated_at_ms = ReadMs(item, "updatedAtMs").value_or(0);

    if (item.contains("schedule") && item["schedule"].is_object()) {
        const auto& schedule = item["schedule"];
        job.schedule.kind = ScheduleKindFromString(schedule.value("kind", "every"));
        job.schedule.at_ms = ReadMs(schedule, "atMs");
        job.schedule.every_ms = ReadMs(schedule, "everyMs");
        job.schedule.expr = ReadText(schedule, "expr");
    }
    if (item.contains("payload") && item["payload"].is_object()) {
        const auto& payload = item["payload"];
        job.payload.kind = payload.value("kind", "agent_turn");
        job.payload.message = ReadText(payload, "message");
        job.payload.deliver = payload.value("deliver", false);
        job.payload.channel = ReadText(payload, "channel");
        job.payload.to = ReadText(payload, "to");
    }
    if (item.contains("state") && item["state"].is_object()) {
        const auto& state = item["state"];
        job.state.next_run_at_ms = ReadMs(state, "nextRunAtMs");
        job.state.last_run_at_ms = ReadMs(state, "lastRunAtMs");
        job.state.last_status = ReadText(state, "lastStatus");
        job.state.last_error = ReadText(state, "lastError");
    }
    return job;
}

}  // namespace

const char* ToString(CronScheduleKind kind) {
    switch (kind) {
        case CronScheduleKind::At: return "at";
        case CronScheduleKind::Every: return "every";
        case CronScheduleKind::Cron: return "cron";
    }
    return "every";
}

CronStore ParseStore(const std::string& text) {
    CronStore store;
    if (utils::Trim(text).empty()) {
        return store;
    }
    try {
        const auto data = nlohmann::json::parse(text);
        if (!data.is_object()) {
            throw utils::InfrastructureError("store", "cron store is not a JSON object");
        }
        store.version = data.value("version", 1);
        if (data.contains("jobs")) {
            if (!data["jobs"].is_array()) {
                throw utils::InfrastructureError("jobs", "cron store jobs is not an array");
            }
            for (const auto& item : data["jobs"]) {
                store.jobs.push_back(JobFromJson(item));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw utils::InfrastructureError("store", std::string("corrupt cron store: ") + ex.what());
    }
    return store;
}

nlohmann::json JobToJson(const CronJob& job) {
    nlohmann::json entry;
    entry["id"] = job.id;
    entry["name"] = job.name;
    entry["enabled"] = job.enabled;
    entry["createdAtMs"] = job.created_at_ms;
    entry["updatedAtMs"] = job.updated_at_ms;
    entry["schedule"] = {
        {"kind", ToString(job.schedule.kind)},
        {"atMs", OptionalMs(job.schedule.at_ms)},
        {"everyMs", OptionalMs(job.schedule.every_ms)},
        {"expr", OptionalText(job.schedule.expr)}
    };
    entry["payload"] = {
        {"kind", job.payload.kind},
        {"message", job.payload.message},
        {"deliver", job.payload.deliver},
        {"channel", OptionalText(job.payload.channel)},
        {"to", OptionalText(job.payload.to)}
    };
    entry["state"] = {
        {"nextRunAtMs", OptionalMs(job.state.next_run_at_ms)},
        {"lastRunAtMs", OptionalMs(job.state.last_run_at_ms)},
        {"lastStatus", OptionalText(job.state.last_status)},
        {"lastError", OptionalText(job.state.last_error)}
    };
    return entry;
}

std::string DumpStore(const CronStore& store) {
    nlohmann::json data;
    data["version"] = store.version;
    data["jobs"] = nlohmann::json::array();
    for (const auto& job : store.jobs) {
        data["jobs"].push_back(JobToJson(job));
    }
    return data.dump(2) + "\n";
}

}  // namespace kestrel::cron
