#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kestrel::cron {

enum class CronScheduleKind {
    At,
    Every,
    Cron
};

struct CronSchedule {
    CronScheduleKind kind = CronScheduleKind::Every;
    std::optional<long long> at_ms;
    std::optional<long long> every_ms;
    std::string expr;
};

// reminder: the message goes straight to the user.
// agent_turn: the message is handed to the host as a system turn.
struct CronPayload {
    std::string kind = "agent_turn";
    std::string message;
    bool deliver = false;
    std::string channel;
    std::string to;
};

struct CronJobState {
    std::optional<long long> next_run_at_ms;
    std::optional<long long> last_run_at_ms;
    std::string last_status;
    std::string last_error;
};

struct CronJob {
    std::string id;
    std::string name;
    bool enabled = true;
    CronSchedule schedule;
    CronPayload payload;
    CronJobState state;
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
};

struct CronStore {
    int version = 1;
    std::vector<CronJob> jobs;
};

const char* ToString(CronScheduleKind kind);

}  // namespace kestrel::cron
