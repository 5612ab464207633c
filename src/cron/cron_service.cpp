#include "cron/cron_service.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

#include "croncpp.h"

#include "cron/cron_store.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace kestrel::cron {
namespace {

std::size_t CountFields(const std::string& expr) {
    std::istringstream stream(expr);
    std::size_t count = 0;
    std::string field;
    while (stream >> field) {
        ++count;
    }
    return count;
}

// croncpp takes a seconds field first.
std::string WithSeconds(const std::string& expr) {
    return "0 " + utils::Trim(expr);
}

std::optional<long long> NextCronRun(const std::string& expr, long long now_ms) {
    try {
        const auto cron_expr = ::cron::make_cron(WithSeconds(expr));
        const std::time_t now_s = static_cast<std::time_t>(now_ms / 1000);
        const std::time_t next_s = ::cron::cron_next(cron_expr, now_s);
        if (next_s == static_cast<std::time_t>(-1) || next_s <= now_s) {
            return std::nullopt;
        }
        return static_cast<long long>(next_s) * 1000;
    } catch (const ::cron::bad_cronexpr& ex) {
        utils::LogWarn("cron", "invalid expression", {{"expr", expr}, {"error", ex.what()}});
        return std::nullopt;
    }
}

bool IsDue(const CronJob& job, long long now_ms) {
    return job.enabled && job.state.next_run_at_ms.has_value() && *job.state.next_run_at_ms <= now_ms;
}

// Consumes one occurrence: one-time jobs are marked for removal (returns
// true), repeating jobs move to their next run strictly after now.
bool Consume(CronJob& job, long long now_ms) {
    job.state.last_run_at_ms = now_ms;
    job.updated_at_ms = now_ms;
    if (job.schedule.kind == CronScheduleKind::At) {
        return true;
    }
    job.state.next_run_at_ms = job.enabled ? CronService::ComputeNextRun(job.schedule, now_ms)
                                           : std::nullopt;
    return false;
}

}  // namespace

CronService::CronService(workspace::WorkspaceState& state,
                         std::filesystem::path store_path,
                         JobHandler on_job,
                         const utils::Clock& clock,
                         std::chrono::milliseconds tick)
    : state_(state)
    , store_path_(state.Resolve(store_path.string()))
    , on_job_(std::move(on_job))
    , clock_(clock)
    , tick_(tick) {}

CronService::~CronService() {
    Stop();
}

void CronService::Start() {
    const auto now = clock_.NowMs();
    Mutate([now](CronStore& store) {
        bool changed = false;
        for (auto& job : store.jobs) {
            if (!job.enabled || job.state.next_run_at_ms.has_value()) {
                continue;
            }
            // A past one-time job keeps its time so the next tick fires it once.
            job.state.next_run_at_ms = job.schedule.kind == CronScheduleKind::At
                ? job.schedule.at_ms
                : ComputeNextRun(job.schedule, now);
            changed = true;
        }
        return changed;
    });
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { RunLoop(); });
    utils::LogInfo("cron", "started", {{"store", store_path_.string()}});
}

void CronService::Stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    loop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    utils::LogInfo("cron", "stopped");
}

std::vector<CronJob> CronService::ListJobs(bool include_disabled) const {
    const auto store = Load();
    std::vector<CronJob> jobs;
    jobs.reserve(store.jobs.size());
    for (const auto& job : store.jobs) {
        if (include_disabled || job.enabled) {
            jobs.push_back(job);
        }
    }
    std::stable_sort(jobs.begin(), jobs.end(), [](const CronJob& a, const CronJob& b) {
        const auto left = a.state.next_run_at_ms.value_or(std::numeric_limits<long long>::max());
        const auto right = b.state.next_run_at_ms.value_or(std::numeric_limits<long long>::max());
        return left < right;
    });
    return jobs;
}

CronJob CronService::AddJob(const CronJob& job) {
    const auto now = clock_.NowMs();
    ValidateJob(job, now);
    CronJob added = job;
    added.created_at_ms = now;
    added.updated_at_ms = now;
    added.state = CronJobState{};
    if (added.enabled) {
        added.state.next_run_at_ms = ComputeNextRun(added.schedule, now);
    }
    Mutate([&added](CronStore& store) {
        if (!added.name.empty()) {
            for (const auto& existing : store.jobs) {
                if (existing.name == added.name) {
                    throw utils::Error(utils::ErrorKind::kConflict, "name",
                                       "a job named '" + added.name + "' already exists (" + existing.id + ")");
                }
            }
        }
        const auto taken = [&store](const std::string& id) {
            return std::any_of(store.jobs.begin(), store.jobs.end(), [&id](const CronJob& item) {
                return item.id == id;
            });
        };
        if (added.id.empty() || taken(added.id)) {
            do {
                added.id = utils::RandomHex(8);
            } while (taken(added.id));
        }
        store.jobs.push_back(added);
        return true;
    });
    utils::LogInfo("cron", "job added", {
        {"id", added.id},
        {"kind", ToString(added.schedule.kind)},
        {"next_run_at_ms", added.state.next_run_at_ms ? std::to_string(*added.state.next_run_at_ms) : "none"}});
    return added;
}

bool CronService::RemoveJob(const std::string& job_id) {
    bool removed = false;
    Mutate([&](CronStore& store) {
        const auto before = store.jobs.size();
        store.jobs.erase(std::remove_if(store.jobs.begin(), store.jobs.end(), [&](const CronJob& job) {
            return job.id == job_id;
        }), store.jobs.end());
        removed = store.jobs.size() < before;
        return removed;
    });
    if (removed) {
        utils::LogInfo("cron", "job removed", {{"id", job_id}});
    }
    return removed;
}

std::optional<CronJob> CronService::EnableJob(const std::string& job_id, bool enabled) {
    std::optional<CronJob> updated;
    const auto now = clock_.NowMs();
    Mutate([&](CronStore& store) {
        for (auto& job : store.jobs) {
            if (job.id != job_id) {
                continue;
            }
            job.enabled = enabled;
            job.updated_at_ms = now;
            if (!enabled) {
                job.state.next_run_at_ms.reset();
            } else if (job.schedule.kind == CronScheduleKind::At) {
                job.state.next_run_at_ms = job.schedule.at_ms;
            } else {
                job.state.next_run_at_ms = ComputeNextRun(job.schedule, now);
            }
            updated = job;
            return true;
        }
        return false;
    });
    return updated;
}

bool CronService::RunJob(const std::string& job_id, bool force) {
    std::lock_guard<std::mutex> guard(fire_mutex_);
    std::vector<CronJob> fired;
    const auto now = clock_.NowMs();
    Mutate([&](CronStore& store) {
        auto it = std::find_if(store.jobs.begin(), store.jobs.end(), [&](const CronJob& job) {
            return job.id == job_id;
        });
        if (it == store.jobs.end() || (!force && !it->enabled)) {
            return false;
        }
        fired.push_back(*it);
        if (Consume(*it, now)) {
            store.jobs.erase(it);
        }
        return true;
    });
    if (fired.empty()) {
        return false;
    }
    Fire(fired);
    return true;
}

CronService::Status CronService::GetStatus() const {
    const auto store = Load();
    Status status{};
    status.enabled = running_.load();
    status.jobs = store.jobs.size();
    for (const auto& job : store.jobs) {
        if (!job.enabled || !job.state.next_run_at_ms.has_value()) {
            continue;
        }
        if (!status.next_wake_at_ms.has_value() || *job.state.next_run_at_ms < *status.next_wake_at_ms) {
            status.next_wake_at_ms = job.state.next_run_at_ms;
        }
    }
    return status;
}

std::size_t CronService::RunDueJobs() {
    std::lock_guard<std::mutex> guard(fire_mutex_);
    std::vector<CronJob> due;
    const auto now = clock_.NowMs();
    // The store is updated before any delivery: a crash after this point
    // loses at most this firing instead of repeating it.
    Mutate([&](CronStore& store) {
        std::vector<CronJob> kept;
        kept.reserve(store.jobs.size());
        for (auto& job : store.jobs) {
            if (!IsDue(job, now)) {
                kept.push_back(std::move(job));
                continue;
            }
            due.push_back(job);
            if (!Consume(job, now)) {
                kept.push_back(std::move(job));
            }
        }
        store.jobs = std::move(kept);
        return !due.empty();
    });
    Fire(due);
    return due.size();
}

void CronService::ValidateJob(const CronJob& job, long long now_ms) {
    if (utils::Trim(job.payload.message).empty()) {
        throw utils::ValidationError("message", "message is required");
    }
    if (job.payload.kind != "reminder" && job.payload.kind != "agent_turn") {
        throw utils::ValidationError("kind", "payload kind must be reminder or agent_turn");
    }
    if (job.payload.deliver && job.payload.to.empty()) {
        throw utils::ValidationError("to", "deliver requires a recipient");
    }
    switch (job.schedule.kind) {
        case CronScheduleKind::At:
            if (!job.schedule.at_ms.has_value()) {
                throw utils::ValidationError("at", "a time is required for a one-time job");
            }
            if (*job.schedule.at_ms <= now_ms) {
                throw utils::ValidationError("at", "time " + utils::FormatLocalTime(*job.schedule.at_ms, "%Y-%m-%d %H:%M:%S") +
                                             " is in the past");
            }
            break;
        case CronScheduleKind::Every:
            if (!job.schedule.every_ms.has_value() || *job.schedule.every_ms <= 0 ||
                *job.schedule.every_ms % 1000 != 0) {
                throw utils::ValidationError("every_seconds", "interval must be a positive whole number of seconds");
            }
            if (*job.schedule.every_ms / 1000 > kMaxEverySeconds) {
                throw utils::ValidationError("every_seconds",
                                             "interval must not exceed " + std::to_string(kMaxEverySeconds) + " seconds");
            }
            break;
        case CronScheduleKind::Cron:
            if (CountFields(job.schedule.expr) != 5) {
                throw utils::ValidationError("expr", "cron expression must have 5 fields: '" + job.schedule.expr + "'");
            }
            try {
                ::cron::make_cron(WithSeconds(job.schedule.expr));
            } catch (const ::cron::bad_cronexpr& ex) {
                throw utils::ValidationError("expr", "invalid cron expression '" + job.schedule.expr + "': " + ex.what());
            }
            if (!NextCronRun(job.schedule.expr, now_ms).has_value()) {
                throw utils::ValidationError("expr", "cron expression never fires: '" + job.schedule.expr + "'");
            }
            break;
    }
}

std::optional<long long> CronService::ComputeNextRun(const CronSchedule& schedule, long long now_ms) {
    switch (schedule.kind) {
        case CronScheduleKind::At:
            if (schedule.at_ms.has_value() && *schedule.at_ms > now_ms) {
                return schedule.at_ms;
            }
            return std::nullopt;
        case CronScheduleKind::Every:
            if (!schedule.every_ms.has_value() || *schedule.every_ms <= 0 ||
                *schedule.every_ms > std::numeric_limits<long long>::max() - now_ms) {
                return std::nullopt;
            }
            return now_ms + *schedule.every_ms;
        case CronScheduleKind::Cron:
            if (schedule.expr.empty()) {
                return std::nullopt;
            }
            return NextCronRun(schedule.expr, now_ms);
    }
    return std::nullopt;
}

long long CronService::ParseAtTime(const std::string& text) {
    auto value = utils::Trim(text);
    bool utc = false;
    if (!value.empty() && (value.back() == 'Z' || value.back() == 'z')) {
        utc = true;
        value.pop_back();
    }
    std::tm tm{};
    bool parsed = false;
    for (const char* format : {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%dT%H:%M", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M"}) {
        tm = std::tm{};
        std::istringstream stream(value);
        stream >> std::get_time(&tm, format);
        if (!stream.fail() && stream.peek() == std::char_traits<char>::eof()) {
            parsed = true;
            break;
        }
    }
    if (!parsed) {
        throw utils::ValidationError("at", "expected YYYY-MM-DDTHH:MM[:SS], got '" + text + "'");
    }
    tm.tm_isdst = -1;
    const std::time_t seconds = utc ? ::timegm(&tm) : std::mktime(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        throw utils::ValidationError("at", "unrepresentable time '" + text + "'");
    }
    return static_cast<long long>(seconds) * 1000;
}

CronStore CronService::Load() const {
    return ParseStore(state_.Read(store_path_.string()));
}

void CronService::Mutate(const std::function<bool(CronStore&)>& fn) {
    state_.ReadModifyWrite(store_path_.string(), [&fn](const std::string& current) {
        auto store = ParseStore(current);
        if (!fn(store)) {
            return current;
        }
        return DumpStore(store);
    });
}

void CronService::Fire(const std::vector<CronJob>& jobs) {
    for (const auto& job : jobs) {
        utils::LogInfo("cron", "firing", {{"id", job.id}, {"name", job.name}, {"kind", job.payload.kind}});
        std::string status = "ok";
        std::string error;
        try {
            if (on_job_) {
                on_job_(job);
            }
        } catch (const std::exception& ex) {
            status = "error";
            error = ex.what();
            utils::LogError("cron", "delivery failed", {{"id", job.id}, {"error", error}});
        }
        RecordOutcome(job.id, status, error);
    }
}

void CronService::RecordOutcome(const std::string& job_id, const std::string& status, const std::string& error) {
    try {
        Mutate([&](CronStore& store) {
            for (auto& job : store.jobs) {
                if (job.id == job_id) {
                    job.state.last_status = status;
                    job.state.last_error = error;
                    return true;
                }
            }
            return false;
        });
    } catch (const utils::Error& ex) {
        utils::LogError("cron", "cannot record outcome", {{"id", job_id}, {"error", ex.what()}});
    }
}

void CronService::RunLoop() {
    while (running_) {
        try {
            RunDueJobs();
        } catch (const std::exception& ex) {
            utils::LogError("cron", "tick failed", {{"error", ex.what()}});
        }
        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, tick_, [this]() { return !running_.load(); });
    }
}

}  // namespace kestrel::cron
