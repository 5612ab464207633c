#include "test_framework.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "agent/tools/cron.hpp"
#include "agent/tools/dispatcher.hpp"
#include "agent/tools/tool_registry.hpp"
#include "bus/message_bus.hpp"
#include "cron/cron_delivery.hpp"
#include "cron/cron_service.hpp"
#include "cron/cron_store.hpp"
#include "nlohmann/json.hpp"
#include "utils/clock.hpp"
#include "utils/errors.hpp"
#include "workspace/workspace_state.hpp"

namespace {

using kestrel::cron::CronJob;
using kestrel::cron::CronScheduleKind;
using kestrel::cron::CronService;
using kestrel::utils::ErrorKind;

constexpr long long kStartMs = 1800000000000LL;

CronJob MakeJob(const std::string& name, CronScheduleKind kind) {
    CronJob job;
    job.name = name;
    job.schedule.kind = kind;
    job.payload.message = "check the " + name;
    return job;
}

CronJob AtJob(const std::string& name, long long at_ms) {
    auto job = MakeJob(name, CronScheduleKind::At);
    job.schedule.at_ms = at_ms;
    return job;
}

CronJob EveryJob(const std::string& name, long long every_ms) {
    auto job = MakeJob(name, CronScheduleKind::Every);
    job.schedule.every_ms = every_ms;
    return job;
}

CronJob ExprJob(const std::string& name, const std::string& expr) {
    auto job = MakeJob(name, CronScheduleKind::Cron);
    job.schedule.expr = expr;
    return job;
}

ErrorKind KindOf(const std::function<void()>& fn, std::string* field = nullptr) {
    try {
        fn();
    } catch (const kestrel::utils::Error& ex) {
        if (field) {
            *field = ex.Field();
        }
        return ex.Kind();
    }
    throw std::runtime_error("expected an error");
}

struct Fixture {
    Fixture()
        : state(kestrel::tests::make_temp_dir())
        , clock(kStartMs)
        , service(state, "cron/jobs.json", [this](const CronJob& job) {
              ++fired;
              last_fired = job.id;
              if (fail_delivery) {
                  throw std::runtime_error("channel offline");
              }
          }, clock, std::chrono::milliseconds(20)) {}

    kestrel::workspace::WorkspaceState state;
    kestrel::utils::ManualClock clock;
    std::atomic<int> fired{0};
    std::string last_fired;
    bool fail_delivery = false;
    CronService service;
};

}  // namespace

void register_cron_tests(std::vector<kestrel::tests::TestCase>& tests) {
    using kestrel::tests::require;

    tests.push_back({"cron_one_time_job_fires_once_and_is_removed", [] {
        Fixture fx;
        const auto job = fx.service.AddJob(AtJob("standup", kStartMs + 5000));
        require(job.id.size() == 8, "job id should be 8 hex characters");
        require(job.state.next_run_at_ms == kStartMs + 5000, "next run is the requested time");
        require(fx.service.RunDueJobs() == 0, "nothing is due yet");

        fx.clock.AdvanceMs(5000);
        require(fx.service.RunDueJobs() == 1, "job should fire at its time");
        require(fx.fired == 1 && fx.last_fired == job.id, "delivery runs once");
        require(fx.service.ListJobs(true).empty(), "one-time job is removed after firing");

        fx.clock.AdvanceMs(60000);
        require(fx.service.RunDueJobs() == 0, "removed job never fires again");
        require(fx.fired == 1, "exactly one delivery");
    }});

    tests.push_back({"cron_tick_loop_fires_job_within_a_tick", [] {
        Fixture fx;
        fx.service.AddJob(AtJob("reminder", kStartMs + 5000));
        fx.service.Start();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        require(fx.fired == 0, "job must not fire early");
        fx.clock.SetMs(kStartMs + 5000);
        require(kestrel::tests::wait_until([&] { return fx.fired.load() == 1; }, std::chrono::seconds(2)),
                "tick loop should fire the due job");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        require(fx.fired == 1, "tick loop fires it once");
        require(fx.service.GetStatus().enabled, "service reports running");
        fx.service.Stop();
        require(!fx.service.GetStatus().enabled, "service reports stopped");
    }});

    tests.push_back({"cron_interval_job_moves_strictly_forward", [] {
        Fixture fx;
        const auto job = fx.service.AddJob(EveryJob("poll", 60000));
        require(job.state.next_run_at_ms == kStartMs + 60000, "first run one interval out");
        fx.clock.AdvanceMs(60000);
        require(fx.service.RunDueJobs() == 1, "interval job fires");
        const auto jobs = fx.service.ListJobs();
        require(jobs.size() == 1, "interval job is kept");
        require(jobs[0].state.next_run_at_ms == fx.clock.NowMs() + 60000, "next run one interval after now");
        require(jobs[0].state.last_run_at_ms == fx.clock.NowMs(), "last run recorded");
        require(jobs[0].state.last_status == "ok", "success recorded");
    }});

    tests.push_back({"cron_expression_next_run_is_after_now", [] {
        const auto next = CronService::ComputeNextRun(ExprJob("tick", "*/5 * * * *").schedule, kStartMs + 1234);
        require(next.has_value(), "expression should have a next run");
        require(*next > kStartMs + 1234 && *next <= kStartMs + 1234 + 300000, "next run within five minutes");
        require(*next % 300000 == 0, "next run lands on a five minute boundary");

        const auto again = CronService::ComputeNextRun(ExprJob("tick", "*/5 * * * *").schedule, *next);
        require(again.has_value() && *again == *next + 300000, "next run is strictly after an exact match");
    }});

    tests.push_back({"cron_restart_catches_up_once", [] {
        const auto dir = kestrel::tests::make_temp_dir();
        kestrel::workspace::WorkspaceState state(dir);
        kestrel::utils::ManualClock clock(kStartMs);
        int fired = 0;
        {
            CronService first(state, "jobs.json", [&fired](const CronJob&) { ++fired; }, clock);
            first.AddJob(EveryJob("poll", 60000));
            first.AddJob(ExprJob("quarter", "*/15 * * * *"));
        }
        // Down for an hour: many occurrences were missed.
        clock.AdvanceMs(3600000);
        CronService second(state, "jobs.json", [&fired](const CronJob&) { ++fired; }, clock);
        require(second.RunDueJobs() == 2, "each overdue job fires once");
        require(fired == 2, "missed occurrences collapse into one firing each");
        require(second.RunDueJobs() == 0, "nothing left to catch up");
        for (const auto& job : second.ListJobs()) {
            require(job.state.next_run_at_ms.has_value() && *job.state.next_run_at_ms > clock.NowMs(),
                    "next run is in the future after catch-up");
        }
    }});

    tests.push_back({"cron_start_arms_jobs_without_next_run", [] {
        Fixture fx;
        kestrel::cron::CronStore store;
        CronJob legacy = EveryJob("legacy", 30000);
        legacy.id = "abcd1234";
        store.jobs.push_back(legacy);
        fx.state.Replace("cron/jobs.json", kestrel::cron::DumpStore(store));
        fx.service.Start();
        fx.service.Stop();
        const auto jobs = fx.service.ListJobs();
        require(jobs.size() == 1 && jobs[0].state.next_run_at_ms == kStartMs + 30000,
                "start gives the job a next run");
    }});

    tests.push_back({"cron_validation_rejects_bad_jobs", [] {
        Fixture fx;
        std::string field;
        require(KindOf([&] { fx.service.AddJob(AtJob("late", kStartMs - 1)); }, &field) == ErrorKind::kValidation &&
                field == "at", "past one-time job rejected on at");
        require(KindOf([&] { fx.service.AddJob(ExprJob("short", "* * * *")); }, &field) == ErrorKind::kValidation &&
                field == "expr", "four-field expression rejected");
        require(KindOf([&] { fx.service.AddJob(ExprJob("six", "0 * * * * *")); }, &field) == ErrorKind::kValidation &&
                field == "expr", "six-field expression rejected");
        require(KindOf([&] { fx.service.AddJob(ExprJob("range", "61 * * * *")); }, &field) == ErrorKind::kValidation &&
                field == "expr", "out of range minute rejected");
        require(KindOf([&] { fx.service.AddJob(EveryJob("fraction", 1500)); }, &field) == ErrorKind::kValidation &&
                field == "every_seconds", "fractional interval rejected");
        require(KindOf([&] { fx.service.AddJob(EveryJob("zero", 0)); }, &field) == ErrorKind::kValidation &&
                field == "every_seconds", "zero interval rejected");
        require(KindOf([&] { fx.service.AddJob(EveryJob("huge", 9223372036854775000LL)); }, &field) ==
                    ErrorKind::kValidation && field == "every_seconds", "oversized interval rejected");
        require(KindOf([&] {
                    fx.service.AddJob(EveryJob("decade", (kestrel::cron::CronService::kMaxEverySeconds + 1) * 1000));
                }, &field) == ErrorKind::kValidation && field == "every_seconds", "interval above the ceiling rejected");
        kestrel::cron::CronSchedule overflowing{};
        overflowing.kind = kestrel::cron::CronScheduleKind::Every;
        overflowing.every_ms = 9223372036854775000LL;
        require(!kestrel::cron::CronService::ComputeNextRun(overflowing, kStartMs).has_value(),
                "an interval past the clock range has no next run");
        auto silent = EveryJob("silent", 60000);
        silent.payload.message = "  ";
        require(KindOf([&] { fx.service.AddJob(silent); }, &field) == ErrorKind::kValidation &&
                field == "message", "empty message rejected");
        require(fx.service.ListJobs(true).empty(), "rejected jobs are not stored");
    }});

    tests.push_back({"cron_duplicate_name_is_a_conflict", [] {
        Fixture fx;
        fx.service.AddJob(EveryJob("backup", 60000));
        std::string field;
        require(KindOf([&] { fx.service.AddJob(EveryJob("backup", 120000)); }, &field) == ErrorKind::kConflict &&
                field == "name", "second job with the same name conflicts");
        fx.service.AddJob(EveryJob("", 60000));
        fx.service.AddJob(EveryJob("", 60000));
        require(fx.service.ListJobs(true).size() == 3, "unnamed jobs never conflict");
    }});

    tests.push_back({"cron_remove_unknown_job_leaves_store_untouched", [] {
        Fixture fx;
        const auto job = fx.service.AddJob(EveryJob("keep", 60000));
        const auto before = fx.state.Read("cron/jobs.json");
        require(!fx.service.RemoveJob("00000000"), "unknown id is not removed");
        require(fx.state.Read("cron/jobs.json") == before, "store is unchanged");
        require(fx.service.RemoveJob(job.id), "known id is removed");
        require(fx.service.ListJobs(true).empty(), "store is empty after removal");
    }});

    tests.push_back({"cron_corrupt_store_is_an_infrastructure_error", [] {
        Fixture fx;
        fx.state.Replace("cron/jobs.json", "{ not json");
        require(KindOf([&] { fx.service.ListJobs(); }) == ErrorKind::kInfrastructure, "list surfaces corruption");
        require(KindOf([&] { fx.service.AddJob(EveryJob("new", 60000)); }) == ErrorKind::kInfrastructure,
                "add does not overwrite a corrupt store");
        require(fx.state.Read("cron/jobs.json") == "{ not json", "corrupt store is left for inspection");
    }});

    tests.push_back({"cron_delivery_failure_is_recorded_not_retried", [] {
        Fixture fx;
        fx.fail_delivery = true;
        fx.service.AddJob(EveryJob("flaky", 60000));
        fx.clock.AdvanceMs(60000);
        require(fx.service.RunDueJobs() == 1, "job fires");
        const auto jobs = fx.service.ListJobs();
        require(jobs[0].state.last_status == "error", "failure recorded");
        require(jobs[0].state.last_error.find("channel offline") != std::string::npos, "error text recorded");
        require(fx.service.RunDueJobs() == 0, "failed delivery does not re-arm the job");
        require(fx.fired == 1, "one attempt only");
    }});

    tests.push_back({"cron_enable_disable_and_force_run", [] {
        Fixture fx;
        const auto job = fx.service.AddJob(EveryJob("weekly", 3600000));
        const auto disabled = fx.service.EnableJob(job.id, false);
        require(disabled && !disabled->enabled && !disabled->state.next_run_at_ms, "disabled job has no next run");
        require(fx.service.ListJobs().empty(), "disabled jobs are hidden by default");
        require(fx.service.ListJobs(true).size() == 1, "disabled jobs are listed on request");
        require(!fx.service.RunJob(job.id), "disabled job does not run without force");
        require(fx.service.RunJob(job.id, true), "force runs a disabled job");
        require(fx.fired == 1, "forced run delivers");
        const auto enabled = fx.service.EnableJob(job.id, true);
        require(enabled && enabled->state.next_run_at_ms == kStartMs + 3600000, "enabling re-arms");
        require(!fx.service.EnableJob("00000000").has_value(), "unknown job cannot be enabled");
        const auto status = fx.service.GetStatus();
        require(status.jobs == 1 && status.next_wake_at_ms == kStartMs + 3600000, "status reports next wake");
    }});

    tests.push_back({"cron_store_uses_camel_case_keys", [] {
        Fixture fx;
        fx.service.AddJob(AtJob("once", kStartMs + 1000));
        const auto json = nlohmann::json::parse(fx.state.Read("cron/jobs.json"));
        const auto& job = json["jobs"][0];
        require(job["schedule"]["kind"] == "at", "schedule kind");
        require(job["schedule"]["atMs"] == kStartMs + 1000, "schedule time");
        require(job["state"]["nextRunAtMs"] == kStartMs + 1000, "next run");
        require(job["createdAtMs"] == kStartMs, "creation time");
    }});

    tests.push_back({"cron_parse_at_time_formats", [] {
        require(CronService::ParseAtTime("2030-01-02T03:04:05Z") == 1893553445000LL, "utc with seconds");
        require(CronService::ParseAtTime("2030-01-02 03:04Z") == 1893553440000LL, "utc without seconds");
        require(CronService::ParseAtTime("2030-01-02T03:04") > 0, "local time");
        std::string field;
        require(KindOf([] { CronService::ParseAtTime("tomorrow at noon"); }, &field) == ErrorKind::kValidation &&
                field == "at", "free text rejected");
    }});

    tests.push_back({"cron_bus_delivery_routes_by_kind", [] {
        kestrel::bus::MessageBus bus;
        const auto deliver = kestrel::cron::MakeBusDelivery(bus);

        auto reminder = EveryJob("water", 60000);
        reminder.id = "11111111";
        reminder.payload.kind = "reminder";
        reminder.payload.channel = "telegram";
        reminder.payload.to = "42";
        deliver(reminder);
        kestrel::bus::OutboundMessage outbound;
        require(bus.TryConsumeOutbound(outbound, std::chrono::milliseconds(100)), "reminder goes outbound");
        require(outbound.channel == "telegram" && outbound.chat_id == "42", "reminder target");
        require(outbound.content == "check the water", "reminder text");
        require(outbound.metadata["cron_job_id"] == "11111111", "job id travels along");

        auto turn = EveryJob("digest", 60000);
        turn.payload.to = "7";
        deliver(turn);
        kestrel::bus::InboundMessage inbound;
        require(bus.TryConsumeInbound(inbound, std::chrono::milliseconds(100)), "agent turn goes inbound");
        require(inbound.channel == "system" && inbound.chat_id == "cli:7", "agent turn keyed to origin");
        require(inbound.content == "[Scheduled task 'digest'] check the digest", "agent turn text");

        auto orphan = EveryJob("orphan", 60000);
        orphan.payload.kind = "reminder";
        require(KindOf([&] { deliver(orphan); }) == ErrorKind::kValidation, "reminder without recipient fails");
    }});

    tests.push_back({"cron_tool_surface", [] {
        Fixture fx;
        kestrel::agent::tools::ToolRegistry registry;
        registry.Register(std::make_unique<kestrel::agent::tools::CronTool>(fx.service));
        kestrel::agent::tools::ToolDispatcher dispatcher(registry);
        kestrel::agent::tools::ToolContext context{};
        context.channel = "telegram";
        context.chat_id = "99";

        kestrel::agent::tools::ToolCallRequest add{};
        add.name = "cron";
        add.arguments = {{"action", "add"}, {"name", "stretch"}, {"message", "stand up"},
                         {"mode", "reminder"}, {"every_seconds", "1800"}};
        const auto added = dispatcher.Dispatch(add, context);
        require(added.Ok(), added.output);
        const auto summary = nlohmann::json::parse(added.output);
        const auto id = summary["id"].get<std::string>();
        const auto jobs = fx.service.ListJobs();
        require(jobs.size() == 1 && jobs[0].payload.to == "99" && jobs[0].payload.channel == "telegram",
                "reminder defaults to the calling session");
        require(jobs[0].payload.deliver, "reminders are delivered directly");

        kestrel::agent::tools::ToolCallRequest both{};
        both.name = "cron";
        both.arguments = {{"action", "add"}, {"message", "x"}, {"every_seconds", "60"}, {"cron_expr", "* * * * *"}};
        const auto ambiguous = dispatcher.Dispatch(both, context);
        require(ambiguous.error == ErrorKind::kValidation && ambiguous.error_field == "schedule",
                "two schedules are rejected");

        for (const std::string every : {"9223372036854775807", "99999999999999999999", "316224001"}) {
            kestrel::agent::tools::ToolCallRequest huge{};
            huge.name = "cron";
            huge.arguments = {{"action", "add"}, {"message", "x"}, {"every_seconds", every}};
            const auto rejected = dispatcher.Dispatch(huge, context);
            require(rejected.error == ErrorKind::kValidation && rejected.error_field == "every_seconds",
                    "oversized interval is rejected: " + every);
        }
        require(fx.service.ListJobs(true).size() == 1, "rejected intervals are not stored");

        kestrel::agent::tools::ToolCallRequest remove{};
        remove.name = "cron";
        remove.arguments = {{"action", "remove"}, {"job_id", "00000000"}};
        const auto missing = dispatcher.Dispatch(remove, context);
        require(missing.error == ErrorKind::kJobNotFound, "unknown job is not found");

        remove.arguments["job_id"] = id;
        require(dispatcher.Dispatch(remove, context).Ok(), "known job is removed");
        require(fx.service.ListJobs(true).empty(), "store is empty");
    }});
}
