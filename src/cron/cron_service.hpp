#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cron/cron_types.hpp"
#include "utils/clock.hpp"
#include "workspace/workspace_state.hpp"

namespace kestrel::cron {

// Durable job store plus the tick loop that fires due jobs. The store file is
// re-read on every operation, so several processes can share it.
class CronService {
public:
    struct Status {
        bool enabled = false;
        std::size_t jobs = 0;
        std::optional<long long> next_wake_at_ms;
    };

    // Performs the job's delivery action; throws when delivery fails.
    using JobHandler = std::function<void(const CronJob&)>;

    CronService(workspace::WorkspaceState& state,
                std::filesystem::path store_path,
                JobHandler on_job = {},
                const utils::Clock& clock = utils::SystemClock::Instance(),
                std::chrono::milliseconds tick = std::chrono::seconds(5));
    ~CronService();

    CronService(const CronService&) = delete;
    CronService& operator=(const CronService&) = delete;

    // Gives enabled jobs without a next run one, then starts the tick thread.
    void Start();
    void Stop();

    std::vector<CronJob> ListJobs(bool include_disabled = false) const;
    // Validates, assigns id and next run, and persists before returning.
    CronJob AddJob(const CronJob& job);
    bool RemoveJob(const std::string& job_id);
    std::optional<CronJob> EnableJob(const std::string& job_id, bool enabled = true);
    bool RunJob(const std::string& job_id, bool force = false);
    Status GetStatus() const;

    // Fires every enabled job whose next run is due. Returns the number fired.
    std::size_t RunDueJobs();

    const std::filesystem::path& StorePath() const { return store_path_; }

    // Longest accepted interval: ten years.
    static constexpr long long kMaxEverySeconds = 10LL * 366 * 24 * 3600;

    static void ValidateJob(const CronJob& job, long long now_ms);
    static std::optional<long long> ComputeNextRun(const CronSchedule& schedule, long long now_ms);
    // "YYYY-MM-DDTHH:MM[:SS]" in local time, or with a trailing 'Z' for UTC.
    static long long ParseAtTime(const std::string& text);

private:
    CronStore Load() const;
    // fn returns whether it changed the store; unchanged stores are not written.
    void Mutate(const std::function<bool(CronStore&)>& fn);
    void Fire(const std::vector<CronJob>& jobs);
    void RecordOutcome(const std::string& job_id, const std::string& status, const std::string& error);
    void RunLoop();

    workspace::WorkspaceState& state_;
    std::filesystem::path store_path_;
    JobHandler on_job_;
    const utils::Clock& clock_;
    std::chrono::milliseconds tick_;

    std::mutex fire_mutex_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace kestrel::cron
