#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/clock.hpp"

namespace kestrel::agent {

enum class TaskStatus {
    kPending,
    kRunning,
    kCompleted,
    kFailed,
    kCancelled
};

const char* ToString(TaskStatus status);

inline bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::kCompleted || status == TaskStatus::kFailed ||
           status == TaskStatus::kCancelled;
}

struct SubagentTask {
    std::string id;
    std::string description;
    std::string label;
    std::string origin_channel;
    std::string origin_chat_id;
    TaskStatus status = TaskStatus::kPending;
    std::optional<std::string> result;
    long long created_at_ms = 0;
    long long finished_at_ms = 0;

    std::string DisplayLabel() const;
};

// Cooperative cancellation flag handed to a running task.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    bool IsCancelled() const { return flag_->load(); }
    void Cancel() const { flag_->store(true); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

enum class OverflowPolicy {
    kQueue,
    kReject
};

struct SpawnerConfig {
    std::size_t max_running = 4;
    std::size_t max_pending = 64;
    OverflowPolicy overflow = OverflowPolicy::kQueue;
    // Finished tasks nobody consumed are dropped after this long; zero keeps
    // them until consumed.
    std::chrono::milliseconds retain_finished{std::chrono::hours(1)};
};

class SubagentManager {
public:
    // Runs one task to completion on the task's own thread. Receives a copy of
    // the task, never the caller's state. Returns the result text; throws on
    // failure. Should return or throw promptly once the token is cancelled.
    using TaskRunner = std::function<std::string(const SubagentTask&, const CancelToken&)>;
    // Invoked once per task after it reaches a terminal status.
    using CompletionHandler = std::function<void(const SubagentTask&)>;

    SubagentManager(TaskRunner runner,
                    SpawnerConfig config = {},
                    CompletionHandler on_complete = {},
                    const utils::Clock& clock = utils::SystemClock::Instance());
    ~SubagentManager();

    SubagentManager(const SubagentManager&) = delete;
    SubagentManager& operator=(const SubagentManager&) = delete;

    // Returns immediately with the task id. Throws
    // utils::Error(kResourceExhausted) when the bound is reached under the
    // reject policy or the pending queue is full.
    std::string Spawn(const std::string& description,
                      const std::string& label = {},
                      const std::string& origin_channel = "cli",
                      const std::string& origin_chat_id = "direct");

    std::optional<SubagentTask> Get(const std::string& task_id) const;
    std::vector<SubagentTask> List() const;
    bool Cancel(const std::string& task_id);
    // Hands out a terminal task and forgets it.
    std::optional<SubagentTask> Consume(const std::string& task_id);
    bool WaitFor(const std::string& task_id, std::chrono::milliseconds timeout) const;
    std::size_t RunningCount() const;

private:
    struct Entry {
        SubagentTask task;
        CancelToken token;
    };

    void StartLocked(Entry& entry);
    void PruneFinishedLocked() const;
    void RunTask(std::string task_id);
    std::string NewTaskId() const;

    TaskRunner runner_;
    SpawnerConfig config_;
    CompletionHandler on_complete_;
    const utils::Clock& clock_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable std::unordered_map<std::string, Entry> tasks_;
    std::deque<std::string> pending_;
    std::size_t running_ = 0;
    std::size_t active_threads_ = 0;
    bool shutting_down_ = false;
};

}  // namespace kestrel::agent
