#include "agent/subagent_manager.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace kestrel::agent {

const char* ToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::kPending: return "pending";
        case TaskStatus::kRunning: return "running";
        case TaskStatus::kCompleted: return "completed";
        case TaskStatus::kFailed: return "failed";
        case TaskStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

std::string SubagentTask::DisplayLabel() const {
    if (!label.empty()) {
        return label;
    }
    return description.size() > 30 ? description.substr(0, 30) + "..." : description;
}

SubagentManager::SubagentManager(TaskRunner runner,
                                 SpawnerConfig config,
                                 CompletionHandler on_complete,
                                 const utils::Clock& clock)
    : runner_(std::move(runner))
    , config_(config)
    , on_complete_(std::move(on_complete))
    , clock_(clock) {
    if (config_.max_running == 0) {
        config_.max_running = 1;
    }
}

SubagentManager::~SubagentManager() {
    std::unique_lock<std::mutex> lock(mutex_);
    shutting_down_ = true;
    for (auto& [id, entry] : tasks_) {
        entry.token.Cancel();
        if (entry.task.status == TaskStatus::kPending) {
            entry.task.status = TaskStatus::kCancelled;
        }
    }
    pending_.clear();
    cv_.wait(lock, [this] { return active_threads_ == 0; });
}

std::string SubagentManager::Spawn(const std::string& description,
                                   const std::string& label,
                                   const std::string& origin_channel,
                                   const std::string& origin_chat_id) {
    if (utils::Trim(description).empty()) {
        throw utils::ValidationError("task", "task description is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    PruneFinishedLocked();
    if (shutting_down_) {
        throw utils::InfrastructureError("task", "spawner is shutting down");
    }
    const bool has_slot = running_ < config_.max_running;
    if (!has_slot) {
        if (config_.overflow == OverflowPolicy::kReject) {
            throw utils::Error(utils::ErrorKind::kResourceExhausted, "task",
                               "subagent limit reached (" + std::to_string(config_.max_running) +
                               " running); retry later");
        }
        if (pending_.size() >= config_.max_pending) {
            throw utils::Error(utils::ErrorKind::kResourceExhausted, "task",
                               "subagent queue is full (" + std::to_string(config_.max_pending) +
                               " pending); retry later");
        }
    }

    Entry entry{};
    entry.task.id = NewTaskId();
    entry.task.description = description;
    entry.task.label = label;
    entry.task.origin_channel = origin_channel;
    entry.task.origin_chat_id = origin_chat_id;
    entry.task.created_at_ms = clock_.NowMs();
    const auto id = entry.task.id;
    auto& stored = tasks_.emplace(id, std::move(entry)).first->second;
    if (has_slot) {
        StartLocked(stored);
    } else {
        pending_.push_back(id);
    }
    utils::LogInfo("subagent", "spawned", {
        {"id", id},
        {"label", stored.task.DisplayLabel()},
        {"status", ToString(stored.task.status)}});
    return id;
}

std::optional<SubagentTask> SubagentManager::Get(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

std::vector<SubagentTask> SubagentManager::List() const {
    std::vector<SubagentTask> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PruneFinishedLocked();
        tasks.reserve(tasks_.size());
        for (const auto& [id, entry] : tasks_) {
            tasks.push_back(entry.task);
        }
    }
    std::sort(tasks.begin(), tasks.end(), [](const SubagentTask& a, const SubagentTask& b) {
        return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
    });
    return tasks;
}

bool SubagentManager::Cancel(const std::string& task_id) {
    std::optional<SubagentTask> cancelled_pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end() || IsTerminal(it->second.task.status)) {
            return false;
        }
        auto& entry = it->second;
        entry.token.Cancel();
        if (entry.task.status == TaskStatus::kPending) {
            pending_.erase(std::remove(pending_.begin(), pending_.end(), task_id), pending_.end());
            entry.task.status = TaskStatus::kCancelled;
            entry.task.result = "Cancelled before start";
            entry.task.finished_at_ms = clock_.NowMs();
            cancelled_pending = entry.task;
        }
    }
    cv_.notify_all();
    utils::LogInfo("subagent", "cancel requested", {{"id", task_id}});
    if (cancelled_pending && on_complete_) {
        try {
            on_complete_(*cancelled_pending);
        } catch (const std::exception& ex) {
            utils::LogError("subagent", "completion handler failed", {{"id", task_id}, {"error", ex.what()}});
        }
    }
    return true;
}

std::optional<SubagentTask> SubagentManager::Consume(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end() || !IsTerminal(it->second.task.status)) {
        return std::nullopt;
    }
    auto task = it->second.task;
    tasks_.erase(it);
    return task;
}

bool SubagentManager::WaitFor(const std::string& task_id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
        auto it = tasks_.find(task_id);
        return it == tasks_.end() || IsTerminal(it->second.task.status);
    });
}

std::size_t SubagentManager::RunningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SubagentManager::StartLocked(Entry& entry) {
    entry.task.status = TaskStatus::kRunning;
    ++running_;
    ++active_threads_;
    try {
        std::thread([this, id = entry.task.id]() { RunTask(id); }).detach();
    } catch (const std::system_error& ex) {
        --running_;
        --active_threads_;
        entry.task.status = TaskStatus::kFailed;
        entry.task.result = std::string("Error: cannot start task thread: ") + ex.what();
        entry.task.finished_at_ms = clock_.NowMs();
        throw utils::Error(utils::ErrorKind::kResourceExhausted, "task", ex.what());
    }
}

void SubagentManager::PruneFinishedLocked() const {
    const auto retain_ms = static_cast<long long>(config_.retain_finished.count());
    if (retain_ms <= 0) {
        return;
    }
    const auto now = clock_.NowMs();
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const auto& task = it->second.task;
        if (IsTerminal(task.status) && task.finished_at_ms + retain_ms <= now) {
            utils::LogDebug("subagent", "dropped unclaimed task", {{"id", task.id}});
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void SubagentManager::RunTask(std::string task_id) {
    SubagentTask snapshot;
    CancelToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& entry = tasks_.at(task_id);
        snapshot = entry.task;
        token = entry.token;
    }

    std::string result;
    TaskStatus status = TaskStatus::kCompleted;
    try {
        result = token.IsCancelled() ? std::string("Cancelled before start") : runner_(snapshot, token);
    } catch (const std::exception& ex) {
        result = std::string("Error: ") + ex.what();
        status = TaskStatus::kFailed;
    }
    if (token.IsCancelled()) {
        status = TaskStatus::kCancelled;
    }

    SubagentTask finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = tasks_.at(task_id);
        entry.task.status = status;
        entry.task.result = result;
        entry.task.finished_at_ms = clock_.NowMs();
        finished = entry.task;
        --running_;
        while (!shutting_down_ && !pending_.empty() && running_ < config_.max_running) {
            const auto next_id = pending_.front();
            pending_.pop_front();
            auto next = tasks_.find(next_id);
            if (next == tasks_.end() || next->second.task.status != TaskStatus::kPending) {
                continue;
            }
            try {
                StartLocked(next->second);
            } catch (const utils::Error& ex) {
                utils::LogError("subagent", "failed to start queued task", {{"id", next_id}, {"error", ex.what()}});
            }
        }
    }
    cv_.notify_all();
    utils::LogInfo("subagent", "finished", {{"id", task_id}, {"status", ToString(status)}});

    if (on_complete_) {
        try {
            on_complete_(finished);
        } catch (const std::exception& ex) {
            utils::LogError("subagent", "completion handler failed", {{"id", task_id}, {"error", ex.what()}});
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --active_threads_;
    cv_.notify_all();
}

std::string SubagentManager::NewTaskId() const {
    auto id = utils::RandomHex(8);
    while (tasks_.find(id) != tasks_.end()) {
        id = utils::RandomHex(8);
    }
    return id;
}

}  // namespace kestrel::agent
