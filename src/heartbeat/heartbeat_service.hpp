#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "agent/tools/dispatcher.hpp"
#include "heartbeat/checklist.hpp"
#include "workspace/workspace_state.hpp"

namespace kestrel::heartbeat {

struct HeartbeatOptions {
    std::chrono::seconds interval{30 * 60};
    bool enabled = true;
    // Target for plain-text items; without one they are skipped.
    std::string channel;
    std::string to;
};

struct HeartbeatReport {
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

class HeartbeatService {
public:
    HeartbeatService(workspace::WorkspaceState& workspace,
                     const agent::tools::ToolDispatcher& dispatcher,
                     HeartbeatOptions options = {});
    ~HeartbeatService();

    HeartbeatService(const HeartbeatService&) = delete;
    HeartbeatService& operator=(const HeartbeatService&) = delete;

    void Start();
    void Stop();

    // Evaluates every unchecked item once. Concurrent calls wait for each
    // other.
    HeartbeatReport RunOnce();

    // "<tool> {json}" naming a registered tool becomes that call; other
    // text becomes a message to the configured target.
    std::optional<agent::tools::ToolCallRequest> Plan(const ChecklistItem& item) const;

    static constexpr const char* kHeartbeatFile = "HEARTBEAT.md";

private:
    void RunLoop();

    workspace::WorkspaceState& workspace_;
    const agent::tools::ToolDispatcher& dispatcher_;
    HeartbeatOptions options_;

    std::mutex run_mutex_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace kestrel::heartbeat
