#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace kestrel::sandbox {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    bool blocked = false;
    bool stopped = false;
    std::string output;
    std::string error;
};

class SandboxExecutor {
public:
    using StopPredicate = std::function<bool()>;

    // Returns the matched pattern when the command is destructive or
    // irreversible and must not run unattended.
    static std::optional<std::string> CheckCommandPolicy(const std::string& command);

    // The child is terminated (SIGTERM, then SIGKILL) when the timeout
    // expires or should_stop returns true; it never outlives this call.
    static ExecResult Run(const std::string& command,
                          const std::string& working_dir,
                          std::chrono::seconds timeout,
                          const StopPredicate& should_stop = {});
};

}  // namespace kestrel::sandbox
