#include "agent/tools/shell.hpp"

#include <algorithm>

#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kestrel::agent::tools {
namespace {

constexpr std::size_t kMaxOutput = 10000;

}  // namespace

ExecTool::ExecTool(std::string working_dir)
    : working_dir_(std::move(working_dir)) {}

std::string ExecTool::ParametersJson() const {
    return R"({"type":"object","properties":{"command":{"type":"string"},"timeout":{"type":"integer","minimum":1,"description":"seconds; capped by the dispatcher ceiling"}},"required":["command"]})";
}

std::string ExecTool::Execute(const ToolArguments& params, const ToolContext& context) {
    const auto command = RequireParam(params, "command");
    auto timeout = context.timeout;
    const auto requested = GetParam(params, "timeout");
    if (!requested.empty()) {
        timeout = std::min(timeout, std::chrono::seconds(std::stoll(requested)));
    }

    const auto result = kestrel::sandbox::SandboxExecutor::Run(command, working_dir_, timeout);
    if (result.blocked) {
        throw utils::Error(utils::ErrorKind::kPolicyBlocked, "command",
                           "refusing to run a destructive command: " + result.output);
    }
    if (result.timed_out) {
        throw utils::Error(utils::ErrorKind::kExecutionTimeout, "command",
                           "command timed out after " + std::to_string(timeout.count()) + "s and was killed");
    }
    utils::LogDebug("exec", "finished", {{"exit_code", std::to_string(result.exit_code)}});
    if (result.exit_code != 0) {
        std::string detail = "exit code " + std::to_string(result.exit_code);
        if (!result.error.empty()) {
            detail += "\n[stderr]\n" + result.error;
        }
        if (!result.output.empty()) {
            detail += "\n[stdout]\n" + result.output;
        }
        throw utils::Error(utils::ErrorKind::kExecutionFailed, "command", utils::Truncate(detail, kMaxOutput));
    }
    std::string output = result.output;
    if (!result.error.empty()) {
        output += (output.empty() ? "" : "\n") + std::string("[stderr]\n") + result.error;
    }
    return output.empty() ? "(no output)" : utils::Truncate(output, kMaxOutput);
}

}  // namespace kestrel::agent::tools
