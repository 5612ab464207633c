#include "agent/task_runner.hpp"

#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace kestrel::agent {
namespace {

void ThrowIfCancelled(const CancelToken& token) {
    if (token.IsCancelled()) {
        throw utils::Error(utils::ErrorKind::kCancelled, "task", "task cancelled");
    }
}

}  // namespace

AgentTaskRunner::AgentTaskRunner(providers::LLMProvider& provider,
                                 const tools::ToolDispatcher& dispatcher,
                                 const ContextBuilder& context,
                                 AgentRunnerOptions options)
    : provider_(provider)
    , dispatcher_(dispatcher)
    , context_(context)
    , options_(std::move(options)) {}

std::string AgentTaskRunner::operator()(const SubagentTask& task, const CancelToken& token) const {
    std::vector<providers::Message> messages;
    providers::Message system_message{};
    system_message.role = "system";
    system_message.content = context_.BuildSubagentPrompt(task.description, task.origin_channel, task.origin_chat_id);
    messages.push_back(std::move(system_message));
    providers::Message user_message{};
    user_message.role = "user";
    user_message.content = task.description;
    messages.push_back(std::move(user_message));

    tools::ToolContext tool_context{};
    tool_context.channel = task.origin_channel;
    tool_context.chat_id = task.origin_chat_id;

    const auto model = options_.model.empty() ? provider_.GetDefaultModel() : options_.model;
    const auto definitions = dispatcher_.Registry().GetDefinitions();
    for (int iteration = 1; iteration <= options_.max_iterations; ++iteration) {
        ThrowIfCancelled(token);
        auto response = provider_.Chat(messages, definitions, model, options_.max_tokens, options_.temperature);
        if (!response.HasToolCalls()) {
            return response.content.empty() ? std::string("Task completed with no final response.")
                                             : response.content;
        }
        ContextBuilder::AddAssistantMessage(messages, response.content, response.tool_calls);
        for (const auto& call : response.tool_calls) {
            ThrowIfCancelled(token);
            utils::LogDebug("subagent", "tool call", {{"task", task.id}, {"tool", call.name}});
            const auto result = dispatcher_.Dispatch(call, tool_context);
            std::string content = result.output;
            if (!result.Ok()) {
                content = std::string("Error (") + utils::ToString(*result.error) + "): " + result.output;
            }
            ContextBuilder::AddToolResult(messages, call.id, call.name, content);
        }
    }
    return "Task stopped after " + std::to_string(options_.max_iterations) +
           " iterations without a final response.";
}

SandboxTaskRunner::SandboxTaskRunner(std::string working_dir, std::chrono::seconds timeout)
    : working_dir_(std::move(working_dir))
    , timeout_(timeout) {}

std::string SandboxTaskRunner::operator()(const SubagentTask& task, const CancelToken& token) const {
    const auto result = sandbox::SandboxExecutor::Run(
        task.description, working_dir_, timeout_, [&token]() { return token.IsCancelled(); });
    if (result.blocked) {
        throw utils::Error(utils::ErrorKind::kPolicyBlocked, "task", result.output);
    }
    if (result.stopped) {
        throw utils::Error(utils::ErrorKind::kCancelled, "task", "task cancelled");
    }
    if (result.timed_out) {
        throw utils::Error(utils::ErrorKind::kExecutionTimeout, "task",
                           "task timed out after " + std::to_string(timeout_.count()) + "s");
    }
    if (result.exit_code != 0) {
        throw utils::Error(utils::ErrorKind::kExecutionFailed, "task",
                           "exit code " + std::to_string(result.exit_code) + "\n" +
                           utils::Truncate(result.error.empty() ? result.output : result.error, 4000));
    }
    return result.output.empty() ? std::string("(no output)") : utils::Truncate(result.output, 10000);
}

}  // namespace kestrel::agent
