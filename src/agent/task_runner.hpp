#pragma once

#include <chrono>
#include <string>

#include "agent/context_builder.hpp"
#include "agent/subagent_manager.hpp"
#include "agent/tools/dispatcher.hpp"
#include "providers/llm_provider.hpp"

namespace kestrel::agent {

struct AgentRunnerOptions {
    std::string model;
    int max_tokens = 4096;
    double temperature = 0.7;
    int max_iterations = 15;
};

// Drives the task through its own model/tool loop. The dispatcher must wrap
// a registry built for sub-agents (no message or spawn tools).
class AgentTaskRunner {
public:
    AgentTaskRunner(providers::LLMProvider& provider,
                    const tools::ToolDispatcher& dispatcher,
                    const ContextBuilder& context,
                    AgentRunnerOptions options = {});

    std::string operator()(const SubagentTask& task, const CancelToken& token) const;

private:
    providers::LLMProvider& provider_;
    const tools::ToolDispatcher& dispatcher_;
    const ContextBuilder& context_;
    AgentRunnerOptions options_;
};

// Runs the task description as a sandboxed shell command.
class SandboxTaskRunner {
public:
    SandboxTaskRunner(std::string working_dir, std::chrono::seconds timeout);

    std::string operator()(const SubagentTask& task, const CancelToken& token) const;

private:
    std::string working_dir_;
    std::chrono::seconds timeout_;
};

}  // namespace kestrel::agent
