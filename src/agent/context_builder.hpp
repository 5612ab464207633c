#pragma once

#include <string>
#include <vector>

#include "agent/memory_store.hpp"
#include "agent/skills_loader.hpp"
#include "providers/llm_provider.hpp"
#include "utils/clock.hpp"
#include "workspace/workspace_state.hpp"

namespace kestrel::agent {

class ContextBuilder {
public:
    ContextBuilder(const workspace::WorkspaceState& workspace,
                   const MemoryStore& memory,
                   const utils::Clock& clock = utils::SystemClock::Instance());

    std::string BuildSystemPrompt(const std::vector<std::string>& skill_names = {}) const;
    // Task brief and rules followed by the full system prompt and the
    // session the task was spawned from.
    std::string BuildSubagentPrompt(const std::string& task,
                                    const std::string& channel = {},
                                    const std::string& chat_id = {}) const;

    static void AddAssistantMessage(std::vector<providers::Message>& messages,
                                    const std::string& content,
                                    const std::vector<providers::ToolCallRequest>& tool_calls);
    static void AddToolResult(std::vector<providers::Message>& messages,
                              const std::string& tool_call_id,
                              const std::string& tool_name,
                              const std::string& result);

    static const std::vector<std::string>& BootstrapFiles();

private:
    std::string BuildIdentity() const;
    std::string LoadBootstrapFiles() const;

    const workspace::WorkspaceState& workspace_;
    const MemoryStore& memory_;
    SkillsLoader skills_;
    const utils::Clock& clock_;
};

}  // namespace kestrel::agent
