#include "agent/context_builder.hpp"

#include <sstream>
#include <sys/utsname.h>

#include "utils/common.hpp"

namespace kestrel::agent {

ContextBuilder::ContextBuilder(const workspace::WorkspaceState& workspace,
                               const MemoryStore& memory,
                               const utils::Clock& clock)
    : workspace_(workspace)
    , memory_(memory)
    , skills_(workspace)
    , clock_(clock) {}

const std::vector<std::string>& ContextBuilder::BootstrapFiles() {
    static const std::vector<std::string> files = {"AGENTS.md", "SOUL.md", "USER.md"};
    return files;
}

std::string ContextBuilder::BuildSystemPrompt(const std::vector<std::string>& skill_names) const {
    std::vector<std::string> parts;
    parts.push_back(BuildIdentity());

    const auto bootstrap = LoadBootstrapFiles();
    if (!bootstrap.empty()) {
        parts.push_back(bootstrap);
    }

    const auto memory = memory_.GetMemoryContext();
    if (!memory.empty()) {
        parts.push_back("# Memory\n\n" + memory);
    }

    auto active_names = skill_names.empty() ? skills_.GetAlwaysSkills() : skill_names;
    const auto active = skills_.LoadSkillsForContext(active_names);
    if (!active.empty()) {
        parts.push_back("# Active Skills\n\n" + active);
    }

    const auto summary = skills_.BuildSkillsSummary();
    if (!summary.empty()) {
        parts.push_back(
            "# Skills\n\n"
            "The following skills extend your capabilities. To use a skill, read its SKILL.md file "
            "using the read_file tool.\n"
            "Skills with available=\"false\" need dependencies installed first.\n\n" + summary);
    }
    return utils::Join(parts, "\n\n---\n\n");
}

std::string ContextBuilder::BuildSubagentPrompt(const std::string& task,
                                                const std::string& channel,
                                                const std::string& chat_id) const {
    std::ostringstream oss;
    oss << "# Subagent\n\n"
        << "You are a subagent spawned by the main agent to complete a specific task.\n\n"
        << "## Your Task\n" << task << "\n\n"
        << "## Rules\n"
        << "1. Stay focused: complete only the assigned task.\n"
        << "2. Your final response is reported back to the main agent.\n"
        << "3. You cannot message users directly or spawn further subagents.\n"
        << "4. Be concise but informative in your findings.\n\n"
        << BuildSystemPrompt();
    if (!channel.empty() && !chat_id.empty()) {
        oss << "\n\n## Current Session\nChannel: " << channel << "\nChat ID: " << chat_id;
    }
    return oss.str();
}

void ContextBuilder::AddAssistantMessage(std::vector<providers::Message>& messages,
                                         const std::string& content,
                                         const std::vector<providers::ToolCallRequest>& tool_calls) {
    providers::Message assistant_message{};
    assistant_message.role = "assistant";
    assistant_message.content = content;
    assistant_message.tool_calls = tool_calls;
    messages.push_back(std::move(assistant_message));
}

void ContextBuilder::AddToolResult(std::vector<providers::Message>& messages,
                                   const std::string& tool_call_id,
                                   const std::string& tool_name,
                                   const std::string& result) {
    providers::Message tool_message{};
    tool_message.role = "tool";
    tool_message.tool_call_id = tool_call_id;
    tool_message.name = tool_name;
    tool_message.content = result;
    messages.push_back(std::move(tool_message));
}

std::string ContextBuilder::BuildIdentity() const {
    const auto root = workspace_.Root().string();
    std::string runtime = "unknown";
    struct utsname info {};
    if (uname(&info) == 0) {
        runtime = std::string(info.sysname) + " " + info.machine;
    }

    std::ostringstream oss;
    oss << "# kestrel\n\n"
        << "## Current Time\n" << utils::FormatLocalTime(clock_.NowMs(), "%Y-%m-%d %H:%M (%A) %Z") << "\n\n"
        << "## Runtime\n" << runtime << "\n\n"
        << "## Workspace\n"
        << "Your workspace is at: " << root << "\n"
        << "- Long-term memory: " << root << "/" << MemoryStore::kMemoryFile << "\n"
        << "- History log: " << root << "/" << MemoryStore::kHistoryFile << " (grep-searchable)\n"
        << "- Custom skills: " << root << "/skills/{skill-name}/SKILL.md\n"
        << "When remembering something important, write to " << root << "/" << MemoryStore::kMemoryFile << "\n"
        << "To recall past events, grep " << root << "/" << MemoryStore::kHistoryFile;
    return oss.str();
}

std::string ContextBuilder::LoadBootstrapFiles() const {
    std::vector<std::string> parts;
    for (const auto& filename : BootstrapFiles()) {
        if (!workspace_.Exists(filename)) {
            continue;
        }
        parts.push_back("## " + filename + "\n\n" + workspace_.Read(filename));
    }
    return utils::Join(parts, "\n\n");
}

}  // namespace kestrel::agent
