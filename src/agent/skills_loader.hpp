#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "workspace/workspace_state.hpp"

namespace kestrel::agent {

// Skills are <workspace>/skills/<name>/SKILL.md files with an optional
// frontmatter block. Their bodies are handed to the model as text.
class SkillsLoader {
public:
    struct SkillInfo {
        std::string name;
        std::string path;
        std::string description;
        bool always = false;
        bool available = true;
        std::string missing;
    };

    explicit SkillsLoader(const workspace::WorkspaceState& workspace);

    std::vector<SkillInfo> ListSkills(bool filter_unavailable = true) const;
    std::string LoadSkill(const std::string& name) const;
    std::string LoadSkillsForContext(const std::vector<std::string>& skill_names) const;
    std::string BuildSkillsSummary() const;
    std::vector<std::string> GetAlwaysSkills() const;

    static std::unordered_map<std::string, std::string> ParseFrontmatter(const std::string& content);
    static std::string StripFrontmatter(const std::string& content);

private:
    struct Requirements {
        std::vector<std::string> bins;
        std::vector<std::string> envs;
    };

    SkillInfo Describe(const std::string& name, const std::string& content) const;
    static Requirements ParseRequirements(const std::string& raw, SkillInfo& info);
    static std::string MissingRequirements(const Requirements& requirements);
    static bool HasBinary(const std::string& name);

    const workspace::WorkspaceState& workspace_;
};

}  // namespace kestrel::agent
