#include "agent/skills_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kestrel::agent {

namespace {

constexpr const char* kSkillsDir = "skills";

std::string SkillPath(const std::string& name) {
    return std::string(kSkillsDir) + "/" + name + "/SKILL.md";
}

std::string EscapeXml(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (const auto ch : input) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += ch; break;
        }
    }
    return out;
}

}  // namespace

SkillsLoader::SkillsLoader(const workspace::WorkspaceState& workspace)
    : workspace_(workspace) {}

std::vector<SkillsLoader::SkillInfo> SkillsLoader::ListSkills(bool filter_unavailable) const {
    std::vector<SkillInfo> skills;
    if (!workspace_.Exists(kSkillsDir)) {
        return skills;
    }
    for (const auto& entry : workspace_.ListDir(kSkillsDir)) {
        if (entry.empty() || entry.back() != '/') {
            continue;
        }
        const auto name = entry.substr(0, entry.size() - 1);
        if (!workspace_.Exists(SkillPath(name))) {
            continue;
        }
        auto info = Describe(name, workspace_.Read(SkillPath(name)));
        if (filter_unavailable && !info.available) {
            continue;
        }
        skills.push_back(std::move(info));
    }
    return skills;
}

std::string SkillsLoader::LoadSkill(const std::string& name) const {
    if (name.empty() || name.find('/') != std::string::npos || name.find("..") != std::string::npos) {
        return {};
    }
    return workspace_.Read(SkillPath(name));
}

std::string SkillsLoader::LoadSkillsForContext(const std::vector<std::string>& skill_names) const {
    std::ostringstream oss;
    bool has_content = false;
    for (const auto& name : skill_names) {
        const auto content = LoadSkill(name);
        if (content.empty()) {
            continue;
        }
        if (has_content) {
            oss << "\n\n---\n\n";
        }
        oss << "### Skill: " << name << "\n\n" << StripFrontmatter(content);
        has_content = true;
    }
    return oss.str();
}

std::string SkillsLoader::BuildSkillsSummary() const {
    const auto skills = ListSkills(false);
    if (skills.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "<skills>\n";
    for (const auto& skill : skills) {
        oss << "  <skill available=\"" << (skill.available ? "true" : "false") << "\">\n";
        oss << "    <name>" << EscapeXml(skill.name) << "</name>\n";
        oss << "    <description>" << EscapeXml(skill.description) << "</description>\n";
        oss << "    <location>" << EscapeXml(skill.path) << "</location>\n";
        if (!skill.available && !skill.missing.empty()) {
            oss << "    <requires>" << EscapeXml(skill.missing) << "</requires>\n";
        }
        oss << "  </skill>\n";
    }
    oss << "</skills>";
    return oss.str();
}

std::vector<std::string> SkillsLoader::GetAlwaysSkills() const {
    std::vector<std::string> result;
    for (const auto& skill : ListSkills(true)) {
        if (skill.always) {
            result.push_back(skill.name);
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> SkillsLoader::ParseFrontmatter(const std::string& content) {
    std::unordered_map<std::string, std::string> meta;
    if (content.rfind("---", 0) != 0) {
        return meta;
    }
    const auto end = content.find("\n---", 3);
    if (end == std::string::npos) {
        return meta;
    }
    std::istringstream stream(content.substr(3, end - 3));
    std::string line;
    while (std::getline(stream, line)) {
        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        const auto key = utils::Trim(line.substr(0, pos));
        auto value = utils::Trim(line.substr(pos + 1));
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty() && !value.empty()) {
            meta[key] = value;
        }
    }
    return meta;
}

std::string SkillsLoader::StripFrontmatter(const std::string& content) {
    if (content.rfind("---", 0) != 0) {
        return content;
    }
    const auto end = content.find("\n---", 3);
    if (end == std::string::npos) {
        return content;
    }
    return utils::Trim(content.substr(end + 4));
}

SkillsLoader::SkillInfo SkillsLoader::Describe(const std::string& name, const std::string& content) const {
    SkillInfo info;
    info.name = name;
    info.path = workspace_.Resolve(SkillPath(name)).string();
    const auto front = ParseFrontmatter(content);
    if (auto it = front.find("description"); it != front.end()) {
        info.description = it->second;
    }
    if (auto it = front.find("always"); it != front.end()) {
        info.always = utils::ToLower(it->second) == "true";
    }
    if (auto it = front.find("metadata"); it != front.end()) {
        const auto requirements = ParseRequirements(it->second, info);
        info.missing = MissingRequirements(requirements);
        info.available = info.missing.empty();
    }
    if (info.description.empty()) {
        info.description = name;
    }
    return info;
}

// metadata: {"kestrel": {"description": ..., "always": true,
//            "requires": {"bins": [...], "env": [...]}}}
SkillsLoader::Requirements SkillsLoader::ParseRequirements(const std::string& raw, SkillInfo& info) {
    Requirements requirements;
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("skills", "invalid metadata", {{"skill", info.name}, {"error", ex.what()}});
        return requirements;
    }
    if (parsed.is_object() && parsed.contains("kestrel")) {
        parsed = parsed["kestrel"];
    }
    if (!parsed.is_object()) {
        return requirements;
    }
    if (parsed.contains("description") && parsed["description"].is_string()) {
        info.description = parsed["description"].get<std::string>();
    }
    if (parsed.contains("always") && parsed["always"].is_boolean() && parsed["always"].get<bool>()) {
        info.always = true;
    }
    if (parsed.contains("requires") && parsed["requires"].is_object()) {
        const auto& req = parsed["requires"];
        const auto collect = [&req](const char* key, std::vector<std::string>& out) {
            if (!req.contains(key) || !req[key].is_array()) {
                return;
            }
            for (const auto& item : req[key]) {
                if (item.is_string()) {
                    out.push_back(item.get<std::string>());
                }
            }
        };
        collect("bins", requirements.bins);
        collect("env", requirements.envs);
    }
    return requirements;
}

std::string SkillsLoader::MissingRequirements(const Requirements& requirements) {
    std::vector<std::string> missing;
    for (const auto& bin : requirements.bins) {
        if (!HasBinary(bin)) {
            missing.push_back("CLI: " + bin);
        }
    }
    for (const auto& env : requirements.envs) {
        if (!std::getenv(env.c_str())) {
            missing.push_back("ENV: " + env);
        }
    }
    return utils::Join(missing, ", ");
}

bool SkillsLoader::HasBinary(const std::string& name) {
    const auto* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }
    std::istringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::path(dir) / name, ec)) {
            return true;
        }
    }
    return false;
}

}  // namespace kestrel::agent
