#include "agent/tools/filesystem.hpp"

#include <sstream>

#include "utils/errors.hpp"

namespace kestrel::agent::tools {
namespace {

std::size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

}  // namespace

FileToolBase::FileToolBase(workspace::WorkspaceState& workspace, bool restrict_to_workspace)
    : workspace_(workspace)
    , restrict_to_workspace_(restrict_to_workspace) {}

std::filesystem::path FileToolBase::ResolveChecked(const std::string& path) const {
    const auto resolved = workspace_.Resolve(path);
    if (restrict_to_workspace_ && !workspace_.Contains(resolved)) {
        throw utils::Error(utils::ErrorKind::kPolicyBlocked, "path",
                           "path " + resolved.string() + " is outside the workspace");
    }
    return resolved;
}

std::string ReadFileTool::ParametersJson() const {
    return R"({"type":"object","properties":{"path":{"type":"string","description":"File path, relative to the workspace or absolute"}},"required":["path"]})";
}

std::string ReadFileTool::Execute(const ToolArguments& params, const ToolContext&) {
    const auto path = ResolveChecked(RequireParam(params, "path"));
    if (!workspace_.Exists(path.string())) {
        throw utils::ValidationError("path", "file not found: " + path.string());
    }
    return workspace_.Read(path.string());
}

std::string WriteFileTool::ParametersJson() const {
    return R"({"type":"object","properties":{"path":{"type":"string"},"content":{"type":"string"}},"required":["path","content"]})";
}

std::string WriteFileTool::Execute(const ToolArguments& params, const ToolContext&) {
    const auto path = ResolveChecked(RequireParam(params, "path"));
    const auto content = GetParam(params, "content");
    workspace_.Replace(path.string(), content);
    return "Wrote " + std::to_string(content.size()) + " bytes to " + path.string();
}

std::string EditFileTool::ParametersJson() const {
    return R"({"type":"object","properties":{"path":{"type":"string"},"old_text":{"type":"string"},"new_text":{"type":"string"}},"required":["path","old_text","new_text"]})";
}

std::string EditFileTool::Execute(const ToolArguments& params, const ToolContext&) {
    const auto path = ResolveChecked(RequireParam(params, "path"));
    const auto old_text = RequireParam(params, "old_text");
    const auto new_text = GetParam(params, "new_text");
    if (!workspace_.Exists(path.string())) {
        throw utils::ValidationError("path", "file not found: " + path.string());
    }
    workspace_.ReadModifyWrite(path.string(), [&](const std::string& current) {
        const auto count = CountOccurrences(current, old_text);
        if (count == 0) {
            throw utils::ValidationError("old_text", "old_text not found in " + path.string());
        }
        if (count > 1) {
            throw utils::ValidationError(
                "old_text",
                "old_text appears " + std::to_string(count) + " times; add surrounding context to make it unique");
        }
        auto updated = current;
        updated.replace(updated.find(old_text), old_text.size(), new_text);
        return updated;
    });
    return "Edited " + path.string();
}

std::string ListDirTool::ParametersJson() const {
    return R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})";
}

std::string ListDirTool::Execute(const ToolArguments& params, const ToolContext&) {
    const auto path = ResolveChecked(RequireParam(params, "path"));
    const auto entries = workspace_.ListDir(path.string());
    if (entries.empty()) {
        return "(empty directory)";
    }
    std::ostringstream oss;
    for (const auto& entry : entries) {
        oss << entry << "\n";
    }
    return oss.str();
}

}  // namespace kestrel::agent::tools
