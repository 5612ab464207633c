#pragma once

#include <filesystem>
#include <string>

#include "agent/tools/tool.hpp"
#include "workspace/workspace_state.hpp"

namespace kestrel::agent::tools {

// Shared path handling for the file tools: relative paths are taken from the
// workspace root, and with restrict_to_workspace set nothing outside it is
// touched.
class FileToolBase : public Tool {
public:
    FileToolBase(workspace::WorkspaceState& workspace, bool restrict_to_workspace);

protected:
    std::filesystem::path ResolveChecked(const std::string& path) const;

    workspace::WorkspaceState& workspace_;
    bool restrict_to_workspace_ = false;
};

class ReadFileTool : public FileToolBase {
public:
    using FileToolBase::FileToolBase;

    std::string Name() const override { return "read_file"; }
    std::string Description() const override { return "Read the contents of a file."; }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;
};

class WriteFileTool : public FileToolBase {
public:
    using FileToolBase::FileToolBase;

    std::string Name() const override { return "write_file"; }
    std::string Description() const override {
        return "Write content to a file, replacing it. Parent directories are created.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;
};

class EditFileTool : public FileToolBase {
public:
    using FileToolBase::FileToolBase;

    std::string Name() const override { return "edit_file"; }
    std::string Description() const override {
        return "Replace old_text with new_text in a file. old_text must match exactly once.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;
};

class ListDirTool : public FileToolBase {
public:
    using FileToolBase::FileToolBase;

    std::string Name() const override { return "list_dir"; }
    std::string Description() const override { return "List directory entries."; }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;
};

}  // namespace kestrel::agent::tools
