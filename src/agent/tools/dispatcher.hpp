#pragma once

#include <chrono>
#include <string>

#include "agent/memory_store.hpp"
#include "agent/tools/tool.hpp"
#include "agent/tools/tool_registry.hpp"

namespace kestrel::agent::tools {

struct DispatcherOptions {
    std::chrono::seconds default_timeout{60};
    std::chrono::seconds max_timeout{600};
    bool log_history = true;
};

// Single entry point for conversation-driven work. Every request yields
// exactly one ToolResult; validation failures happen before the tool runs.
class ToolDispatcher {
public:
    ToolDispatcher(const ToolRegistry& registry,
                   DispatcherOptions options = {},
                   MemoryStore* history = nullptr);

    ToolResult Dispatch(const ToolCallRequest& request, const ToolContext& context = {}) const;

    const ToolRegistry& Registry() const { return registry_; }

    // Throws utils::Error(kValidation) naming the offending field.
    static void ValidateArguments(const Tool& tool, const ToolArguments& arguments);

    // Accepts {"id"|"call_id", "name", "arguments": {...}}; non-string
    // argument values are kept as their JSON text.
    static ToolCallRequest ParseRequest(const std::string& json_text);

private:
    void RecordHistory(const ToolCallRequest& request,
                       const ToolContext& context,
                       const ToolResult& result) const;

    const ToolRegistry& registry_;
    DispatcherOptions options_;
    MemoryStore* history_ = nullptr;
};

}  // namespace kestrel::agent::tools
