#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/tool.hpp"

namespace kestrel::providers {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

using ToolCallRequest = kestrel::agent::tools::ToolCallRequest;

struct Message {
    std::string role;
    std::string content;
    std::string name;
    std::string tool_call_id;
    std::vector<ToolCallRequest> tool_calls;
};

struct LLMResponse {
    std::string content;
    std::vector<ToolCallRequest> tool_calls;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool HasToolCalls() const { return !tool_calls.empty(); }
};

// The reasoning process. kestrel only drives it; concrete providers live in
// the host.
class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::vector<ToolDefinition>& tools,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

}  // namespace kestrel::providers
