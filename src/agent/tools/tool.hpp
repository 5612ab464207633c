#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

#include "utils/errors.hpp"

namespace kestrel::agent::tools {

using ToolArguments = std::unordered_map<std::string, std::string>;

struct ToolCallRequest {
    std::string id;
    std::string name;
    ToolArguments arguments;
};

struct ToolResult {
    std::string call_id;
    std::string output;
    std::optional<utils::ErrorKind> error;
    std::string error_field;

    bool Ok() const { return !error.has_value(); }
    std::string ToJson() const;
};

// Per-call execution context: who is calling and how long the call may run.
struct ToolContext {
    std::string channel;
    std::string chat_id;
    // Zero selects the dispatcher's default.
    std::chrono::seconds timeout{0};

    std::string SessionKey() const { return channel + ":" + chat_id; }
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    // Throws utils::Error for failures the caller should reason about.
    virtual std::string Execute(const ToolArguments& params, const ToolContext& context) = 0;
};

inline std::string GetParam(const ToolArguments& params, const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

inline std::string RequireParam(const ToolArguments& params, const std::string& name) {
    auto value = GetParam(params, name);
    if (value.empty()) {
        throw utils::ValidationError(name, name + " is required");
    }
    return value;
}

}  // namespace kestrel::agent::tools
