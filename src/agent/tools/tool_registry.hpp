#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/tools/tool.hpp"
#include "providers/llm_provider.hpp"

namespace kestrel::agent::tools {

// Registration happens before the registry is shared; lookups afterwards are
// read-only and safe from any thread.
class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<kestrel::providers::ToolDefinition> GetDefinitions() const;
    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace kestrel::agent::tools
