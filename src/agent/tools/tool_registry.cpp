#include "agent/tools/tool_registry.hpp"

#include <algorithm>

namespace kestrel::agent::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<kestrel::providers::ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<kestrel::providers::ToolDefinition> defs;
    for (const auto& name : List()) {
        const auto* tool = Get(name);
        kestrel::providers::ToolDefinition def{};
        def.name = name;
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    return defs;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace kestrel::agent::tools
