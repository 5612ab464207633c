#pragma once

#include <string>

#include "agent/tools/tool.hpp"

namespace kestrel::agent::tools {

class WebSearchTool : public Tool {
public:
    explicit WebSearchTool(std::string api_key = "");

    std::string Name() const override { return "web_search"; }
    std::string Description() const override { return "Search the web (Brave Search). Returns titles, URLs and snippets."; }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;

private:
    std::string api_key_;
};

class WebFetchTool : public Tool {
public:
    std::string Name() const override { return "web_fetch"; }
    std::string Description() const override { return "Fetch a URL and return its body, optionally as plain text."; }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;
};

}  // namespace kestrel::agent::tools
