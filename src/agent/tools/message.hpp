#pragma once

#include <functional>
#include <string>

#include "agent/tools/tool.hpp"
#include "bus/events.hpp"

namespace kestrel::agent::tools {

class MessageTool : public Tool {
public:
    using SendCallback = std::function<void(const kestrel::bus::OutboundMessage&)>;

    explicit MessageTool(SendCallback callback = nullptr);

    std::string Name() const override { return "message"; }
    std::string Description() const override {
        return "Send a message to a user. Defaults to the current session's channel and chat.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolArguments& params, const ToolContext& context) override;

private:
    SendCallback callback_;
};

}  // namespace kestrel::agent::tools
