#include "agent/tools/message.hpp"

#include "utils/common.hpp"

namespace kestrel::agent::tools {

MessageTool::MessageTool(SendCallback callback)
    : callback_(std::move(callback)) {}

std::string MessageTool::ParametersJson() const {
    return R"({"type":"object","properties":{"content":{"type":"string"},"media":{"type":"string","description":"comma-separated local file paths"},"channel":{"type":"string"},"chat_id":{"type":"string"}},"required":["content"]})";
}

std::string MessageTool::Execute(const ToolArguments& params, const ToolContext& context) {
    const auto channel = GetParam(params, "channel");
    const auto chat_id = GetParam(params, "chat_id");

    kestrel::bus::OutboundMessage msg{};
    msg.channel = channel.empty() ? context.channel : channel;
    msg.chat_id = chat_id.empty() ? context.chat_id : chat_id;
    msg.content = GetParam(params, "content");

    const auto media_raw = GetParam(params, "media");
    std::size_t start = 0;
    while (start < media_raw.size()) {
        auto end = media_raw.find(',', start);
        if (end == std::string::npos) {
            end = media_raw.size();
        }
        const auto token = utils::Trim(media_raw.substr(start, end - start));
        if (!token.empty()) {
            msg.media.push_back(token);
        }
        start = end + 1;
    }

    if (msg.content.empty() && msg.media.empty()) {
        throw utils::ValidationError("content", "content or media is required");
    }
    if (msg.channel.empty()) {
        throw utils::ValidationError("channel", "no target channel");
    }
    if (msg.chat_id.empty()) {
        throw utils::ValidationError("chat_id", "no target chat_id");
    }
    if (!callback_) {
        throw utils::InfrastructureError("channel", "message delivery is not configured");
    }

    callback_(msg);
    return "Message sent to " + msg.channel + ":" + msg.chat_id;
}

}  // namespace kestrel::agent::tools
