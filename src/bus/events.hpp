#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace kestrel::bus {

// Messages entering the reasoning side. Background work (sub-agent
// completions, agent_turn cron jobs) arrives on channel "system" with the
// origin session key as chat_id.
struct InboundMessage {
    std::string channel;
    std::string sender_id;
    std::string chat_id;
    std::string content;
    std::vector<std::string> media;
    std::unordered_map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::string SessionKey() const {
        return channel + ":" + chat_id;
    }
};

// A delivery action: a message to a recipient on a channel.
struct OutboundMessage {
    std::string channel;
    std::string chat_id;
    std::string content;
    std::string reply_to;
    std::vector<std::string> media;
    std::unordered_map<std::string, std::string> metadata;
};

}  // namespace kestrel::bus
