#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"

namespace kestrel::bus {

class MessageBus {
public:
    using OutboundCallback = std::function<void(const OutboundMessage&)>;

    // Subscribers registered on this channel receive every outbound message.
    static constexpr const char* kAnyChannel = "*";

    void PublishInbound(const InboundMessage& msg);
    bool TryConsumeInbound(InboundMessage& msg, std::chrono::milliseconds timeout);
    void PublishOutbound(const OutboundMessage& msg);
    bool TryConsumeOutbound(OutboundMessage& msg, std::chrono::milliseconds timeout);
    void SubscribeOutbound(const std::string& channel, OutboundCallback callback);
    // Delivers outbound messages until Stop().
    void DispatchOutbound();
    // Delivers everything already queued; returns the number delivered.
    std::size_t DrainOutbound();
    void Stop();

private:
    void Deliver(const OutboundMessage& msg);

    std::queue<InboundMessage> inbound_;
    std::queue<OutboundMessage> outbound_;
    mutable std::mutex mutex_;
    std::condition_variable inbound_cv_;
    std::condition_variable outbound_cv_;
    std::unordered_map<std::string, std::vector<OutboundCallback>> subscribers_;
    std::atomic<bool> stopped_{false};
};

}  // namespace kestrel::bus
