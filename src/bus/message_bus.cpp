#include "bus/message_bus.hpp"

#include "utils/logging.hpp"

namespace kestrel::bus {

void MessageBus::PublishInbound(const InboundMessage& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push(msg);
    }
    inbound_cv_.notify_one();
}

bool MessageBus::TryConsumeInbound(InboundMessage& msg, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!inbound_cv_.wait_for(lock, timeout, [this] { return !inbound_.empty(); })) {
        return false;
    }
    msg = inbound_.front();
    inbound_.pop();
    return true;
}

void MessageBus::PublishOutbound(const OutboundMessage& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outbound_.push(msg);
    }
    outbound_cv_.notify_one();
}

bool MessageBus::TryConsumeOutbound(OutboundMessage& msg, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!outbound_cv_.wait_for(lock, timeout, [this] { return !outbound_.empty(); })) {
        return false;
    }
    msg = outbound_.front();
    outbound_.pop();
    return true;
}

void MessageBus::SubscribeOutbound(const std::string& channel, OutboundCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[channel].push_back(std::move(callback));
}

void MessageBus::DispatchOutbound() {
    while (!stopped_) {
        OutboundMessage msg{};
        if (!TryConsumeOutbound(msg, std::chrono::milliseconds(500))) {
            continue;
        }
        Deliver(msg);
    }
}

std::size_t MessageBus::DrainOutbound() {
    std::size_t delivered = 0;
    OutboundMessage msg{};
    while (TryConsumeOutbound(msg, std::chrono::milliseconds(0))) {
        Deliver(msg);
        ++delivered;
    }
    return delivered;
}

void MessageBus::Stop() {
    stopped_ = true;
    outbound_cv_.notify_all();
    inbound_cv_.notify_all();
}

void MessageBus::Deliver(const OutboundMessage& msg) {
    std::vector<OutboundCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto* key : {msg.channel.c_str(), kAnyChannel}) {
            auto it = subscribers_.find(key);
            if (it != subscribers_.end()) {
                callbacks.insert(callbacks.end(), it->second.begin(), it->second.end());
            }
        }
    }
    if (callbacks.empty()) {
        utils::LogWarn("bus", "no subscriber for outbound message", {{"channel", msg.channel}});
        return;
    }
    for (const auto& cb : callbacks) {
        if (!cb) {
            continue;
        }
        // Delivery is best-effort; one failing adapter must not stop the others.
        try {
            cb(msg);
        } catch (const std::exception& ex) {
            utils::LogError("bus", "delivery failed",
                            {{"channel", msg.channel}, {"chat_id", msg.chat_id}, {"error", ex.what()}});
        }
    }
}

}  // namespace kestrel::bus
