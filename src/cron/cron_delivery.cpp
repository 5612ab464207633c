#include "cron/cron_delivery.hpp"

#include "utils/errors.hpp"

namespace kestrel::cron {

CronService::JobHandler MakeBusDelivery(bus::MessageBus& bus, std::string default_channel) {
    return [&bus, default_channel = std::move(default_channel)](const CronJob& job) {
        const auto channel = job.payload.channel.empty() ? default_channel : job.payload.channel;
        if (job.payload.kind == "reminder" || job.payload.deliver) {
            if (job.payload.to.empty()) {
                throw utils::ValidationError("to", "job " + job.id + " has no recipient");
            }
            bus::OutboundMessage outbound{};
            outbound.channel = channel;
            outbound.chat_id = job.payload.to;
            outbound.content = job.payload.message;
            outbound.metadata["cron_job_id"] = job.id;
            bus.PublishOutbound(outbound);
            return;
        }
        bus::InboundMessage inbound{};
        inbound.channel = "system";
        inbound.sender_id = "cron";
        inbound.chat_id = channel + ":" + (job.payload.to.empty() ? std::string("direct") : job.payload.to);
        inbound.content = job.name.empty()
            ? "[Scheduled task] " + job.payload.message
            : "[Scheduled task '" + job.name + "'] " + job.payload.message;
        inbound.metadata["cron_job_id"] = job.id;
        bus.PublishInbound(inbound);
    };
}

}  // namespace kestrel::cron
