#pragma once

#include <string>

#include "bus/message_bus.hpp"
#include "cron/cron_service.hpp"

namespace kestrel::cron {

// Routes a fired job onto the bus: reminders (or deliver=true) become an
// outbound message to payload.to; agent turns become a system inbound
// message keyed to "<channel>:<to>".
CronService::JobHandler MakeBusDelivery(bus::MessageBus& bus, std::string default_channel = "cli");

}  // namespace kestrel::cron
