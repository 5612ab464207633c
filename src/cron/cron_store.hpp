#pragma once

#include <string>

#include "cron/cron_types.hpp"
#include "nlohmann/json.hpp"

namespace kestrel::cron {

// Empty or whitespace-only text is an empty store. Anything unparsable
// throws utils::Error(kInfrastructure); a damaged store is never read as
// empty.
CronStore ParseStore(const std::string& text);
std::string DumpStore(const CronStore& store);

nlohmann::json JobToJson(const CronJob& job);

}  // namespace kestrel::cron
