#pragma once

#include <string>

namespace kestrel::config {

struct AgentDefaults {
    std::string workspace = "~/.kestrel/workspace";
    std::string model;
    int max_tokens = 8192;
    double temperature = 0.7;
    int max_tool_iterations = 20;
};

struct AgentsConfig {
    AgentDefaults defaults;
};

struct ToolsConfig {
    int exec_timeout_s = 60;
    int max_timeout_s = 600;
    bool restrict_to_workspace = false;
    bool log_history = true;
    std::string brave_api_key;
};

struct SpawnerConfig {
    int max_running = 4;
    int max_pending = 64;
    std::string overflow = "queue";
    int task_timeout_s = 600;
    int retain_finished_s = 3600;
};

struct CronConfig {
    std::string store_path = "~/.kestrel/cron/jobs.json";
    int tick_seconds = 5;
    // Read-only job listing served by the gateway; 0 disables it.
    std::string http_host = "127.0.0.1";
    int http_port = 0;
};

struct HeartbeatConfig {
    bool enabled = true;
    int interval_s = 30 * 60;
    std::string channel;
    std::string to;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    AgentsConfig agents;
    ToolsConfig tools;
    SpawnerConfig spawner;
    CronConfig cron;
    HeartbeatConfig heartbeat;
    LoggingConfig logging;
};

}  // namespace kestrel::config
