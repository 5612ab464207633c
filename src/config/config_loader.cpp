#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace kestrel::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const char* name, const std::string& value) {
    int parsed = 0;
    std::size_t used = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw utils::ValidationError(name, std::string(name) + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

void ReadString(const nlohmann::json& object, const char* key, std::string& target) {
    if (object.contains(key) && object[key].is_string()) {
        target = object[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& object, const char* key, int& target) {
    if (object.contains(key) && object[key].is_number_integer()) {
        target = object[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& object, const char* key, bool& target) {
    if (object.contains(key) && object[key].is_boolean()) {
        target = object[key].get<bool>();
    }
}

const nlohmann::json* Section(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_object()) {
        return &data[key];
    }
    return nullptr;
}

void RequirePositive(const char* field, int value) {
    if (value <= 0) {
        throw utils::ValidationError(field, std::string(field) + " must be positive");
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto from_env = GetEnv("KESTREL_CONFIG");
    if (!from_env.empty()) {
        return utils::ExpandUser(from_env);
    }
    return utils::GetHomePath() / ".kestrel" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (const auto* agents = Section(data, "agents")) {
        if (const auto* defaults = Section(*agents, "defaults")) {
            ReadString(*defaults, "workspace", config.agents.defaults.workspace);
            ReadString(*defaults, "model", config.agents.defaults.model);
            ReadInt(*defaults, "maxTokens", config.agents.defaults.max_tokens);
            if (defaults->contains("temperature") && (*defaults)["temperature"].is_number()) {
                config.agents.defaults.temperature = (*defaults)["temperature"].get<double>();
            }
            ReadInt(*defaults, "maxToolIterations", config.agents.defaults.max_tool_iterations);
        }
    }

    if (const auto* tools = Section(data, "tools")) {
        ReadInt(*tools, "execTimeoutS", config.tools.exec_timeout_s);
        ReadInt(*tools, "maxTimeoutS", config.tools.max_timeout_s);
        ReadBool(*tools, "restrictToWorkspace", config.tools.restrict_to_workspace);
        ReadBool(*tools, "logHistory", config.tools.log_history);
        if (const auto* web = Section(*tools, "web")) {
            if (const auto* search = Section(*web, "search")) {
                ReadString(*search, "apiKey", config.tools.brave_api_key);
            }
        }
    }

    if (const auto* spawner = Section(data, "spawner")) {
        ReadInt(*spawner, "maxRunning", config.spawner.max_running);
        ReadInt(*spawner, "maxPending", config.spawner.max_pending);
        ReadString(*spawner, "overflow", config.spawner.overflow);
        ReadInt(*spawner, "taskTimeoutS", config.spawner.task_timeout_s);
        ReadInt(*spawner, "retainFinishedS", config.spawner.retain_finished_s);
    }

    if (const auto* cron = Section(data, "cron")) {
        ReadString(*cron, "storePath", config.cron.store_path);
        ReadInt(*cron, "tickSeconds", config.cron.tick_seconds);
        ReadString(*cron, "httpHost", config.cron.http_host);
        ReadInt(*cron, "httpPort", config.cron.http_port);
    }

    if (const auto* heartbeat = Section(data, "heartbeat")) {
        ReadBool(*heartbeat, "enabled", config.heartbeat.enabled);
        ReadInt(*heartbeat, "intervalS", config.heartbeat.interval_s);
        ReadString(*heartbeat, "channel", config.heartbeat.channel);
        ReadString(*heartbeat, "to", config.heartbeat.to);
    }

    if (const auto* logging = Section(data, "logging")) {
        ReadString(*logging, "level", config.logging.level);
    }
}

void ApplyEnvironment(Config& config) {
    const auto workspace = GetEnvFallback("KESTREL_AGENTS__DEFAULTS__WORKSPACE", "KESTREL_WORKSPACE");
    if (!workspace.empty()) {
        config.agents.defaults.workspace = workspace;
    }

    const auto model = GetEnvFallback("KESTREL_AGENTS__DEFAULTS__MODEL", "KESTREL_MODEL");
    if (!model.empty()) {
        config.agents.defaults.model = model;
    }

    const auto brave_api_key = GetEnvFallback("KESTREL_TOOLS__WEB__SEARCH__API_KEY", "BRAVE_API_KEY");
    if (!brave_api_key.empty()) {
        config.tools.brave_api_key = brave_api_key;
    }

    const auto exec_timeout = GetEnvFallback("KESTREL_TOOLS__EXEC_TIMEOUT_S", "KESTREL_EXEC_TIMEOUT_S");
    if (!exec_timeout.empty()) {
        config.tools.exec_timeout_s = ParseInt("tools.execTimeoutS", exec_timeout);
    }

    const auto restrict = GetEnvFallback("KESTREL_TOOLS__RESTRICT_TO_WORKSPACE", "KESTREL_RESTRICT_TO_WORKSPACE");
    if (!restrict.empty()) {
        config.tools.restrict_to_workspace = ParseBool(restrict);
    }

    const auto max_running = GetEnvFallback("KESTREL_SPAWNER__MAX_RUNNING", "KESTREL_SPAWNER_MAX_RUNNING");
    if (!max_running.empty()) {
        config.spawner.max_running = ParseInt("spawner.maxRunning", max_running);
    }

    const auto cron_store = GetEnvFallback("KESTREL_CRON__STORE_PATH", "KESTREL_CRON_STORE");
    if (!cron_store.empty()) {
        config.cron.store_path = cron_store;
    }

    const auto heartbeat_enabled = GetEnvFallback("KESTREL_HEARTBEAT__ENABLED", "KESTREL_HEARTBEAT_ENABLED");
    if (!heartbeat_enabled.empty()) {
        config.heartbeat.enabled = ParseBool(heartbeat_enabled);
    }

    const auto heartbeat_interval = GetEnvFallback("KESTREL_HEARTBEAT__INTERVAL_S", "KESTREL_HEARTBEAT_INTERVAL_S");
    if (!heartbeat_interval.empty()) {
        config.heartbeat.interval_s = ParseInt("heartbeat.intervalS", heartbeat_interval);
    }

    const auto log_level = GetEnvFallback("KESTREL_LOGGING__LEVEL", "KESTREL_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void ValidateConfig(const Config& config) {
    RequirePositive("tools.execTimeoutS", config.tools.exec_timeout_s);
    RequirePositive("tools.maxTimeoutS", config.tools.max_timeout_s);
    RequirePositive("spawner.maxRunning", config.spawner.max_running);
    RequirePositive("spawner.taskTimeoutS", config.spawner.task_timeout_s);
    RequirePositive("cron.tickSeconds", config.cron.tick_seconds);
    RequirePositive("heartbeat.intervalS", config.heartbeat.interval_s);
    RequirePositive("agents.defaults.maxToolIterations", config.agents.defaults.max_tool_iterations);
    if (config.cron.http_port < 0 || config.cron.http_port > 65535) {
        throw utils::ValidationError("cron.httpPort", "cron.httpPort must be between 0 and 65535");
    }
    if (config.spawner.retain_finished_s < 0) {
        throw utils::ValidationError("spawner.retainFinishedS", "spawner.retainFinishedS must not be negative");
    }
    if (config.spawner.max_pending < 0) {
        throw utils::ValidationError("spawner.maxPending", "spawner.maxPending must not be negative");
    }
    if (config.spawner.overflow != "queue" && config.spawner.overflow != "reject") {
        throw utils::ValidationError("spawner.overflow", "spawner.overflow must be queue or reject");
    }
    if (!utils::ParseLogLevel(config.logging.level)) {
        throw utils::ValidationError("logging.level", "unknown log level '" + config.logging.level + "'");
    }
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            // Keep defaults on parse errors
            utils::LogError("config", "cannot parse config, using defaults", {{"path", config_path.string()}});
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvironment(config);
    ValidateConfig(config);

    config.agents.defaults.workspace = utils::ExpandUser(config.agents.defaults.workspace).string();
    config.cron.store_path = utils::ExpandUser(config.cron.store_path).string();
    return config;
}

}  // namespace kestrel::config
