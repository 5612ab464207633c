#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "agent/tools/dispatcher.hpp"
#include "cli/runtime.hpp"
#include "config/config_loader.hpp"
#include "cron/cron_store.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace {

using kestrel::agent::tools::ToolCallRequest;
using kestrel::agent::tools::ToolContext;
using kestrel::agent::tools::ToolResult;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  kestrel cron add --name N --message M (--at ISO | --cron EXPR | --every SECONDS)\n"
        << "                   [--to ID] [--channel CH] [--deliver]\n"
        << "  kestrel cron list [--all]\n"
        << "  kestrel cron remove ID\n"
        << "  kestrel cron enable ID [--disable]\n"
        << "  kestrel cron run ID [--force]\n"
        << "  kestrel cron status\n"
        << "  kestrel heartbeat run\n"
        << "  kestrel dispatch '<json request>' [--session channel:chat_id]\n"
        << "  kestrel gateway\n";
}

// "--key value" options, bare "--flag" switches and positional words.
struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::set<std::string> flags;

    std::string Option(const std::string& name) const {
        auto it = options.find(name);
        return it == options.end() ? std::string() : it->second;
    }
    bool Flag(const std::string& name) const { return flags.count(name) > 0; }
};

const std::set<std::string> kSwitches = {"all", "deliver", "disable", "force"};

Arguments ParseArguments(int argc, char** argv, int first) {
    Arguments args;
    for (int i = first; i < argc; ++i) {
        const std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            args.positional.push_back(token);
            continue;
        }
        const auto name = token.substr(2);
        if (kSwitches.count(name) > 0) {
            args.flags.insert(name);
            continue;
        }
        if (i + 1 >= argc) {
            throw kestrel::utils::ValidationError(name, "--" + name + " needs a value");
        }
        args.options[name] = argv[++i];
    }
    return args;
}

int ExitCodeFor(kestrel::utils::ErrorKind kind) {
    switch (kind) {
        case kestrel::utils::ErrorKind::kValidation:
        case kestrel::utils::ErrorKind::kJobNotFound:
        case kestrel::utils::ErrorKind::kConflict:
            return kExitUsage;
        default:
            return kExitFailure;
    }
}

ToolContext ParseSession(const std::string& session) {
    ToolContext context{};
    if (session.empty()) {
        context.channel = "cli";
        context.chat_id = "direct";
        return context;
    }
    context.channel = kestrel::utils::SplitSessionChannel(session);
    context.chat_id = kestrel::utils::SplitSessionChatId(session);
    if (context.channel.empty() || context.chat_id.empty()) {
        throw kestrel::utils::ValidationError("session", "session must look like channel:chat_id");
    }
    return context;
}

int Report(const ToolResult& result) {
    if (result.Ok()) {
        std::cout << result.output << std::endl;
        return kExitOk;
    }
    std::cerr << "Error (" << kestrel::utils::ToString(*result.error) << ")";
    if (!result.error_field.empty()) {
        std::cerr << " [" << result.error_field << "]";
    }
    std::cerr << ": " << result.output << std::endl;
    return ExitCodeFor(*result.error);
}

ToolResult RunCronAction(kestrel::cli::Runtime& runtime, kestrel::agent::tools::ToolArguments arguments) {
    ToolCallRequest request{};
    request.id = "cli:" + kestrel::utils::RandomHex(6);
    request.name = "cron";
    request.arguments = std::move(arguments);
    return runtime.Dispatch(request, ParseSession({}));
}

std::string RequirePositional(const Arguments& args, std::size_t index, const std::string& field) {
    if (args.positional.size() <= index) {
        throw kestrel::utils::ValidationError(field, field + " is required");
    }
    return args.positional[index];
}

int RunCron(kestrel::cli::Runtime& runtime, const Arguments& args) {
    const auto action = RequirePositional(args, 0, "action");
    kestrel::agent::tools::ToolArguments arguments;

    if (action == "add") {
        arguments["action"] = "add";
        arguments["name"] = args.Option("name");
        arguments["message"] = args.Option("message");
        arguments["mode"] = args.Flag("deliver") ? "reminder" : "task";
        arguments["deliver"] = args.Flag("deliver") ? "true" : "false";
        const std::map<std::string, std::string> schedule_options = {
            {"at", "at"}, {"cron", "cron_expr"}, {"every", "every_seconds"}, {"to", "to"}, {"channel", "channel"}};
        for (const auto& [option, argument] : schedule_options) {
            const auto value = args.Option(option);
            if (!value.empty()) {
                arguments[argument] = value;
            }
        }
    } else if (action == "list") {
        arguments["action"] = "list";
        arguments["include_disabled"] = args.Flag("all") ? "true" : "false";
    } else if (action == "remove" || action == "run") {
        arguments["action"] = action;
        arguments["job_id"] = RequirePositional(args, 1, "job_id");
        if (args.Flag("force")) {
            arguments["force"] = "true";
        }
    } else if (action == "enable") {
        arguments["action"] = args.Flag("disable") ? "disable" : "enable";
        arguments["job_id"] = RequirePositional(args, 1, "job_id");
    } else if (action == "status") {
        arguments["action"] = "status";
    } else {
        PrintUsage();
        return kExitUsage;
    }
    return Report(RunCronAction(runtime, std::move(arguments)));
}

int RunHeartbeat(kestrel::cli::Runtime& runtime, const Arguments& args) {
    if (RequirePositional(args, 0, "action") != "run") {
        PrintUsage();
        return kExitUsage;
    }
    runtime.Bus().SubscribeOutbound(kestrel::bus::MessageBus::kAnyChannel,
                                    [](const kestrel::bus::OutboundMessage& msg) {
        std::cout << "[" << msg.channel << ":" << msg.chat_id << "] " << msg.content << std::endl;
    });
    const auto report = runtime.Heartbeat().RunOnce();
    runtime.Bus().DrainOutbound();
    nlohmann::json json = {
        {"attempted", report.attempted},
        {"succeeded", report.succeeded},
        {"failed", report.failed},
        {"skipped", report.skipped}
    };
    std::cout << json.dump(2) << std::endl;
    return report.failed == 0 ? kExitOk : kExitFailure;
}

int RunDispatch(kestrel::cli::Runtime& runtime, const Arguments& args) {
    const auto request = kestrel::agent::tools::ToolDispatcher::ParseRequest(
        RequirePositional(args, 0, "request"));
    runtime.Bus().SubscribeOutbound(kestrel::bus::MessageBus::kAnyChannel,
                                    [](const kestrel::bus::OutboundMessage& msg) {
        std::cout << "[" << msg.channel << ":" << msg.chat_id << "] " << msg.content << std::endl;
    });
    const auto result = runtime.Dispatch(request, ParseSession(args.Option("session")));
    runtime.Bus().DrainOutbound();
    return Report(result);
}

class LineWriter {
public:
    void Write(const nlohmann::json& json) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << json.dump() << std::endl;
    }

private:
    std::mutex mutex_;
};

nlohmann::json ResultLine(const ToolResult& result) {
    auto json = nlohmann::json::parse(result.ToJson());
    json["type"] = "tool_result";
    return json;
}

// One JSON tool call per stdin line, answered in order on stdout. A line may
// carry "session": "channel:chat_id"; the default is cli:direct.
void ServeStdin(kestrel::cli::Runtime& runtime, LineWriter& writer) {
    std::string line;
    while (g_signal == 0 && std::getline(std::cin, line)) {
        if (kestrel::utils::Trim(line).empty()) {
            continue;
        }
        ToolResult result;
        try {
            const auto data = nlohmann::json::parse(line);
            const auto session = data.is_object() && data.contains("session") && data["session"].is_string()
                                     ? data["session"].get<std::string>()
                                     : std::string();
            result = runtime.Dispatch(kestrel::agent::tools::ToolDispatcher::ParseRequest(line),
                                      ParseSession(session));
        } catch (const nlohmann::json::exception& ex) {
            result.error = kestrel::utils::ErrorKind::kValidation;
            result.error_field = "request";
            result.output = std::string("malformed request: ") + ex.what();
        } catch (const kestrel::utils::Error& ex) {
            result.error = ex.Kind();
            result.error_field = ex.Field();
            result.output = ex.what();
        }
        writer.Write(ResultLine(result));
    }
}

int RunGateway(kestrel::cli::Runtime& runtime) {
    LineWriter writer;
    runtime.Bus().SubscribeOutbound(kestrel::bus::MessageBus::kAnyChannel,
                                    [&writer](const kestrel::bus::OutboundMessage& msg) {
        writer.Write({
            {"type", "message"},
            {"channel", msg.channel},
            {"chat_id", msg.chat_id},
            {"content", msg.content},
            {"media", msg.media},
            {"metadata", msg.metadata}
        });
    });

    std::atomic<bool> running{true};
    std::thread system_thread([&runtime, &writer, &running]() {
        kestrel::bus::InboundMessage msg;
        while (running.load()) {
            if (!runtime.Bus().TryConsumeInbound(msg, std::chrono::milliseconds(200))) {
                continue;
            }
            writer.Write({
                {"type", "system"},
                {"channel", msg.channel},
                {"sender_id", msg.sender_id},
                {"chat_id", msg.chat_id},
                {"content", msg.content},
                {"metadata", msg.metadata}
            });
        }
    });

    const auto& cron_config = runtime.Settings().cron;
    httplib::Server http_server;
    std::thread http_thread;
    if (cron_config.http_port > 0) {
        http_server.Get("/cron", [&runtime](const httplib::Request&, httplib::Response& res) {
            nlohmann::json json = nlohmann::json::array();
            for (const auto& job : runtime.Cron().ListJobs(true)) {
                json.push_back(kestrel::cron::JobToJson(job));
            }
            res.set_content(json.dump(2), "application/json");
        });
        const std::string host = cron_config.http_host;
        const int port = cron_config.http_port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                kestrel::utils::LogError("gateway", "cron http server failed to listen", {
                    {"host", host},
                    {"port", std::to_string(port)}});
            }
        });
    }

    InstallSignalHandlers();
    runtime.Start();
    kestrel::utils::LogInfo("gateway", "started", {{"pid", std::to_string(::getpid())}});

    ServeStdin(runtime, writer);

    kestrel::utils::LogInfo("gateway", "stopping", {{"signal", std::to_string(g_signal)}});
    if (http_thread.joinable()) {
        http_server.stop();
        http_thread.join();
    }
    runtime.Stop();
    running.store(false);
    system_thread.join();
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        PrintUsage();
        return kExitOk;
    }

    try {
        auto config = kestrel::config::LoadConfig();
        kestrel::utils::LogConfig log_config{};
        log_config.min_level = kestrel::utils::ParseLogLevel(config.logging.level).value_or(
            kestrel::utils::LogLevel::kInfo);
        kestrel::utils::Logger::Instance().Configure(log_config);

        const auto args = ParseArguments(argc, argv, 2);
        kestrel::cli::Runtime runtime(std::move(config));
        if (command == "cron") {
            return RunCron(runtime, args);
        }
        if (command == "heartbeat") {
            return RunHeartbeat(runtime, args);
        }
        if (command == "dispatch") {
            return RunDispatch(runtime, args);
        }
        if (command == "gateway") {
            return RunGateway(runtime);
        }
        PrintUsage();
        return kExitUsage;
    } catch (const kestrel::utils::Error& ex) {
        std::cerr << "Error (" << kestrel::utils::ToString(ex.Kind()) << ")";
        if (!ex.Field().empty()) {
            std::cerr << " [" << ex.Field() << "]";
        }
        std::cerr << ": " << ex.what() << std::endl;
        return ExitCodeFor(ex.Kind());
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return kExitFailure;
    }
}
