#include "heartbeat/heartbeat_service.hpp"

#include <utility>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kestrel::heartbeat {

HeartbeatService::HeartbeatService(workspace::WorkspaceState& workspace,
                                   const agent::tools::ToolDispatcher& dispatcher,
                                   HeartbeatOptions options)
    : workspace_(workspace)
    , dispatcher_(dispatcher)
    , options_(std::move(options)) {}

HeartbeatService::~HeartbeatService() {
    Stop();
}

void HeartbeatService::Start() {
    if (!options_.enabled || running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
    utils::LogInfo("heartbeat", "started", {{"interval_s", std::to_string(options_.interval.count())}});
}

void HeartbeatService::Stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    loop_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

HeartbeatReport HeartbeatService::RunOnce() {
    std::lock_guard<std::mutex> guard(run_mutex_);
    HeartbeatReport report{};
    const auto content = workspace_.Read(kHeartbeatFile);
    if (Checklist::IsEffectivelyEmpty(content)) {
        return report;
    }

    agent::tools::ToolContext context{};
    context.channel = options_.channel.empty() ? std::string("system") : options_.channel;
    context.chat_id = options_.to.empty() ? std::string("heartbeat") : options_.to;

    for (const auto& item : Checklist::Parse(content).Pending()) {
        const auto request = Plan(item);
        if (!request) {
            ++report.skipped;
            utils::LogDebug("heartbeat", "no action for item", {{"item", item.text}});
            continue;
        }
        ++report.attempted;
        const auto result = dispatcher_.Dispatch(*request, context);
        if (!result.Ok()) {
            ++report.failed;
            utils::LogWarn("heartbeat", "item failed", {
                {"item", item.text},
                {"error", utils::ToString(*result.error)},
                {"output", utils::Truncate(result.output, 200)}});
            continue;
        }
        bool marked = false;
        workspace_.ReadModifyWrite(kHeartbeatFile, [&](const std::string& current) {
            return Checklist::MarkDone(current, item.text, item.line, &marked);
        });
        if (!marked) {
            utils::LogWarn("heartbeat", "item vanished before it could be checked off", {{"item", item.text}});
        }
        ++report.succeeded;
    }
    utils::LogInfo("heartbeat", "run finished", {
        {"attempted", std::to_string(report.attempted)},
        {"succeeded", std::to_string(report.succeeded)},
        {"failed", std::to_string(report.failed)},
        {"skipped", std::to_string(report.skipped)}});
    return report;
}

std::optional<agent::tools::ToolCallRequest> HeartbeatService::Plan(const ChecklistItem& item) const {
    const auto split = item.text.find_first_of(" \t");
    const auto name = item.text.substr(0, split);
    const auto rest = split == std::string::npos ? std::string() : utils::Trim(item.text.substr(split));
    if (dispatcher_.Registry().Has(name) && (rest.empty() || rest.front() == '{')) {
        const auto arguments = rest.empty() ? nlohmann::json::object()
                                            : nlohmann::json::parse(rest, nullptr, false);
        if (!arguments.is_discarded() && arguments.is_object()) {
            nlohmann::json request = {{"name", name}, {"arguments", arguments}};
            auto call = agent::tools::ToolDispatcher::ParseRequest(request.dump());
            call.id = "heartbeat:" + std::to_string(item.line);
            return call;
        }
    }
    if (options_.channel.empty() || options_.to.empty() || !dispatcher_.Registry().Has("message")) {
        return std::nullopt;
    }
    agent::tools::ToolCallRequest call{};
    call.id = "heartbeat:" + std::to_string(item.line);
    call.name = "message";
    call.arguments["content"] = item.text;
    call.arguments["channel"] = options_.channel;
    call.arguments["chat_id"] = options_.to;
    return call;
}

void HeartbeatService::RunLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(loop_mutex_);
            loop_cv_.wait_for(lock, options_.interval, [this]() { return !running_.load(); });
        }
        if (!running_) {
            break;
        }
        try {
            RunOnce();
        } catch (const std::exception& ex) {
            utils::LogError("heartbeat", "run failed", {{"error", ex.what()}});
        }
    }
}

}  // namespace kestrel::heartbeat
