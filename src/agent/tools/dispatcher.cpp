#include "agent/tools/dispatcher.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "nlohmann/json.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kestrel::agent::tools {
namespace {

bool IsInteger(const std::string& value, long long& out) {
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    out = std::strtoll(value.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

bool IsNumber(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    std::strtod(value.c_str(), &end);
    return errno == 0 && end && *end == '\0';
}

bool IsBoolean(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "true" || lowered == "false" || lowered == "1" || lowered == "0" ||
           lowered == "yes" || lowered == "no";
}

void CheckProperty(const std::string& field, const std::string& value, const nlohmann::json& property) {
    const auto type = property.value("type", std::string("string"));
    if (type == "integer") {
        long long parsed = 0;
        if (!IsInteger(value, parsed)) {
            throw utils::ValidationError(field, field + " must be an integer, got '" + value + "'");
        }
        if (property.contains("minimum") && property["minimum"].is_number() &&
            parsed < property["minimum"].get<long long>()) {
            throw utils::ValidationError(field, field + " must be >= " + property["minimum"].dump());
        }
        if (property.contains("maximum") && property["maximum"].is_number() &&
            parsed > property["maximum"].get<long long>()) {
            throw utils::ValidationError(field, field + " must be <= " + property["maximum"].dump());
        }
    } else if (type == "number") {
        if (!IsNumber(value)) {
            throw utils::ValidationError(field, field + " must be a number, got '" + value + "'");
        }
    } else if (type == "boolean") {
        if (!IsBoolean(value)) {
            throw utils::ValidationError(field, field + " must be a boolean, got '" + value + "'");
        }
    }
    if (property.contains("enum") && property["enum"].is_array()) {
        const auto& allowed = property["enum"];
        const bool member = std::any_of(allowed.begin(), allowed.end(), [&](const nlohmann::json& item) {
            return item.is_string() && item.get<std::string>() == value;
        });
        if (!member) {
            throw utils::ValidationError(field, field + " must be one of " + allowed.dump());
        }
    }
}

std::string DescribeParams(const ToolArguments& params) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) {
            oss << ", ";
        }
        oss << key << "=" << (value.size() > 80 ? value.substr(0, 80) + "..." : value);
        first = false;
    }
    oss << "}";
    return oss.str();
}

}  // namespace

std::string ToolResult::ToJson() const {
    nlohmann::json json = {
        {"call_id", call_id},
        {"output", output},
        {"error", error.has_value() ? nlohmann::json(utils::ToString(*error)) : nlohmann::json(nullptr)},
        {"field", error_field.empty() ? nlohmann::json(nullptr) : nlohmann::json(error_field)}
    };
    return json.dump();
}

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry,
                               DispatcherOptions options,
                               MemoryStore* history)
    : registry_(registry)
    , options_(options)
    , history_(history) {}

ToolResult ToolDispatcher::Dispatch(const ToolCallRequest& request, const ToolContext& context) const {
    ToolResult result{};
    result.call_id = request.id;

    auto* tool = registry_.Get(request.name);
    if (!tool) {
        result.error = utils::ErrorKind::kValidation;
        result.error_field = "name";
        result.output = "Error: Tool '" + request.name + "' not found";
        utils::LogWarn("tool", "rejected unknown tool", {{"name", request.name}});
        return result;
    }

    ToolContext effective = context;
    if (effective.timeout.count() <= 0) {
        effective.timeout = options_.default_timeout;
    }
    effective.timeout = std::min(effective.timeout, options_.max_timeout);

    utils::LogInfo("tool", "start", {{"name", request.name}, {"params", DescribeParams(request.arguments)}});
    try {
        ValidateArguments(*tool, request.arguments);
        result.output = tool->Execute(request.arguments, effective);
    } catch (const utils::Error& ex) {
        result.error = ex.Kind();
        result.error_field = ex.Field();
        result.output = std::string("Error: ") + ex.what();
    } catch (const std::exception& ex) {
        result.error = utils::ErrorKind::kExecutionFailed;
        result.output = std::string("Error: ") + ex.what();
    }
    utils::LogInfo("tool", "end", {
        {"name", request.name},
        {"size", std::to_string(result.output.size())},
        {"status", result.Ok() ? "ok" : utils::ToString(*result.error)}});
    // Rejected requests leave no trace in the history log.
    if (result.error != utils::ErrorKind::kValidation) {
        RecordHistory(request, effective, result);
    }
    return result;
}

void ToolDispatcher::ValidateArguments(const Tool& tool, const ToolArguments& arguments) {
    const auto schema = nlohmann::json::parse(tool.ParametersJson(), nullptr, false);
    if (schema.is_discarded() || !schema.is_object()) {
        throw utils::InfrastructureError("schema", "tool '" + tool.Name() + "' has an invalid parameter schema");
    }
    const auto properties = schema.value("properties", nlohmann::json::object());
    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& item : schema["required"]) {
            if (!item.is_string()) {
                continue;
            }
            const auto field = item.get<std::string>();
            if (arguments.find(field) == arguments.end()) {
                throw utils::ValidationError(field, field + " is required");
            }
        }
    }
    for (const auto& [field, value] : arguments) {
        if (!properties.contains(field) || !properties[field].is_object()) {
            continue;
        }
        const auto& property = properties[field];
        const bool is_string = property.value("type", std::string("string")) == "string";
        if (value.empty() && !is_string) {
            continue;
        }
        CheckProperty(field, value, property);
    }
}

ToolCallRequest ToolDispatcher::ParseRequest(const std::string& json_text) {
    const auto data = nlohmann::json::parse(json_text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw utils::ValidationError("request", "request must be a JSON object");
    }
    ToolCallRequest request{};
    if (data.contains("call_id") && data["call_id"].is_string()) {
        request.id = data["call_id"].get<std::string>();
    } else if (data.contains("id") && data["id"].is_string()) {
        request.id = data["id"].get<std::string>();
    }
    if (!data.contains("name") || !data["name"].is_string() || data["name"].get<std::string>().empty()) {
        throw utils::ValidationError("name", "name is required");
    }
    request.name = data["name"].get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    if (data.contains("arguments")) {
        arguments = data["arguments"];
        if (arguments.is_string()) {
            arguments = nlohmann::json::parse(arguments.get<std::string>(), nullptr, false);
        }
    }
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (arguments.is_discarded() || !arguments.is_object()) {
        throw utils::ValidationError("arguments", "arguments must be a JSON object");
    }
    for (const auto& [key, value] : arguments.items()) {
        if (value.is_string()) {
            request.arguments[key] = value.get<std::string>();
        } else if (!value.is_null()) {
            request.arguments[key] = value.dump();
        }
    }
    return request;
}

void ToolDispatcher::RecordHistory(const ToolCallRequest& request,
                                   const ToolContext& context,
                                   const ToolResult& result) const {
    if (!history_ || !options_.log_history) {
        return;
    }
    std::ostringstream entry;
    entry << "[" << context.SessionKey() << "] tool " << request.name;
    if (!request.id.empty()) {
        entry << " (" << request.id << ")";
    }
    entry << " -> " << (result.Ok() ? "ok" : utils::ToString(*result.error));
    try {
        history_->AppendHistory(entry.str());
    } catch (const std::exception& ex) {
        utils::LogError("tool", "history append failed", {{"error", ex.what()}});
    }
}

}  // namespace kestrel::agent::tools
