#include "agent/tools/web.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

#include "httplib.h"
#include "nlohmann/json.hpp"

#include "utils/common.hpp"

namespace kestrel::agent::tools {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    } else {
        return parsed;
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    } else {
        parsed.path = "/";
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            parsed.host.clear();
        }
    } else {
        parsed.host = host_port;
    }
    return parsed;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else if (c == ' ') {
            encoded << "%20";
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

void ApplyProxy(httplib::Client& client) {
    std::string host;
    int port = 0;
    for (const auto* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
}

std::string StripHtml(const std::string& input) {
    std::string output;
    output.reserve(input.size());
    bool in_tag = false;
    bool last_space = false;
    for (char ch : input) {
        if (ch == '<') {
            in_tag = true;
            continue;
        }
        if (ch == '>') {
            in_tag = false;
            if (!last_space) {
                output.push_back(' ');
                last_space = true;
            }
            continue;
        }
        if (in_tag) {
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!last_space) {
                output.push_back(' ');
                last_space = true;
            }
        } else {
            output.push_back(ch);
            last_space = false;
        }
    }
    return output;
}

struct Fetched {
    httplib::Result result;
    bool timed_out = false;
};

// timeout bounds the whole request; a receive that stalls for the full
// timeout also counts as expired.
Fetched Get(const ParsedUrl& parsed,
            const std::string& path,
            const httplib::Headers& headers,
            std::chrono::seconds timeout) {
    if (timeout.count() <= 0) {
        timeout = std::chrono::seconds(30);
    }
    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_follow_location(true);
    ApplyProxy(client);

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    Fetched fetched{client.Get(path, headers, [deadline](uint64_t, uint64_t) {
        return std::chrono::steady_clock::now() < deadline;
    })};
    if (!fetched.result) {
        const auto error = fetched.result.error();
        const bool stalled = std::chrono::steady_clock::now() >= deadline;
        fetched.timed_out = error == httplib::Error::ConnectionTimeout ||
            (stalled && (error == httplib::Error::Read || error == httplib::Error::Write ||
                         error == httplib::Error::Canceled));
    }
    return fetched;
}

void ThrowRequestFailure(const std::string& tool, const Fetched& fetched) {
    const auto error = fetched.result.error();
    if (fetched.timed_out) {
        throw utils::Error(utils::ErrorKind::kExecutionTimeout, "url",
                           tool + " request timed out: " + httplib::to_string(error));
    }
    throw utils::Error(utils::ErrorKind::kExecutionFailed, "url", tool + " request failed: " + httplib::to_string(error));
}

}  // namespace

WebSearchTool::WebSearchTool(std::string api_key)
    : api_key_(std::move(api_key)) {}

std::string WebSearchTool::ParametersJson() const {
    return R"({"type":"object","properties":{"query":{"type":"string"},"count":{"type":"integer","minimum":1,"maximum":10}},"required":["query"]})";
}

std::string WebSearchTool::Execute(const ToolArguments& params, const ToolContext& context) {
    const auto query = RequireParam(params, "query");
    if (api_key_.empty()) {
        throw utils::Error(utils::ErrorKind::kExecutionFailed, "apiKey", "web search API key is not configured");
    }
    int limit = 5;
    const auto count = GetParam(params, "count");
    if (!count.empty()) {
        limit = std::clamp(std::stoi(count), 1, 10);
    }

    const auto parsed = ParseUrl("https://api.search.brave.com");
    const std::string path = "/res/v1/web/search?q=" + UrlEncode(query) + "&count=" + std::to_string(limit);
    const httplib::Headers headers{{"Accept", "application/json"}, {"X-Subscription-Token", api_key_}};
    auto fetched = Get(parsed, path, headers, context.timeout);
    if (!fetched.result) {
        ThrowRequestFailure("web_search", fetched);
    }
    const auto& response = fetched.result;
    if (response->status >= 400) {
        throw utils::Error(utils::ErrorKind::kExecutionFailed, "query",
                           "web_search HTTP " + std::to_string(response->status));
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded()) {
        throw utils::Error(utils::ErrorKind::kExecutionFailed, "query", "web_search returned invalid JSON");
    }

    std::ostringstream oss;
    if (json.contains("web") && json["web"].contains("results") && json["web"]["results"].is_array()) {
        int shown = 0;
        for (const auto& item : json["web"]["results"]) {
            if (shown >= limit) {
                break;
            }
            const auto title = item.value("title", "");
            const auto url = item.value("url", "");
            const auto desc = item.value("description", "");
            if (title.empty() && url.empty()) {
                continue;
            }
            oss << shown + 1 << ". " << title << "\n   " << url;
            if (!desc.empty()) {
                oss << "\n   " << desc;
            }
            oss << "\n";
            ++shown;
        }
    }
    const auto output = oss.str();
    return output.empty() ? "No results for: " + query : "Results for: " + query + "\n\n" + output;
}

std::string WebFetchTool::ParametersJson() const {
    return R"({"type":"object","properties":{"url":{"type":"string"},"maxBytes":{"type":"integer","minimum":1024,"maximum":50000},"textOnly":{"type":"boolean"}},"required":["url"]})";
}

std::string WebFetchTool::Execute(const ToolArguments& params, const ToolContext& context) {
    const auto url = RequireParam(params, "url");
    std::size_t max_bytes = 8000;
    const auto max_param = GetParam(params, "maxBytes");
    if (!max_param.empty()) {
        max_bytes = std::clamp<std::size_t>(std::stoul(max_param), 1024, 50000);
    }
    const auto text_param = utils::ToLower(GetParam(params, "textOnly"));
    const bool text_only = text_param.empty() || text_param == "true" || text_param == "1" || text_param == "yes";

    const auto parsed = ParseUrl(url);
    if (parsed.host.empty()) {
        throw utils::ValidationError("url", "url must be http(s)://host[/path]");
    }
    auto fetched = Get(parsed, parsed.path, {{"User-Agent", "kestrel/1.0"}}, context.timeout);
    if (!fetched.result) {
        ThrowRequestFailure("web_fetch", fetched);
    }
    const auto& response = fetched.result;
    if (response->status >= 400) {
        throw utils::Error(utils::ErrorKind::kExecutionFailed, "url",
                           "web_fetch HTTP " + std::to_string(response->status));
    }
    auto body = response->body;
    if (text_only && response->get_header_value("Content-Type").find("html") != std::string::npos) {
        body = StripHtml(body);
    }
    return utils::Truncate(body, max_bytes);
}

}  // namespace kestrel::agent::tools
