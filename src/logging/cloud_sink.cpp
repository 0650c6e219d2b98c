#include "agentval/logging/cloud_sink.hpp"

#include "agentval/exceptions.hpp"
#include "agentval/util/json.hpp"
#include "agentval/version.hpp"

#include <httplib.h>

namespace agentval::logging
{
namespace
{

struct ParsedEndpoint
{
    std::string scheme_host_port; // "https://api.example.com:443"
    std::string base_path;        // "" or "/prefix" (no trailing '/')
};

ParsedEndpoint parse_endpoint(const std::string& url)
{
    std::string scheme = "http";
    std::string remaining = url;
    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    if (scheme != "http" && scheme != "https")
        throw CloudLogError("Unsupported URL scheme: " + scheme +
                            " (only http and https are allowed)");

    ParsedEndpoint out;
    auto slash_pos = remaining.find('/');
    std::string authority = remaining.substr(0, slash_pos);
    if (slash_pos != std::string::npos)
        out.base_path = remaining.substr(slash_pos);
    while (!out.base_path.empty() && out.base_path.back() == '/')
        out.base_path.pop_back();
    if (authority.empty())
        throw CloudLogError("cloud endpoint has no host: " + url);

    if (authority.find(':') == std::string::npos)
        authority += scheme == "https" ? ":443" : ":80";
    out.scheme_host_port = scheme + "://" + authority;
    return out;
}

std::string user_agent()
{
    return "agentval/" + std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) +
           "." + std::to_string(VERSION_PATCH);
}

} // namespace

CloudLogSink::CloudLogSink(std::string endpoint, std::string api_key, int connect_timeout_s,
                           int read_timeout_s)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)),
      connect_timeout_s_(connect_timeout_s), read_timeout_s_(read_timeout_s)
{
}

void CloudLogSink::write(const LogRecord& record)
{
    if (api_key_.empty())
        throw CloudLogError("No API key configured for cloud logging");

    auto url = parse_endpoint(endpoint_);
    httplib::Client cli(url.scheme_host_port);
    cli.set_connection_timeout(connect_timeout_s_, 0);
    cli.set_read_timeout(read_timeout_s_, 0);
    cli.set_follow_location(false);

    httplib::Headers headers = {{"Authorization", "Bearer " + api_key_},
                                {"User-Agent", user_agent()}};
    auto body = util::json::dump(Json(record));
    auto res = cli.Post(url.base_path + LOGS_ROUTE, headers, body, "application/json");
    if (!res)
        throw CloudLogError("Cannot connect to " + endpoint_ + ": " +
                            httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw CloudLogError("cloud log endpoint returned HTTP " + std::to_string(res->status));
}

std::vector<LogRecord> CloudLogSink::fetch_recent(size_t n) const
{
    if (api_key_.empty())
        throw CloudLogError("No API key configured for cloud logging");

    auto url = parse_endpoint(endpoint_);
    httplib::Client cli(url.scheme_host_port);
    cli.set_connection_timeout(connect_timeout_s_, 0);
    cli.set_read_timeout(read_timeout_s_, 0);
    cli.set_follow_location(false);

    httplib::Headers headers = {{"Authorization", "Bearer " + api_key_},
                                {"User-Agent", user_agent()},
                                {"Accept", "application/json"}};
    auto path = url.base_path + LOGS_ROUTE + "?limit=" + std::to_string(n);
    auto res = cli.Get(path, headers);
    if (!res)
        throw CloudLogError("Cannot connect to " + endpoint_ + ": " +
                            httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw CloudLogError("cloud log endpoint returned HTTP " + std::to_string(res->status));

    auto doc = util::json::try_parse(res->body);
    if (!doc)
        throw CloudLogError("cloud log endpoint returned invalid JSON");
    const Json* items = &*doc;
    if (doc->is_object() && doc->contains("logs"))
        items = &(*doc)["logs"];
    if (!items->is_array())
        throw CloudLogError("cloud log endpoint returned an unexpected payload");

    std::vector<LogRecord> out;
    for (const auto& item : *items)
    {
        if (!item.is_object())
            continue;
        try
        {
            out.push_back(item.get<LogRecord>());
        }
        catch (const Json::exception&)
        {
            continue;
        }
    }
    return out;
}

} // namespace agentval::logging
