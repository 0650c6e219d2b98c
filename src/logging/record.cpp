#include "agentval/logging/record.hpp"

#include "agentval/util/json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentval::logging
{

void to_json(Json& j, const LogRecord& record)
{
    j = Json{{"ts", record.ts},
             {"correlation_id", record.correlation_id},
             {"valid", record.valid},
             {"errors", record.errors},
             {"attempts", record.attempts},
             {"duration_ms", record.duration_ms},
             {"mode", record.mode},
             {"limits", record.limits},
             {"context", record.context},
             {"output_sample", record.output_sample}};
    j["reason"] = record.reason ? Json(*record.reason) : Json(nullptr);
}

void from_json(const Json& j, LogRecord& record)
{
    record.ts = j.value("ts", "");
    record.correlation_id = j.value("correlation_id", "");
    record.valid = j.value("valid", false);
    record.errors.clear();
    if (j.contains("errors") && j["errors"].is_array())
        record.errors = j["errors"].get<ErrorList>();
    record.attempts = j.value("attempts", 0);
    record.duration_ms = j.value("duration_ms", 0LL);
    record.mode = j.value("mode", "");
    if (j.contains("limits") && j["limits"].is_object())
        record.limits = j["limits"].get<schema::Limits>();
    record.context = j.value("context", Json::object());
    record.output_sample = j.value("output_sample", "");
    if (j.contains("reason") && j["reason"].is_string())
        record.reason = j["reason"].get<std::string>();
    else
        record.reason.reset();
}

std::string iso8601_now()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms << 'Z';
    return oss.str();
}

std::string output_sample(const Json& raw, size_t max_bytes)
{
    std::string text = raw.is_string() ? raw.get<std::string>() : util::json::dump(raw);
    return util::json::truncate_utf8(text, max_bytes);
}

} // namespace agentval::logging
