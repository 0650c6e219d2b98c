#pragma once
#include "agentval/schema/limits.hpp"
#include "agentval/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace agentval::logging
{

/// Upper bound on the raw-output sample carried by a record.
constexpr size_t OUTPUT_SAMPLE_BYTES = 1000;

/// One attempt of one validation session, as handed to a LogSink.
struct LogRecord
{
    std::string ts; ///< ISO-8601 UTC, millisecond precision
    std::string correlation_id;
    bool valid{false};
    ErrorList errors;
    int attempts{0};
    long long duration_ms{0};
    std::string mode;
    schema::Limits limits;
    Json context = Json::object();
    std::string output_sample;
    /// Reason code of the first error when invalid ("timeout" for an attempt timeout).
    std::optional<std::string> reason;
};

void to_json(Json& j, const LogRecord& record);
void from_json(const Json& j, LogRecord& record);

/// Current time as "2025-01-31T12:34:56.789Z".
std::string iso8601_now();

/// Serialized form of a raw generator output, cut to `max_bytes` on a UTF-8
/// boundary. Text is sampled as-is.
std::string output_sample(const Json& raw, size_t max_bytes = OUTPUT_SAMPLE_BYTES);

} // namespace agentval::logging
