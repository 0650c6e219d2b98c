#pragma once
#include "agentval/config.hpp"
#include "agentval/retry/orchestrator.hpp"
#include "agentval/schema/schema.hpp"
#include "agentval/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace agentval
{

struct ValidateOptions
{
    /// Defaults to config.mode.
    std::optional<ValidationMode> mode;
    /// Called with (prompt, context) to regenerate output after a failed attempt.
    retry::GeneratorFn retry_fn;
    /// Defaults to config.retries.
    std::optional<int> retries;
    std::string prompt;
    Json context = Json::object();
    std::optional<std::string> correlation_id;
    Config config;

    std::shared_ptr<logging::LogSink> sink;
    std::shared_ptr<const logging::Redactor> redactor;
    retry::SleepFn sleep;
    std::optional<uint64_t> seed;
    retry::LogErrorFn on_log_error;
};

/// Runs one validation session and reports its terminal state without throwing
/// for validation failures.
retry::SessionResult try_validate(const Json& output, const schema::Schema& schema,
                                  const ValidateOptions& options = {});

/// Returns the normalized output, or throws ValidationError once the session
/// is exhausted. A JSON string `output` is treated as raw generator text.
Json validate(const Json& output, const schema::Schema& schema,
              const ValidateOptions& options = {});

/// Same as validate() for raw generator text.
Json validate_text(const std::string& text, const schema::Schema& schema,
                   const ValidateOptions& options = {});

} // namespace agentval
