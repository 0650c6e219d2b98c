#pragma once
#include "agentval/correlation.hpp"
#include "agentval/logging/redact.hpp"
#include "agentval/logging/sink.hpp"
#include "agentval/retry/policy.hpp"
#include "agentval/schema/validator.hpp"
#include "agentval/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentval::retry
{

/// Caller-supplied generator: (prompt, context) -> raw output (text as a JSON
/// string, or structured JSON). Called once per retry, possibly on a worker
/// thread that outlives the session when the call times out, so captures must
/// stay valid for the generator's own lifetime.
using GeneratorFn = std::function<Json(const std::string& prompt, const Json& context)>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;
using LogErrorFn = std::function<void(const std::string& message)>;

enum class SessionState
{
    Attempting,
    Retrying,
    Succeeded,
    Exhausted
};

std::string to_string(SessionState state);

/// Per-session mutable bookkeeping; lives for one run() call.
struct RetryState
{
    int attempt{1};         ///< Current attempt, 1-based
    int generator_calls{0}; ///< Generator invocations so far
    std::chrono::milliseconds elapsed{0};
    schema::ValidationOutcome last;
};

/// Terminal outcome of one session.
struct SessionResult
{
    SessionState state{SessionState::Exhausted};
    Json value;             ///< Normalized output when Succeeded
    ErrorList errors;       ///< Last attempt's errors when Exhausted
    int attempts{0};
    int generator_calls{0};
    std::string correlation_id;
    std::chrono::milliseconds elapsed{0};
    std::vector<std::string> log_errors;

    bool ok() const
    {
        return state == SessionState::Succeeded;
    }
};

struct SessionOptions
{
    ValidationMode mode{ValidationMode::Strict};
    schema::Limits limits;
    RetryPolicy policy;
    std::string prompt;
    GeneratorFn generator;                                   ///< Empty: no retries
    std::shared_ptr<logging::LogSink> sink;                  ///< Null: records are dropped
    std::shared_ptr<const logging::Redactor> redactor;       ///< Null: default patterns
    SleepFn sleep;                                           ///< Null: std::this_thread::sleep_for
    std::optional<uint64_t> seed;                            ///< Jitter RNG seed
    LogErrorFn on_log_error;
};

/// Drives ATTEMPTING -> {SUCCEEDED, RETRYING, EXHAUSTED}.
///
/// Each attempt is validated, logged (redacted) and only then transitioned.
/// A generator timeout or exception consumes the attempt like invalid output.
class RetryOrchestrator
{
  public:
    RetryOrchestrator(const schema::Schema& schema, SessionOptions options);

    SessionResult run(const Json& initial_output, const CorrelationContext& correlation);

    const SessionOptions& options() const
    {
        return options_;
    }

  private:
    /// Throws AttemptTimeoutError when the per-attempt budget elapses.
    Json invoke_generator(const CorrelationContext& correlation) const;
    void emit(const CorrelationContext& correlation, const RetryState& state, const Json& raw,
              std::vector<std::string>& log_errors) const;

    SessionOptions options_;
    schema::Validator validator_;
};

} // namespace agentval::retry
