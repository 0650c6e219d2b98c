#pragma once
#include "agentval/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace agentval
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Malformed schema definition. Never retried.
struct SchemaError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

/// Generator did not return within its per-attempt budget.
struct AttemptTimeoutError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Failure delivering a record to the cloud log endpoint.
struct CloudLogError : public TransportError
{
    using TransportError::TransportError;
};

/// Terminal validation failure: retry budget exhausted or no generator supplied.
class ValidationError : public Error
{
  public:
    ValidationError(ErrorList errors, int attempts, std::string correlation_id,
                    long long elapsed_ms, std::vector<std::string> log_errors = {})
        : Error(describe(errors, attempts, correlation_id)), errors_(std::move(errors)),
          attempts_(attempts), correlation_id_(std::move(correlation_id)),
          elapsed_ms_(elapsed_ms), log_errors_(std::move(log_errors))
    {
    }

    const ErrorList& errors() const
    {
        return errors_;
    }
    int attempts() const
    {
        return attempts_;
    }
    const std::string& correlation_id() const
    {
        return correlation_id_;
    }
    long long elapsed_ms() const
    {
        return elapsed_ms_;
    }
    /// Logging failures observed during the session (never the cause of this error).
    const std::vector<std::string>& log_errors() const
    {
        return log_errors_;
    }

  private:
    static std::string describe(const ErrorList& errors, int attempts,
                                const std::string& correlation_id)
    {
        std::string msg = "validation failed after " + std::to_string(attempts) + " attempt" +
                          (attempts == 1 ? "" : "s");
        if (!correlation_id.empty())
            msg += " [" + correlation_id + "]";
        if (!errors.empty())
        {
            msg += ": " + errors.front().path + " " + errors.front().reason;
            if (errors.size() > 1)
                msg += " (+" + std::to_string(errors.size() - 1) + " more)";
        }
        return msg;
    }

    ErrorList errors_;
    int attempts_{0};
    std::string correlation_id_;
    long long elapsed_ms_{0};
    std::vector<std::string> log_errors_;
};

} // namespace agentval
