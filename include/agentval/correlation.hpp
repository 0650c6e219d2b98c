#pragma once
#include "agentval/types.hpp"

#include <optional>
#include <string>

namespace agentval
{

/// Context key that may carry a caller-chosen correlation id.
constexpr const char* CORRELATION_ID_KEY = "correlation_id";

/// Random RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9a4d-4c7e-b1f0-5d6e7a8b9c0d".
std::string generate_correlation_id();

bool is_uuid(const std::string& value);

/// Identifier plus caller context, threaded unchanged through every attempt
/// and log record of one validation session.
class CorrelationContext
{
  public:
    CorrelationContext(std::string id, Json context);

    /// Id precedence: `id`, then a string under CORRELATION_ID_KEY in
    /// `context`, then a freshly generated UUID.
    static CorrelationContext create(const Json& context = Json::object(),
                                     const std::optional<std::string>& id = std::nullopt);

    const std::string& id() const
    {
        return id_;
    }
    const Json& context() const
    {
        return context_;
    }

  private:
    std::string id_;
    Json context_;
};

} // namespace agentval
