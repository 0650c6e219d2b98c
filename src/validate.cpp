#include "agentval/validate.hpp"

#include "agentval/exceptions.hpp"

namespace agentval
{

retry::SessionResult try_validate(const Json& output, const schema::Schema& schema,
                                  const ValidateOptions& options)
{
    retry::SessionOptions session;
    session.mode = options.mode.value_or(options.config.mode);
    session.limits = options.config.limits;
    session.policy = options.config.retry_policy();
    if (options.retries)
        session.policy.retries = *options.retries;
    session.prompt = options.prompt;
    session.generator = options.retry_fn;
    session.sink = options.sink;
    session.redactor = options.redactor;
    session.sleep = options.sleep;
    session.seed = options.seed;
    session.on_log_error = options.on_log_error;

    auto correlation = CorrelationContext::create(options.context, options.correlation_id);
    retry::RetryOrchestrator orchestrator(schema, std::move(session));
    return orchestrator.run(output, correlation);
}

Json validate(const Json& output, const schema::Schema& schema, const ValidateOptions& options)
{
    auto result = try_validate(output, schema, options);
    if (!result.ok())
        throw ValidationError(std::move(result.errors), result.attempts,
                              std::move(result.correlation_id), result.elapsed.count(),
                              std::move(result.log_errors));
    return std::move(result.value);
}

Json validate_text(const std::string& text, const schema::Schema& schema,
                   const ValidateOptions& options)
{
    return validate(Json(text), schema, options);
}

} // namespace agentval
