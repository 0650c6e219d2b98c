#include "agentval/retry/orchestrator.hpp"

#include "agentval/exceptions.hpp"

#include <future>
#include <thread>

namespace agentval::retry
{

std::string to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Attempting:
        return "attempting";
    case SessionState::Retrying:
        return "retrying";
    case SessionState::Succeeded:
        return "succeeded";
    case SessionState::Exhausted:
        return "exhausted";
    }
    return "exhausted";
}

RetryOrchestrator::RetryOrchestrator(const schema::Schema& schema, SessionOptions options)
    : options_(std::move(options)), validator_(schema, options_.mode, options_.limits)
{
}

SessionResult RetryOrchestrator::run(const Json& initial_output,
                                     const CorrelationContext& correlation)
{
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    auto since_start = [&start]()
    { return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start); };

    std::mt19937_64 rng(options_.seed ? *options_.seed : std::random_device{}());
    const int max_attempts = options_.policy.max_attempts();

    SessionResult result;
    result.correlation_id = correlation.id();

    RetryState state;
    SessionState current = SessionState::Attempting;
    Json raw = initial_output;
    std::optional<schema::ValidationOutcome> generator_failure;

    while (current == SessionState::Attempting)
    {
        if (generator_failure)
        {
            state.last = std::move(*generator_failure);
            generator_failure.reset();
        }
        else
        {
            state.last = validator_.validate(raw);
        }
        state.elapsed = since_start();
        emit(correlation, state, raw, result.log_errors);

        if (state.last.ok())
        {
            current = SessionState::Succeeded;
            break;
        }
        if (!options_.generator || state.attempt >= max_attempts)
        {
            current = SessionState::Exhausted;
            break;
        }

        current = SessionState::Retrying;
        auto delay = backoff_delay(options_.policy, state.attempt, rng);
        if (options_.sleep)
            options_.sleep(delay);
        else
            std::this_thread::sleep_for(delay);

        ++state.attempt;
        ++state.generator_calls;
        try
        {
            raw = invoke_generator(correlation);
        }
        catch (const AttemptTimeoutError& e)
        {
            raw = nullptr;
            generator_failure = schema::ValidationOutcome::failure(
                ErrorList{FieldError{ROOT_PATH, reason::TIMEOUT, e.what()}});
        }
        catch (const std::exception& e)
        {
            raw = nullptr;
            generator_failure = schema::ValidationOutcome::failure(
                ErrorList{FieldError{ROOT_PATH, reason::GENERATOR_ERROR, e.what()}});
        }
        current = SessionState::Attempting;
    }

    result.state = current;
    result.attempts = state.attempt;
    result.generator_calls = state.generator_calls;
    result.elapsed = since_start();
    if (state.last.ok())
        result.value = state.last.value();
    else
        result.errors = state.last.errors();
    return result;
}

Json RetryOrchestrator::invoke_generator(const CorrelationContext& correlation) const
{
    const auto timeout = options_.policy.attempt_timeout;
    if (timeout.count() <= 0)
        return options_.generator(options_.prompt, correlation.context());

    // The worker owns copies of everything it touches so it can outlive this
    // session if the generator never returns.
    auto promise = std::make_shared<std::promise<Json>>();
    auto future = promise->get_future();
    std::thread(
        [promise, fn = options_.generator, prompt = options_.prompt,
         context = correlation.context()]()
        {
            try
            {
                promise->set_value(fn(prompt, context));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        })
        .detach();

    if (future.wait_for(timeout) == std::future_status::timeout)
        throw AttemptTimeoutError("generator did not return within " +
                                  std::to_string(timeout.count()) + "ms");
    return future.get();
}

void RetryOrchestrator::emit(const CorrelationContext& correlation, const RetryState& state,
                             const Json& raw, std::vector<std::string>& log_errors) const
{
    logging::LogRecord record;
    record.ts = logging::iso8601_now();
    record.correlation_id = correlation.id();
    record.valid = state.last.ok();
    record.errors = state.last.errors();
    record.attempts = state.attempt;
    record.duration_ms = state.elapsed.count();
    record.mode = agentval::to_string(options_.mode);
    record.limits = validator_.limits();
    record.context = correlation.context();
    // Sampled wide so a secret crossing the sample cut is whole when redacted;
    // redact() trims to OUTPUT_SAMPLE_BYTES afterwards.
    record.output_sample = raw.is_null()
                               ? std::string()
                               : logging::output_sample(raw, logging::Redactor::MAX_TEXT_BYTES);
    if (!record.valid && !record.errors.empty())
        record.reason = record.errors.front().reason;

    const auto& redactor =
        options_.redactor ? *options_.redactor : logging::Redactor::default_instance();

    try
    {
        auto redacted = redactor.redact(record);
        if (options_.sink)
            options_.sink->write(redacted);
    }
    catch (const std::exception& e)
    {
        std::string message = std::string("log record for attempt ") +
                              std::to_string(state.attempt) + " not written: " + e.what();
        log_errors.push_back(message);
        if (options_.on_log_error)
            options_.on_log_error(message);
    }
}

} // namespace agentval::retry
