#include <agentval.hpp>
#include <atomic>
#include <iostream>

// Example: validate generated output with retries
//
// The fake generator returns prose on its first call and a well-formed user
// profile afterwards. The initial output is also malformed, so the session
// needs two retries before it succeeds.
//
// Usage:
//   ./agentval_example_basic

int main()
{
    using namespace agentval;
    using schema::TypeSpec;

    schema::Schema schema{{"name", TypeSpec::string()},
                          {"age", TypeSpec::integer()},
                          {"email", TypeSpec::string()},
                          {"tags", TypeSpec::list_of(TypeSpec::string())}};

    std::atomic<int> calls{0};
    auto call_agent = [&calls](const std::string&, const Json&) -> Json
    {
        if (calls.fetch_add(1) == 0)
            return "Sure! Here is the profile you asked for.";
        return R"({"name": "John Doe", "age": "30", "email": "john@example.com",
                   "tags": ["developer", "cpp"]})";
    };

    ValidateOptions opts;
    opts.mode = ValidationMode::Coerce;
    opts.retry_fn = call_agent;
    opts.retries = 2;
    opts.prompt = "Generate user profile";
    opts.context = Json{{"task_id", "123"}};
    opts.config.base_delay_ms = 100;
    auto sink = std::make_shared<logging::InMemoryLogSink>();
    opts.sink = sink;

    try
    {
        auto result = validate(Json("not json at all"), schema, opts);
        std::cout << "Validation successful\n" << result.dump(2) << "\n";
    }
    catch (const ValidationError& e)
    {
        std::cerr << "Validation failed: " << e.what() << "\n";
        return 1;
    }

    for (const auto& r : sink->records())
        std::cout << "attempt " << r.attempts << " [" << r.correlation_id << "] "
                  << (r.valid ? "valid" : "invalid") << "\n";
    return 0;
}
