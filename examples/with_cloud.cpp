#include <agentval.hpp>
#include <iostream>

// Example: coerce loosely typed output and ship records to the cloud endpoint
//
// Configuration comes from ~/.agentval/config.json and AGENTVAL_* variables,
// e.g.
//   AGENTVAL_LOG_TO_CLOUD=1 AGENTVAL_API_KEY=... ./agentval_example_with_cloud
//
// Cloud delivery failures are reported as warnings; they never change the
// validation result. Emails in the context are masked before leaving the process.

int main()
{
    using namespace agentval;
    using schema::TypeSpec;

    schema::Schema preferences{{"theme", TypeSpec::string()},
                               {"notifications", TypeSpec::boolean()}};
    schema::Schema schema{{"name", TypeSpec::string()},
                          {"age", TypeSpec::integer()},
                          {"email", TypeSpec::string()},
                          {"is_active", TypeSpec::boolean()},
                          {"nickname", TypeSpec::optional(TypeSpec::string())},
                          {"preferences", TypeSpec::object(preferences)}};

    ValidateOptions opts;
    opts.config = Config::resolve();
    opts.mode = ValidationMode::Coerce;
    opts.context = Json{{"task_id", "456"}, {"user", "alice@example.com"}};
    opts.sink = logging::make_default_sink(opts.config);
    opts.on_log_error = [](const std::string& msg) { std::cerr << "warning: " << msg << "\n"; };

    Json output = {{"name", "Alice Smith"},
                   {"age", "25"},
                   {"email", "alice@example.com"},
                   {"is_active", "true"},
                   {"preferences", {{"theme", "dark"}, {"notifications", true}}}};

    auto result = try_validate(output, schema, opts);
    if (!result.ok())
    {
        std::cerr << "Validation failed [" << result.correlation_id << "]\n";
        for (const auto& e : result.errors)
            std::cerr << "  " << e.path << ": " << e.reason << "\n";
        return 1;
    }
    std::cout << "Validation successful [" << result.correlation_id << "]\n"
              << result.value.dump(2) << "\n";
    return 0;
}
