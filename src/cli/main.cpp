#include "agentval/config.hpp"
#include "agentval/correlation.hpp"
#include "agentval/exceptions.hpp"
#include "agentval/logging/cloud_sink.hpp"
#include "agentval/logging/file_sink.hpp"
#include "agentval/util/json.hpp"
#include "agentval/validate.hpp"
#include "agentval/version.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "agentval " << agentval::VERSION_MAJOR << "." << agentval::VERSION_MINOR << "."
              << agentval::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  agentval --help\n";
    std::cout << "  agentval test <schema.json> <input.json> [--mode strict|coerce]\n";
    std::cout << "  agentval id\n";
    std::cout << "  agentval logs [-n <count>] [--clear]\n";
    std::cout << "  agentval cloud-logs [-n <count>]\n";
    std::cout << "  agentval config [--show] [--set-api-key <key>] [--set-endpoint <url>]\n";
    std::cout << "                  [--set-log-to-cloud true|false]\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  AGENTVAL_HOME                  Config/log directory (default: ~/.agentval)\n";
    std::cout << "  AGENTVAL_MODE, AGENTVAL_RETRIES, AGENTVAL_TIMEOUT_S, AGENTVAL_API_KEY, ...\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<int> parse_count(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size() || v < 0)
            return std::nullopt;
        return v;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

static std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw agentval::Error("cannot open " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

static std::optional<std::string> first_unknown_flag(const std::vector<std::string>& args)
{
    for (const auto& a : args)
        if (is_flag(a))
            return a;
    return std::nullopt;
}

static void print_log_line(const agentval::logging::LogRecord& r)
{
    std::cout << r.ts << " " << (r.valid ? "OK  " : "FAIL") << " " << r.correlation_id << " "
              << r.mode << " (attempts: " << r.attempts << ", duration: " << r.duration_ms
              << "ms)";
    if (!r.valid && !r.errors.empty())
        std::cout << " " << r.errors.front().path << " " << r.errors.front().reason;
    std::cout << "\n";
}

static int run_test(std::vector<std::string> args, const agentval::Config& config)
{
    using namespace agentval;

    auto mode_arg = consume_flag_value(args, "--mode");
    if (!mode_arg)
        mode_arg = consume_flag_value(args, "-m");
    if (auto bad = first_unknown_flag(args))
    {
        std::cerr << "Unknown option: " << *bad << "\n";
        return 1;
    }
    if (args.size() != 2)
    {
        std::cerr << "Usage: agentval test <schema.json> <input.json> [--mode strict|coerce]\n";
        return 1;
    }

    ValidateOptions opts;
    opts.config = config;
    if (mode_arg)
    {
        if (*mode_arg != "strict" && *mode_arg != "coerce")
        {
            std::cerr << "Invalid mode: " << *mode_arg << " (expected strict or coerce)\n";
            return 1;
        }
        opts.mode = validation_mode_from_string(*mode_arg);
    }
    opts.sink = logging::make_default_sink(config);
    opts.on_log_error = [](const std::string& msg) { std::cerr << "warning: " << msg << "\n"; };

    auto spec = schema::Schema::parse(read_file(args[0]));
    // Input that is not JSON is handed over as raw text.
    auto input_text = read_file(args[1]);
    auto input = util::json::try_parse(input_text).value_or(Json(input_text));

    try
    {
        auto result = validate(input, spec, opts);
        std::cout << "Validation successful\n";
        std::cout << util::json::dump_pretty(result) << "\n";
        return 0;
    }
    catch (const ValidationError& e)
    {
        std::cerr << "Validation failed: " << e.what() << "\n";
        for (const auto& err : e.errors())
        {
            std::cerr << "  " << err.path << ": " << err.reason;
            if (!err.message.empty())
                std::cerr << " (" << err.message << ")";
            std::cerr << "\n";
        }
        return 2;
    }
}

static int run_logs(std::vector<std::string> args, const agentval::Config& config)
{
    auto count = consume_flag_value(args, "-n");
    if (!count)
        count = consume_flag_value(args, "--number");
    bool clear = consume_flag(args, "--clear");
    if (auto bad = first_unknown_flag(args))
    {
        std::cerr << "Unknown option: " << *bad << "\n";
        return 1;
    }

    agentval::logging::FileLogSink sink(config.effective_log_path());
    if (clear)
    {
        sink.clear();
        std::cout << "All logs cleared.\n";
        return 0;
    }

    int n = 20;
    if (count)
    {
        auto parsed = parse_count(*count);
        if (!parsed)
        {
            std::cerr << "Invalid count: " << *count << "\n";
            return 1;
        }
        n = *parsed;
    }

    auto records = sink.recent(static_cast<size_t>(n));
    if (records.empty())
    {
        std::cout << "No logs found.\n";
        return 0;
    }
    for (const auto& r : records)
        print_log_line(r);
    return 0;
}

static int run_cloud_logs(std::vector<std::string> args, const agentval::Config& config)
{
    auto count = consume_flag_value(args, "-n");
    int n = 20;
    if (count)
    {
        auto parsed = parse_count(*count);
        if (!parsed)
        {
            std::cerr << "Invalid count: " << *count << "\n";
            return 1;
        }
        n = *parsed;
    }

    agentval::logging::CloudLogSink cloud(config.cloud_endpoint, config.api_key.value_or(""));
    auto records = cloud.fetch_recent(static_cast<size_t>(n));
    if (records.empty())
    {
        std::cout << "No logs found.\n";
        return 0;
    }
    for (const auto& r : records)
        print_log_line(r);
    return 0;
}

static int run_config(std::vector<std::string> args)
{
    using agentval::Config;

    bool show = consume_flag(args, "--show");
    auto api_key = consume_flag_value(args, "--set-api-key");
    auto endpoint = consume_flag_value(args, "--set-endpoint");
    auto to_cloud = consume_flag_value(args, "--set-log-to-cloud");
    if (auto bad = first_unknown_flag(args))
    {
        std::cerr << "Unknown option: " << *bad << "\n";
        return 1;
    }

    auto path = Config::default_config_path();
    auto config = Config::load(path);

    if (show || (!api_key && !endpoint && !to_cloud))
    {
        // Shown values include environment overrides.
        auto effective = Config::from_env(config);
        std::cout << "Current configuration:\n";
        std::cout << "  max_output_bytes: " << effective.limits.max_output_bytes << "\n";
        std::cout << "  max_str_len: " << effective.limits.max_str_len << "\n";
        std::cout << "  max_list_len: " << effective.limits.max_list_len << "\n";
        std::cout << "  max_dict_keys: " << effective.limits.max_dict_keys << "\n";
        std::cout << "  mode: " << agentval::to_string(effective.mode) << "\n";
        std::cout << "  retries: " << effective.retries << "\n";
        std::cout << "  timeout_s: " << effective.timeout_s << "\n";
        std::cout << "  log_to_cloud: " << (effective.log_to_cloud ? "true" : "false") << "\n";
        std::cout << "  cloud_endpoint: " << effective.cloud_endpoint << "\n";
        std::cout << "  api_key: " << (effective.api_key ? "***" : "not set") << "\n";
        std::cout << "  log_path: " << effective.effective_log_path().string() << "\n";
        return 0;
    }

    if (api_key)
    {
        config.api_key = *api_key;
        std::cout << "API key updated.\n";
    }
    if (endpoint)
    {
        config.cloud_endpoint = *endpoint;
        std::cout << "Cloud endpoint updated.\n";
    }
    if (to_cloud)
    {
        if (*to_cloud != "true" && *to_cloud != "false")
        {
            std::cerr << "--set-log-to-cloud expects true or false\n";
            return 1;
        }
        config.log_to_cloud = *to_cloud == "true";
        std::cout << "Cloud logging " << (config.log_to_cloud ? "enabled" : "disabled") << ".\n";
    }
    config.save(path);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h")
        return usage(args.empty() ? 1 : 0);

    const std::string command = args[0];
    args.erase(args.begin());

    try
    {
        if (command == "id")
        {
            std::cout << agentval::generate_correlation_id() << "\n";
            return 0;
        }
        if (command == "config")
            return run_config(args);

        auto config = agentval::Config::resolve();
        if (command == "test")
            return run_test(args, config);
        if (command == "logs")
            return run_logs(args, config);
        if (command == "cloud-logs")
            return run_cloud_logs(args, config);

        std::cerr << "Unknown command: " << command << "\n";
        return usage(1);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
