#include "agentval/config.hpp"

#include "agentval/exceptions.hpp"
#include "agentval/util/json.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace agentval
{

static std::optional<std::string> getenv_opt(const char* key)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return std::nullopt;
}

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

static bool parse_bool(const std::string& key, const std::string& value)
{
    auto v = lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty())
        return false;
    throw ConfigError(key + ": expected a boolean, got '" + value + "'");
}

static long long parse_number(const std::string& key, const std::string& value,
                              long long min_value)
{
    try
    {
        size_t pos = 0;
        long long v = std::stoll(value, &pos, 10);
        if (pos != value.size() || v < min_value)
            throw ConfigError(key + ": invalid value '" + value + "'");
        return v;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError(key + ": invalid value '" + value + "'");
    }
}

static ValidationMode parse_mode(const std::string& key, const std::string& value)
{
    auto v = lower(value);
    if (v == "strict")
        return ValidationMode::Strict;
    if (v == "coerce")
        return ValidationMode::Coerce;
    throw ConfigError(key + ": expected 'strict' or 'coerce', got '" + value + "'");
}

// Limits are sizes; anything but a whole number >= min_value is rejected
// before it can wrap around in a size_t.
static void check_limit(const Json& j, const char* key, unsigned long long min_value)
{
    if (!j.contains(key))
        return;
    const auto& v = j.at(key);
    if (!v.is_number_unsigned() || v.get<unsigned long long>() < min_value)
        throw ConfigError(std::string("invalid config: ") + key + " must be an integer >= " +
                          std::to_string(min_value) + ", got " + v.dump());
}

Config Config::from_env()
{
    return from_env(Config{});
}

Config Config::from_env(Config base)
{
    Config c = std::move(base);
    if (auto v = getenv_opt("AGENTVAL_MAX_OUTPUT_BYTES"))
        c.limits.max_output_bytes =
            static_cast<size_t>(parse_number("AGENTVAL_MAX_OUTPUT_BYTES", *v, 1));
    if (auto v = getenv_opt("AGENTVAL_MAX_STR_LEN"))
        c.limits.max_str_len = static_cast<size_t>(parse_number("AGENTVAL_MAX_STR_LEN", *v, 0));
    if (auto v = getenv_opt("AGENTVAL_MAX_LIST_LEN"))
        c.limits.max_list_len = static_cast<size_t>(parse_number("AGENTVAL_MAX_LIST_LEN", *v, 0));
    if (auto v = getenv_opt("AGENTVAL_MAX_DICT_KEYS"))
        c.limits.max_dict_keys =
            static_cast<size_t>(parse_number("AGENTVAL_MAX_DICT_KEYS", *v, 0));
    if (auto v = getenv_opt("AGENTVAL_RETRIES"))
        c.retries = static_cast<int>(parse_number("AGENTVAL_RETRIES", *v, 0));
    if (auto v = getenv_opt("AGENTVAL_TIMEOUT_S"))
        c.timeout_s = static_cast<int>(parse_number("AGENTVAL_TIMEOUT_S", *v, 0));
    if (auto v = getenv_opt("AGENTVAL_BASE_DELAY_MS"))
        c.base_delay_ms = static_cast<int>(parse_number("AGENTVAL_BASE_DELAY_MS", *v, 0));
    if (auto v = getenv_opt("AGENTVAL_MODE"))
        c.mode = parse_mode("AGENTVAL_MODE", *v);
    if (auto v = getenv_opt("AGENTVAL_LOG_TO_CLOUD"))
        c.log_to_cloud = parse_bool("AGENTVAL_LOG_TO_CLOUD", *v);
    if (auto v = getenv_opt("AGENTVAL_CLOUD_ENDPOINT"))
        c.cloud_endpoint = *v;
    if (auto v = getenv_opt("AGENTVAL_API_KEY"))
        c.api_key = *v;
    if (auto v = getenv_opt("AGENTVAL_LOG_PATH"))
        c.log_path = *v;
    return c;
}

Config Config::from_json(const Json& j)
{
    Config c;
    if (!j.is_object())
        throw ConfigError("config must be a JSON object");
    check_limit(j, "max_output_bytes", 1);
    check_limit(j, "max_str_len", 0);
    check_limit(j, "max_list_len", 0);
    check_limit(j, "max_dict_keys", 0);
    try
    {
        schema::from_json(j, c.limits);
        if (j.contains("retries"))
            c.retries = j.at("retries").get<int>();
        if (j.contains("timeout_s"))
            c.timeout_s = j.at("timeout_s").get<int>();
        if (j.contains("base_delay_ms"))
            c.base_delay_ms = j.at("base_delay_ms").get<int>();
        if (j.contains("mode"))
            c.mode = parse_mode("mode", j.at("mode").get<std::string>());
        if (j.contains("log_to_cloud"))
            c.log_to_cloud = j.at("log_to_cloud").get<bool>();
        if (j.contains("cloud_endpoint"))
            c.cloud_endpoint = j.at("cloud_endpoint").get<std::string>();
        if (j.contains("api_key") && !j.at("api_key").is_null())
            c.api_key = j.at("api_key").get<std::string>();
        if (j.contains("log_path"))
            c.log_path = j.at("log_path").get<std::string>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid config: ") + e.what());
    }
    if (c.retries < 0 || c.timeout_s < 0 || c.base_delay_ms < 0)
        throw ConfigError("invalid config: retries, timeout_s and base_delay_ms must be >= 0");
    return c;
}

Json Config::to_json() const
{
    Json j = limits;
    j["retries"] = retries;
    j["timeout_s"] = timeout_s;
    j["base_delay_ms"] = base_delay_ms;
    j["mode"] = agentval::to_string(mode);
    j["log_to_cloud"] = log_to_cloud;
    j["cloud_endpoint"] = cloud_endpoint;
    j["api_key"] = api_key ? Json(*api_key) : Json(nullptr);
    j["log_path"] = log_path;
    return j;
}

Config Config::load(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return Config{};

    std::ifstream in(path);
    if (!in.is_open())
        throw ConfigError("cannot read config file " + path.string());
    std::stringstream buf;
    buf << in.rdbuf();
    auto doc = util::json::try_parse(buf.str());
    if (!doc)
        throw ConfigError("config file " + path.string() + " is not valid JSON");
    return from_json(*doc);
}

void Config::save(const std::filesystem::path& path) const
{
    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            throw ConfigError("cannot create " + path.parent_path().string() + ": " +
                              ec.message());
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        throw ConfigError("cannot write config file " + path.string());
    out << util::json::dump_pretty(to_json()) << "\n";
    if (!out)
        throw ConfigError("failed writing config file " + path.string());
}

Config Config::resolve()
{
    return from_env(load(default_config_path()));
}

std::filesystem::path Config::default_dir()
{
    if (auto home = getenv_opt("AGENTVAL_HOME"))
        return *home;
#ifdef _WIN32
    if (auto profile = getenv_opt("USERPROFILE"))
        return std::filesystem::path(*profile) / ".agentval";
#endif
    if (auto home = getenv_opt("HOME"))
        return std::filesystem::path(*home) / ".agentval";
    return std::filesystem::path(".agentval");
}

std::filesystem::path Config::default_config_path()
{
    return default_dir() / "config.json";
}

std::filesystem::path Config::default_log_path()
{
    return default_dir() / "logs" / "validations.jsonl";
}

std::filesystem::path Config::effective_log_path() const
{
    return log_path.empty() ? default_log_path() : std::filesystem::path(log_path);
}

retry::RetryPolicy Config::retry_policy() const
{
    retry::RetryPolicy p;
    p.retries = retries;
    p.base_delay = std::chrono::milliseconds(base_delay_ms);
    p.attempt_timeout = std::chrono::milliseconds(static_cast<long long>(timeout_s) * 1000);
    return p;
}

} // namespace agentval
