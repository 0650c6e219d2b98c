#pragma once
#include "agentval/retry/policy.hpp"
#include "agentval/schema/limits.hpp"
#include "agentval/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace agentval
{

/// Resolved engine configuration. The library never reads the environment or
/// the config file on its own; callers build a Config (or use resolve()) and
/// pass it in.
struct Config
{
    schema::Limits limits;
    int retries{2};
    int timeout_s{20};
    int base_delay_ms{500};
    ValidationMode mode{ValidationMode::Strict};
    bool log_to_cloud{false};
    std::string cloud_endpoint{"https://api.agentvalidator.dev"};
    std::optional<std::string> api_key;
    /// Empty means default_log_path().
    std::string log_path;

    /// Overlay AGENTVAL_* environment variables on the defaults, or on `base`.
    static Config from_env();
    static Config from_env(Config base);
    /// Keys absent from `j` keep their defaults. Throws ConfigError on bad values.
    static Config from_json(const Json& j);
    Json to_json() const;

    /// Throws ConfigError when the file exists but cannot be read or parsed;
    /// a missing file yields the defaults.
    static Config load(const std::filesystem::path& path);
    void save(const std::filesystem::path& path) const;

    /// defaults <- config file <- environment.
    static Config resolve();

    /// $AGENTVAL_HOME, else $HOME/.agentval
    static std::filesystem::path default_dir();
    static std::filesystem::path default_config_path();
    static std::filesystem::path default_log_path();

    std::filesystem::path effective_log_path() const;
    retry::RetryPolicy retry_policy() const;
};

} // namespace agentval
