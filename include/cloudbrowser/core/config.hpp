#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser {

using json = nlohmann::json;

/// Policy for binding proxies to pool slots.
enum class ProxyOrdering {
    Random,
    RoundRobin,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ProxyOrdering, {
    {ProxyOrdering::Random, "random"},
    {ProxyOrdering::RoundRobin, "round-robin"},
})

auto to_string(ProxyOrdering ordering) -> std::string_view;
auto parse_proxy_ordering(std::string_view value) -> Result<ProxyOrdering>;

/// Settings of the CLOUD_BROWSER namespace. Immutable once a pool is built
/// from it; see validate_config() for the accepted ranges.
struct PoolConfig {
    std::string api_host;
    std::string api_token;
    int num_browsers = 1;
    std::vector<std::string> proxies;
    int pages_per_browser = 100;
    int start_semaphores = 10;
    ProxyOrdering proxy_ordering = ProxyOrdering::Random;
    json browser_settings;  // null or object, passed through verbatim
    json fingerprint;       // null or object, passed through verbatim

    int provision_timeout_seconds = 60;
    int connect_timeout_seconds = 10;
    int provision_attempts = 3;
    int provision_retry_delay_ms = 500;
    int heartbeat_interval_seconds = 5;  // 0 disables the heartbeat
    bool recycle_on_fetch_error = false;
    bool recycle_on_server_error = true;
    int shutdown_timeout_ms = 10000;
};

/// Serialises with the upper-case CLOUD_BROWSER key names.
void to_json(json& j, const PoolConfig& c);

/// Top-level application configuration.
struct Config {
    PoolConfig cloud_browser;
    std::string log_level = "info";
};

void to_json(json& j, const Config& c);

/// Checks every field of a PoolConfig. Returns InvalidConfig naming the
/// offending key on the first violation.
auto validate_config(const PoolConfig& config) -> Result<void>;

/// Parses the body of a CLOUD_BROWSER object. Unknown keys are ignored,
/// missing optional keys keep their defaults, type mismatches and invalid
/// values yield InvalidConfig.
auto parse_pool_config(const json& j) -> Result<PoolConfig>;

/// Loads {"CLOUD_BROWSER": {...}, "log_level": "..."} from a JSON file.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Builds the configuration from CLOUD_BROWSER_<KEY> environment variables
/// (PROXIES comma separated, BROWSER_SETTINGS / FINGERPRINT as JSON text)
/// and CLOUD_BROWSER_LOG_LEVEL.
auto load_config_from_env() -> Result<Config>;

/// Masks secrets (API_TOKEN, proxy passwords) in a serialised config.
void redact_config_json(json& j);

} // namespace cloudbrowser
