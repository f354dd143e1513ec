#include "cloudbrowser/core/config.hpp"
#include "cloudbrowser/core/logger.hpp"
#include "cloudbrowser/core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>

namespace cloudbrowser {

namespace {

constexpr std::string_view kNamespace = "CLOUD_BROWSER";

auto config_error(std::string_view key, std::string message) -> Error {
    return make_error(ErrorCode::InvalidConfig,
                      std::string(kNamespace) + "." + std::string(key) + " " + message);
}

auto read_int(const json& j, std::string_view key, int& out) -> Result<void> {
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_number_integer()) {
        return std::unexpected(config_error(key, "must be an integer"));
    }
    bool in_range = false;
    if (it->is_number_unsigned()) {
        in_range = it->get<std::uint64_t>()
                   <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        auto value = it->get<std::int64_t>();
        in_range = value >= std::numeric_limits<int>::min()
                   && value <= std::numeric_limits<int>::max();
    }
    if (!in_range) {
        return std::unexpected(config_error(key, "is out of range, got " + it->dump()));
    }
    out = it->get<int>();
    return {};
}

auto read_bool(const json& j, std::string_view key, bool& out) -> Result<void> {
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_boolean()) {
        return std::unexpected(config_error(key, "must be a boolean"));
    }
    out = it->get<bool>();
    return {};
}

auto read_string(const json& j, std::string_view key, std::string& out) -> Result<void> {
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) {
        return std::unexpected(config_error(key, "must be a string"));
    }
    out = it->get<std::string>();
    return {};
}

auto read_object(const json& j, std::string_view key, json& out) -> Result<void> {
    auto it = j.find(std::string(key));
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_object()) {
        return std::unexpected(config_error(key, "must be an object"));
    }
    out = *it;
    return {};
}

/// On-disk layout of the CLOUD_BROWSER object; member names are the keys.
struct PoolConfigDocument {
    std::string API_HOST;
    std::string API_TOKEN;
    int NUM_BROWSERS = 0;
    std::vector<std::string> PROXIES;
    int PAGES_PER_BROWSER = 0;
    int START_SEMAPHORES = 0;
    ProxyOrdering PROXY_ORDERING = ProxyOrdering::Random;
    json BROWSER_SETTINGS;
    json FINGERPRINT;
    int PROVISION_TIMEOUT = 0;
    int CONNECT_TIMEOUT = 0;
    int PROVISION_ATTEMPTS = 0;
    int PROVISION_RETRY_DELAY_MS = 0;
    int HEARTBEAT_INTERVAL = 0;
    bool RECYCLE_ON_FETCH_ERROR = false;
    bool RECYCLE_ON_SERVER_ERROR = false;
    int SHUTDOWN_TIMEOUT_MS = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PoolConfigDocument,
    API_HOST, API_TOKEN, NUM_BROWSERS, PROXIES, PAGES_PER_BROWSER, START_SEMAPHORES,
    PROXY_ORDERING, BROWSER_SETTINGS, FINGERPRINT, PROVISION_TIMEOUT, CONNECT_TIMEOUT,
    PROVISION_ATTEMPTS, PROVISION_RETRY_DELAY_MS, HEARTBEAT_INTERVAL,
    RECYCLE_ON_FETCH_ERROR, RECYCLE_ON_SERVER_ERROR, SHUTDOWN_TIMEOUT_MS)

struct ConfigDocument {
    PoolConfigDocument CLOUD_BROWSER;
    std::string log_level;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ConfigDocument, CLOUD_BROWSER, log_level)

auto to_document(const PoolConfig& c) -> PoolConfigDocument {
    return PoolConfigDocument{
        .API_HOST = c.api_host,
        .API_TOKEN = c.api_token,
        .NUM_BROWSERS = c.num_browsers,
        .PROXIES = c.proxies,
        .PAGES_PER_BROWSER = c.pages_per_browser,
        .START_SEMAPHORES = c.start_semaphores,
        .PROXY_ORDERING = c.proxy_ordering,
        .BROWSER_SETTINGS = c.browser_settings,
        .FINGERPRINT = c.fingerprint,
        .PROVISION_TIMEOUT = c.provision_timeout_seconds,
        .CONNECT_TIMEOUT = c.connect_timeout_seconds,
        .PROVISION_ATTEMPTS = c.provision_attempts,
        .PROVISION_RETRY_DELAY_MS = c.provision_retry_delay_ms,
        .HEARTBEAT_INTERVAL = c.heartbeat_interval_seconds,
        .RECYCLE_ON_FETCH_ERROR = c.recycle_on_fetch_error,
        .RECYCLE_ON_SERVER_ERROR = c.recycle_on_server_error,
        .SHUTDOWN_TIMEOUT_MS = c.shutdown_timeout_ms,
    };
}

auto env(std::string_view key) -> std::optional<std::string> {
    auto name = std::string(kNamespace) + "_" + std::string(key);
    if (const auto* val = std::getenv(name.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

} // anonymous namespace

auto to_string(ProxyOrdering ordering) -> std::string_view {
    switch (ordering) {
        case ProxyOrdering::Random: return "random";
        case ProxyOrdering::RoundRobin: return "round-robin";
    }
    return "random";
}

auto parse_proxy_ordering(std::string_view value) -> Result<ProxyOrdering> {
    if (value == "random") return ProxyOrdering::Random;
    if (value == "round-robin") return ProxyOrdering::RoundRobin;
    return std::unexpected(config_error(
        "PROXY_ORDERING", "must be 'random' or 'round-robin', got '" + std::string(value) + "'"));
}

void to_json(json& j, const PoolConfig& c) {
    j = to_document(c);
}

void to_json(json& j, const Config& c) {
    j = ConfigDocument{to_document(c.cloud_browser), c.log_level};
}

auto validate_config(const PoolConfig& config) -> Result<void> {
    auto host_scheme = utils::url_scheme(config.api_host);
    if (host_scheme != "http" && host_scheme != "https") {
        return std::unexpected(config_error("API_HOST", "must be an http(s) URL"));
    }
    if (config.api_token.empty()) {
        return std::unexpected(config_error("API_TOKEN", "must not be empty"));
    }
    if (config.num_browsers <= 0) {
        return std::unexpected(config_error("NUM_BROWSERS", "must be positive"));
    }
    if (config.pages_per_browser <= 0) {
        return std::unexpected(config_error("PAGES_PER_BROWSER", "must be positive"));
    }
    if (config.start_semaphores <= 0) {
        return std::unexpected(config_error("START_SEMAPHORES", "must be positive"));
    }
    for (const auto& proxy : config.proxies) {
        if (utils::url_scheme(proxy).empty()) {
            return std::unexpected(config_error(
                "PROXIES", "contains an invalid proxy URL '" +
                               utils::redact_url_credentials(proxy) + "'"));
        }
    }
    if (!config.browser_settings.is_null() && !config.browser_settings.is_object()) {
        return std::unexpected(config_error("BROWSER_SETTINGS", "must be an object"));
    }
    if (!config.fingerprint.is_null() && !config.fingerprint.is_object()) {
        return std::unexpected(config_error("FINGERPRINT", "must be an object"));
    }
    if (config.provision_timeout_seconds <= 0) {
        return std::unexpected(config_error("PROVISION_TIMEOUT", "must be positive"));
    }
    if (config.connect_timeout_seconds <= 0) {
        return std::unexpected(config_error("CONNECT_TIMEOUT", "must be positive"));
    }
    if (config.provision_attempts <= 0) {
        return std::unexpected(config_error("PROVISION_ATTEMPTS", "must be positive"));
    }
    if (config.provision_retry_delay_ms < 0) {
        return std::unexpected(config_error("PROVISION_RETRY_DELAY_MS", "must not be negative"));
    }
    if (config.heartbeat_interval_seconds < 0) {
        return std::unexpected(config_error("HEARTBEAT_INTERVAL", "must not be negative"));
    }
    if (config.shutdown_timeout_ms < 0) {
        return std::unexpected(config_error("SHUTDOWN_TIMEOUT_MS", "must not be negative"));
    }
    return {};
}

auto parse_pool_config(const json& j) -> Result<PoolConfig> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "CLOUD_BROWSER must be an object"));
    }

    PoolConfig c;
    const Result<void> steps[] = {
        read_string(j, "API_HOST", c.api_host),
        read_string(j, "API_TOKEN", c.api_token),
        read_int(j, "NUM_BROWSERS", c.num_browsers),
        read_int(j, "PAGES_PER_BROWSER", c.pages_per_browser),
        read_int(j, "START_SEMAPHORES", c.start_semaphores),
        read_object(j, "BROWSER_SETTINGS", c.browser_settings),
        read_object(j, "FINGERPRINT", c.fingerprint),
        read_int(j, "PROVISION_TIMEOUT", c.provision_timeout_seconds),
        read_int(j, "CONNECT_TIMEOUT", c.connect_timeout_seconds),
        read_int(j, "PROVISION_ATTEMPTS", c.provision_attempts),
        read_int(j, "PROVISION_RETRY_DELAY_MS", c.provision_retry_delay_ms),
        read_int(j, "HEARTBEAT_INTERVAL", c.heartbeat_interval_seconds),
        read_bool(j, "RECYCLE_ON_FETCH_ERROR", c.recycle_on_fetch_error),
        read_bool(j, "RECYCLE_ON_SERVER_ERROR", c.recycle_on_server_error),
        read_int(j, "SHUTDOWN_TIMEOUT_MS", c.shutdown_timeout_ms),
    };
    for (const auto& step : steps) {
        if (!step) return std::unexpected(step.error());
    }

    if (auto it = j.find("PROXIES"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::unexpected(config_error("PROXIES", "must be a list of strings"));
        }
        for (const auto& proxy : *it) {
            if (!proxy.is_string()) {
                return std::unexpected(config_error("PROXIES", "must be a list of strings"));
            }
            c.proxies.push_back(proxy.get<std::string>());
        }
    }

    if (auto it = j.find("PROXY_ORDERING"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::unexpected(config_error("PROXY_ORDERING", "must be a string"));
        }
        auto ordering = parse_proxy_ordering(it->get<std::string>());
        if (!ordering) return std::unexpected(ordering.error());
        c.proxy_ordering = *ordering;
    }

    auto valid = validate_config(c);
    if (!valid) return std::unexpected(valid.error());
    return c;
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Cannot open config file", path.string()));
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Failed to parse config", e.what()));
    }

    if (!j.is_object() || !j.contains(std::string(kNamespace))) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Config file has no CLOUD_BROWSER section",
                                          path.string()));
    }

    auto pool = parse_pool_config(j[std::string(kNamespace)]);
    if (!pool) return std::unexpected(pool.error());

    Config config;
    config.cloud_browser = std::move(*pool);
    if (j.contains("log_level") && j["log_level"].is_string()) {
        config.log_level = j["log_level"].get<std::string>();
    }
    LOG_DEBUG("Loaded configuration from {}", path.string());
    return config;
}

auto load_config_from_env() -> Result<Config> {
    json j = json::object();

    static constexpr std::string_view string_keys[] = {"API_HOST", "API_TOKEN", "PROXY_ORDERING"};
    for (auto key : string_keys) {
        if (auto val = env(key)) j[std::string(key)] = *val;
    }

    static constexpr std::string_view int_keys[] = {
        "NUM_BROWSERS", "PAGES_PER_BROWSER", "START_SEMAPHORES",
        "PROVISION_TIMEOUT", "CONNECT_TIMEOUT", "PROVISION_ATTEMPTS",
        "PROVISION_RETRY_DELAY_MS", "HEARTBEAT_INTERVAL", "SHUTDOWN_TIMEOUT_MS",
    };
    for (auto key : int_keys) {
        auto val = env(key);
        if (!val) continue;
        try {
            std::size_t consumed = 0;
            auto n = std::stoi(*val, &consumed);
            if (consumed != val->size()) throw std::invalid_argument(*val);
            j[std::string(key)] = n;
        } catch (const std::exception&) {
            return std::unexpected(config_error(key, "must be an integer, got '" + *val + "'"));
        }
    }

    static constexpr std::string_view bool_keys[] = {"RECYCLE_ON_FETCH_ERROR", "RECYCLE_ON_SERVER_ERROR"};
    for (auto key : bool_keys) {
        auto val = env(key);
        if (!val) continue;
        auto lowered = utils::to_lower(utils::trim(*val));
        j[std::string(key)] = (lowered == "1" || lowered == "true" || lowered == "yes");
    }

    if (auto val = env("PROXIES")) {
        json proxies = json::array();
        for (const auto& part : utils::split(*val, ',')) {
            auto proxy = utils::trim(part);
            if (!proxy.empty()) proxies.push_back(proxy);
        }
        j["PROXIES"] = std::move(proxies);
    }

    static constexpr std::string_view object_keys[] = {"BROWSER_SETTINGS", "FINGERPRINT"};
    for (auto key : object_keys) {
        auto val = env(key);
        if (!val) continue;
        try {
            j[std::string(key)] = json::parse(*val);
        } catch (const json::exception& e) {
            return std::unexpected(config_error(key, std::string("is not valid JSON: ") + e.what()));
        }
    }

    auto pool = parse_pool_config(j);
    if (!pool) return std::unexpected(pool.error());

    Config config;
    config.cloud_browser = std::move(*pool);
    if (auto level = env("LOG_LEVEL")) config.log_level = *level;
    return config;
}

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "API_TOKEN", "api_token", "token", "secret",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else if (it.key() == "PROXIES" && it->is_array()) {
                for (auto& proxy : *it) {
                    if (proxy.is_string()) {
                        proxy = utils::redact_url_credentials(proxy.get<std::string>());
                    }
                }
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

} // namespace cloudbrowser
