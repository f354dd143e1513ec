#include "cloudbrowser/cli/commands.hpp"
#include "cloudbrowser/browser/cloud_api.hpp"
#include "cloudbrowser/core/logger.hpp"
#include "cloudbrowser/core/utils.hpp"
#include "cloudbrowser/dispatch/request_dispatch_extension.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <vector>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <nlohmann/json.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef CLOUDBROWSER_VERSION_STRING
#define CLOUDBROWSER_VERSION_STRING "0.1.0-dev"
#endif

namespace cloudbrowser::cli {

using json = nlohmann::json;
using boost::asio::awaitable;

namespace {

/// Exit codes reported through CLI::RuntimeError.
constexpr int kExitFetchFailed = 1;
constexpr int kExitConfigError = 2;

struct FetchOptions {
    std::vector<std::string> urls;
    std::string method = "GET";
    std::vector<std::string> headers;
    std::string data;
    int timeout_ms = 30000;
    int acquire_timeout_ms = 0;
    bool print_body = false;
};

auto parse_headers(const std::vector<std::string>& raw) -> Result<std::map<std::string, std::string>> {
    std::map<std::string, std::string> headers;
    for (const auto& line : raw) {
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Header must be 'Name: value'", line));
        }
        headers[utils::trim(line.substr(0, colon))] = utils::trim(line.substr(colon + 1));
    }
    return headers;
}

auto load_or_exit(const GlobalOptions& options) -> Config {
    auto config = resolve_config(options);
    if (!config) {
        std::cerr << "Configuration error: " << config.error().what() << "\n";
        throw CLI::RuntimeError(kExitConfigError);
    }
    return std::move(*config);
}

auto fetch_one(dispatch::RequestDispatchExtension& ext, browser::PageRequest req,
               std::optional<std::chrono::milliseconds> acquire_timeout,
               bool print_body) -> awaitable<bool> {
    auto url = req.url;
    auto result = co_await ext.fetch(std::move(req), acquire_timeout);
    if (!result) {
        const auto& err = result.error();
        std::cout << error_code_to_string(err.code()) << " " << url << " "
                  << err.what()
                  << (dispatch::is_retryable(err) ? " (retryable)" : "") << "\n";
        co_return false;
    }

    std::cout << result->status << " " << url << " (" << result->body.size()
              << " bytes)\n";
    if (print_body) {
        std::cout << result->body << "\n";
    }
    co_return true;
}

auto run_fetch(dispatch::RequestDispatchExtension& ext, const FetchOptions& opts,
               std::map<std::string, std::string> headers,
               boost::asio::signal_set& signals, int& failures) -> awaitable<void> {
    auto executor = co_await boost::asio::this_coro::executor;

    auto report = co_await ext.on_start();
    if (report.ready == 0) {
        LOG_ERROR("No browser session could be started");
        failures = static_cast<int>(opts.urls.size());
        co_await ext.on_stop();
        signals.cancel();
        co_return;
    }

    std::optional<std::chrono::milliseconds> acquire_timeout;
    if (opts.acquire_timeout_ms > 0) {
        acquire_timeout = std::chrono::milliseconds(opts.acquire_timeout_ms);
    }

    // Fan out all URLs; the pool bounds how many run at once.
    boost::asio::steady_timer done(executor, boost::asio::steady_timer::time_point::max());
    std::size_t remaining = opts.urls.size();
    for (const auto& url : opts.urls) {
        browser::PageRequest req;
        req.url = url;
        req.method = opts.method;
        req.headers = headers;
        req.body = opts.data;
        req.timeout = std::chrono::milliseconds(opts.timeout_ms);

        boost::asio::co_spawn(
            executor, fetch_one(ext, std::move(req), acquire_timeout, opts.print_body),
            [&remaining, &failures, &done](std::exception_ptr ep, bool ok) {
                if (ep || !ok) ++failures;
                if (--remaining == 0) done.cancel();
            });
    }
    while (remaining > 0) {
        co_await done.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
    }

    co_await ext.on_stop();
    signals.cancel();
}

} // anonymous namespace

auto resolve_config(const GlobalOptions& options) -> Result<Config> {
    auto config = options.config_path.empty()
        ? load_config_from_env()
        : load_config(std::filesystem::path(options.config_path));
    if (!config) return config;

    if (!options.log_level.empty()) {
        config->log_level = options.log_level;
    }
    return config;
}

// ---------------------------------------------------------------------------
// fetch command
// ---------------------------------------------------------------------------

void register_fetch_command(CLI::App& app, std::shared_ptr<GlobalOptions> options) {
    auto* sub = app.add_subcommand("fetch", "Fetch pages through a pool of cloud browsers");
    auto opts = std::make_shared<FetchOptions>();

    sub->add_option("urls", opts->urls, "URLs to fetch")->required();
    sub->add_option("-X,--method", opts->method, "HTTP method")
        ->default_val("GET");
    sub->add_option("-H,--header", opts->headers, "Request header 'Name: value'");
    sub->add_option("-d,--data", opts->data, "Request body");
    sub->add_option("--timeout-ms", opts->timeout_ms, "Per-page timeout")
        ->default_val(30000)
        ->check(CLI::PositiveNumber);
    sub->add_option("--acquire-timeout-ms", opts->acquire_timeout_ms,
                    "Maximum wait for a free browser (0 waits indefinitely)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);
    sub->add_flag("--print-body", opts->print_body, "Print response bodies");

    sub->callback([options, opts]() {
        auto config = load_or_exit(*options);
        Logger::init("cloudbrowser", config.log_level);

        auto headers = parse_headers(opts->headers);
        if (!headers) {
            std::cerr << headers.error().what() << "\n";
            throw CLI::RuntimeError(kExitConfigError);
        }

        boost::asio::io_context ioc;
        auto api = std::make_shared<browser::CloudBrowserApi>(ioc, config.cloud_browser);
        auto ext = dispatch::RequestDispatchExtension::create(ioc, config.cloud_browser, api);
        if (!ext) {
            std::cerr << "Configuration error: " << ext.error().what() << "\n";
            throw CLI::RuntimeError(kExitConfigError);
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, &ext](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal");
                boost::asio::co_spawn(ioc, (*ext)->on_stop(), boost::asio::detached);
            }
        });

        int failures = 0;
        boost::asio::co_spawn(ioc, run_fetch(**ext, *opts, std::move(*headers), signals, failures),
                              [](std::exception_ptr ep) {
                                  if (ep) std::rethrow_exception(ep);
                              });

        LOG_INFO("Fetching {} URLs with {} browsers", opts->urls.size(),
                 config.cloud_browser.num_browsers);
        ioc.run();

        if (failures > 0) {
            LOG_WARN("{} of {} fetches failed", failures, opts->urls.size());
            throw CLI::RuntimeError(kExitFetchFailed);
        }
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, std::shared_ptr<GlobalOptions> options) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([options, validate_only]() {
        auto config = load_or_exit(*options);

        if (*validate_only) {
            // If we got here the config parsed and validated.
            std::cout << "Configuration is valid.\n";
            return;
        }

        // Pretty-print the configuration as JSON (with secrets redacted).
        json j = config;
        redact_config_json(j);
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "cloudbrowser " << CLOUDBROWSER_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__APPLE__)
        std::cout << "Platform: macOS\n";
#elif defined(__linux__)
        std::cout << "Platform: Linux\n";
#else
        std::cout << "Platform: other\n";
#endif
    });
}

} // namespace cloudbrowser::cli
