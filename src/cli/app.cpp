#include "cloudbrowser/cli/app.hpp"
#include "cloudbrowser/core/logger.hpp"

// Version string; typically injected by CMake via -DCLOUDBROWSER_VERSION_STRING=...
#ifndef CLOUDBROWSER_VERSION_STRING
#define CLOUDBROWSER_VERSION_STRING "0.1.0-dev"
#endif

namespace cloudbrowser::cli {

App::App()
    : cli_("cloudbrowser", "Pooled remote browser sessions for page fetching")
    , options_(std::make_shared<GlobalOptions>())
{
    cli_.set_version_flag("--version", CLOUDBROWSER_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_->config_path,
                    "Path to configuration file (JSON)")
        ->envname("CLOUD_BROWSER_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", options_->log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error",
                               "critical", "off"}));

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Subcommands report failures as CLI::RuntimeError with an exit code.
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return *options_;
}

void App::setup_commands() {
    register_fetch_command(cli_, options_);
    register_config_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace cloudbrowser::cli
