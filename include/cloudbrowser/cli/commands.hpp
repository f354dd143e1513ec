#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "cloudbrowser/core/config.hpp"
#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser::cli {

/// Options shared by every subcommand.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
};

/// Load the configuration from --config, or from CLOUD_BROWSER_* environment
/// variables when no file is given. --log-level overrides the loaded level.
auto resolve_config(const GlobalOptions& options) -> Result<Config>;

/// Register the `fetch` subcommand.
/// Warms a pool, fetches the given URLs through it and shuts it down.
void register_fetch_command(CLI::App& app, std::shared_ptr<GlobalOptions> options);

/// Register the `config` subcommand.
/// Validates and prints the effective configuration with secrets redacted.
void register_config_command(CLI::App& app, std::shared_ptr<GlobalOptions> options);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace cloudbrowser::cli
