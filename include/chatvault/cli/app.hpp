#pragma once

#include <filesystem>
#include <string>

#include <CLI/CLI.hpp>

#include "chatvault/core/config.hpp"

// Injected by CMake via -DCHATVAULT_VERSION_STRING=...
#ifndef CHATVAULT_VERSION_STRING
#define CHATVAULT_VERSION_STRING "0.1.0-dev"
#endif

namespace chatvault::cli {

/// Global options shared by every subcommand.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
    std::string data_dir;

    /// Loads the config file (if any), applies CHATVAULT_* overrides and the
    /// command-line overrides, and initializes the logger.
    [[nodiscard]] auto resolve() const -> Config;
};

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the session
/// maintenance subcommands (list, show, delete, recover, rebuild-index,
/// cleanup, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto options() const -> const GlobalOptions&;

private:
    void setup_commands();

    CLI::App cli_;
    GlobalOptions options_;
};

} // namespace chatvault::cli
