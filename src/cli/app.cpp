#include "chatvault/cli/app.hpp"
#include "chatvault/cli/commands.hpp"
#include "chatvault/core/logger.hpp"

#include <filesystem>
#include <iostream>

namespace chatvault::cli {

auto GlobalOptions::resolve() const -> Config {
    // Log setup comes first so config loading can report problems.
    Logger::init("chatvault", log_level.empty() ? "warn" : log_level);

    Config config = config_path.empty()
        ? default_config()
        : load_config(std::filesystem::path(config_path));
    apply_env_overrides(config);

    if (!log_level.empty()) {
        config.log_level = log_level;
    }
    if (!data_dir.empty()) {
        config.data_dir = data_dir;
        config.sessions.dir.reset();
    }

    Logger::set_level(config.log_level);
    return config;
}

App::App()
    : cli_("chatvault", "Durable conversation session store")
{
    cli_.set_version_flag("--version", CHATVAULT_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("CHATVAULT_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.add_option("-d,--data-dir", options_.data_dir,
                    "Data directory (sessions live in <data-dir>/sessions)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        // The selected subcommand's callback runs inside parse().
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kCommandFailed;
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_list_command(cli_, options_);
    register_show_command(cli_, options_);
    register_delete_command(cli_, options_);
    register_recover_command(cli_, options_);
    register_rebuild_index_command(cli_, options_);
    register_cleanup_command(cli_, options_);
    register_config_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace chatvault::cli
