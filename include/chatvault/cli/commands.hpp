#pragma once

#include <CLI/CLI.hpp>

#include "chatvault/cli/app.hpp"

namespace chatvault::cli {

/// Exit code for a command that ran but could not do what was asked.
inline constexpr int kCommandFailed = 1;

/// `list`: prints session summaries from the index.
void register_list_command(CLI::App& app, const GlobalOptions& options);

/// `show <id>`: prints one session and its context usage for a model.
void register_show_command(CLI::App& app, const GlobalOptions& options);

/// `delete <id>`: removes a session file, its backup and its index entry.
void register_delete_command(CLI::App& app, const GlobalOptions& options);

/// `recover <id>`: restores a session from its backup file.
void register_recover_command(CLI::App& app, const GlobalOptions& options);

/// `rebuild-index`: re-derives index.json from the session files.
void register_rebuild_index_command(CLI::App& app, const GlobalOptions& options);

/// `cleanup`: deletes sessions older than a cutoff, keeping the newest few.
void register_cleanup_command(CLI::App& app, const GlobalOptions& options);

/// `config`: prints the effective configuration.
void register_config_command(CLI::App& app, const GlobalOptions& options);

/// `version`: prints the build version.
void register_version_command(CLI::App& app);

} // namespace chatvault::cli
