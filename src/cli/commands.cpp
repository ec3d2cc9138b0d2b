#include "chatvault/cli/commands.hpp"
#include "chatvault/core/logger.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatvault/context/manager.hpp"
#include "chatvault/core/utils.hpp"
#include "chatvault/sessions/index.hpp"
#include "chatvault/sessions/store.hpp"

namespace chatvault::cli {

using json = nlohmann::json;
using sessions::SessionIndex;
using sessions::SessionStore;

namespace {

/// Reports a failed command and unwinds out of CLI11's parse().
[[noreturn]] void fail(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    throw CLI::RuntimeError(kCommandFailed);
}

auto open_store(const Config& config) -> std::unique_ptr<SessionStore> {
    auto dir = sessions_dir(config);
    LOG_DEBUG("Using sessions directory: {}", dir.string());
    return std::make_unique<SessionStore>(dir);
}

void save_index(SessionIndex& index) {
    if (auto saved = index.save_if_dirty(); !saved) {
        LOG_WARN("Failed to save session index: {}", saved.error().what());
    }
}

auto preview(const std::string& text, size_t max_chars) -> std::string {
    auto line = text.substr(0, text.find('\n'));
    if (line.size() <= max_chars) return line;
    // Back off to a UTF-8 lead byte.
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return line.substr(0, cut) + "...";
}

void print_summary_row(const sessions::SessionSummary& s) {
    std::cout << std::left << std::setw(38) << s.id
              << std::setw(22) << utils::format_iso8601(s.updated_at).substr(0, 19)
              << std::right << std::setw(6) << s.message_count
              << std::setw(9) << s.total_tokens << "  "
              << (s.title.empty() ? "(untitled)" : s.title) << "\n";
}

} // namespace

// ---------------------------------------------------------------------------
// list command
// ---------------------------------------------------------------------------

namespace {
struct ListOptions {
    size_t limit = 20;
    size_t offset = 0;
    std::vector<std::string> tags;
    std::string search;
    std::string working_dir;
    std::string sort = "updated_at";
    bool ascending = false;
    bool as_json = false;
};
} // namespace

void register_list_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("list", "List saved sessions");
    auto opts = std::make_shared<ListOptions>();

    sub->add_option("-n,--limit", opts->limit, "Maximum sessions to show (0 = all)")
        ->default_val(20);
    sub->add_option("--offset", opts->offset, "Skip this many sessions");
    sub->add_option("-t,--tag", opts->tags, "Only sessions carrying this tag (repeatable)");
    sub->add_option("-s,--search", opts->search, "Case-insensitive title search");
    sub->add_option("-w,--working-dir,--dir", opts->working_dir, "Only sessions for this directory");
    sub->add_option("--sort", opts->sort, "Sort field")
        ->check(CLI::IsMember({"updated_at", "created_at", "title", "message_count",
                               "total_tokens"}));
    sub->add_flag("--asc", opts->ascending, "Sort ascending");
    sub->add_flag("--json", opts->as_json, "Print JSON");

    sub->callback([&options, opts]() {
        auto config = options.resolve();
        auto store = open_store(config);
        SessionIndex index(*store);

        sessions::ListQuery query;
        query.limit = opts->limit;
        query.offset = opts->offset;
        query.sort = sessions::parse_sort_field(opts->sort).value_or(
            sessions::SortField::UpdatedAt);
        query.descending = !opts->ascending;
        query.tags = opts->tags;
        if (!opts->search.empty()) query.search = opts->search;
        if (!opts->working_dir.empty()) query.working_dir = opts->working_dir;

        auto summaries = index.list(query);
        save_index(index);

        if (opts->as_json) {
            std::cout << json(summaries).dump(2) << "\n";
            return;
        }
        if (summaries.empty()) {
            std::cout << "No sessions found.\n";
            return;
        }
        std::cout << std::left << std::setw(38) << "ID" << std::setw(22) << "UPDATED"
                  << std::right << std::setw(6) << "MSGS" << std::setw(9) << "TOKENS"
                  << "  TITLE\n";
        for (const auto& s : summaries) {
            print_summary_row(s);
        }
        std::cout << summaries.size() << " of " << index.count() << " sessions\n";
    });
}

// ---------------------------------------------------------------------------
// show command
// ---------------------------------------------------------------------------

namespace {
struct ShowOptions {
    std::string id;
    std::string model;
    bool as_json = false;
};
} // namespace

void register_show_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("show", "Show a session and its context usage");
    auto opts = std::make_shared<ShowOptions>();

    sub->add_option("id", opts->id, "Session id")->required();
    sub->add_option("-m,--model", opts->model,
                    "Model to measure context against (default: the session's model)");
    sub->add_flag("--json", opts->as_json, "Print the stored session JSON");

    sub->callback([&options, opts]() {
        auto config = options.resolve();
        auto store = open_store(config);

        auto loaded = store->load(opts->id);
        if (!loaded) {
            if (loaded.error().code() == ErrorCode::Corrupted && store->exists(opts->id)) {
                fail(loaded.error().what() + " (try `chatvault recover " + opts->id + "`)");
            }
            fail(loaded.error().what());
        }
        const auto& session = *loaded;

        if (opts->as_json) {
            std::cout << json(session).dump(2) << "\n";
            return;
        }

        std::cout << "Session:  " << session.id() << "\n"
                  << "Title:    " << (session.title().empty() ? "(untitled)" : session.title())
                  << "\n"
                  << "Created:  " << utils::format_iso8601(session.created_at()) << "\n"
                  << "Updated:  " << utils::format_iso8601(session.updated_at()) << "\n";
        if (!session.working_dir().empty()) {
            std::cout << "Dir:      " << session.working_dir() << "\n";
        }
        if (!session.model().empty()) {
            std::cout << "Model:    " << session.model() << "\n";
        }
        if (!session.tags().empty()) {
            std::cout << "Tags:    ";
            for (const auto& tag : session.tags()) std::cout << " " << tag;
            std::cout << "\n";
        }
        std::cout << "Usage:    " << session.total_prompt_tokens() << " prompt, "
                  << session.total_completion_tokens() << " completion\n"
                  << "Tools:    " << session.tool_history().size() << " invocations\n\n";

        for (const auto& msg : session.messages()) {
            std::cout << "[" << utils::format_iso8601(msg.timestamp).substr(11, 8) << "] "
                      << role_to_string(msg.role) << ": " << preview(msg.content, 120);
            if (!msg.tool_calls.empty()) {
                std::cout << " [" << msg.tool_calls.size() << " tool call(s)]";
            }
            if (msg.pinned) std::cout << " (pinned)";
            std::cout << "\n";
        }

        auto model = opts->model.empty() ? session.model() : opts->model;
        if (model.empty()) return;

        context::ContextManager context(model, config.context);
        auto stats = context.stats(session.messages());
        std::cout << "\nContext (" << model << ", " << context.mode() << "): "
                  << stats["token_count"].get<int64_t>() << " / "
                  << stats["max_tokens"].get<int64_t>() << " tokens ("
                  << stats["utilization_percent"].get<double>() << "%)\n";
    });
}

// ---------------------------------------------------------------------------
// delete command
// ---------------------------------------------------------------------------

void register_delete_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("delete", "Delete a session");
    auto id = std::make_shared<std::string>();
    sub->add_option("id", *id, "Session id")->required();

    sub->callback([&options, id]() {
        auto config = options.resolve();
        auto store = open_store(config);
        SessionIndex index(*store);

        bool removed = store->remove(*id);
        bool unindexed = index.remove(*id);
        save_index(index);

        if (!removed && !unindexed) {
            fail("Session not found: " + *id);
        }
        std::cout << "Deleted session " << *id << "\n";
    });
}

// ---------------------------------------------------------------------------
// recover command
// ---------------------------------------------------------------------------

void register_recover_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("recover", "Restore a session from its backup");
    auto id = std::make_shared<std::string>();
    sub->add_option("id", *id, "Session id")->required();

    sub->callback([&options, id]() {
        auto config = options.resolve();
        auto store = open_store(config);

        if (!store->recover_from_backup(*id)) {
            fail("No usable backup for session " + *id);
        }

        auto loaded = store->load(*id);
        if (!loaded) {
            fail(loaded.error().what());
        }
        SessionIndex index(*store);
        index.update(*loaded);
        save_index(index);

        std::cout << "Recovered session " << *id << " (" << loaded->message_count()
                  << " messages)\n";
    });
}

// ---------------------------------------------------------------------------
// rebuild-index command
// ---------------------------------------------------------------------------

void register_rebuild_index_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("rebuild-index", "Rebuild the session index from disk");

    sub->callback([&options]() {
        auto config = options.resolve();
        auto store = open_store(config);
        SessionIndex index(*store);

        auto count = index.rebuild();
        if (auto saved = index.save(); !saved) {
            fail(saved.error().what());
        }
        std::cout << "Indexed " << count << " sessions\n";
    });
}

// ---------------------------------------------------------------------------
// cleanup command
// ---------------------------------------------------------------------------

namespace {
struct CleanupOptions {
    std::optional<int> days;
    std::optional<size_t> keep;
};
} // namespace

void register_cleanup_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("cleanup", "Delete old sessions");
    auto opts = std::make_shared<CleanupOptions>();

    sub->add_option("--days", opts->days,
                    "Delete sessions not updated for this many days (default: from config)")
        ->check(CLI::PositiveNumber);
    sub->add_option("--keep", opts->keep,
                    "Always keep this many most recent sessions (default: from config)");

    sub->callback([&options, opts]() {
        auto config = options.resolve();
        auto store = open_store(config);
        SessionIndex index(*store);

        auto days = opts->days.value_or(config.sessions.cleanup_max_age_days);
        auto keep = opts->keep.value_or(config.sessions.cleanup_keep_minimum);

        auto deleted = store->cleanup_older_than(std::chrono::hours(24) * days, keep);
        for (const auto& id : deleted) {
            index.remove(id);
        }
        save_index(index);

        std::cout << "Deleted " << deleted.size() << " sessions older than " << days
                  << " days\n";
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, const GlobalOptions& options) {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    sub->callback([&options]() {
        auto config = options.resolve();
        json j = config;
        j["resolved_sessions_dir"] = sessions_dir(config).string();
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "chatvault " << CHATVAULT_VERSION_STRING << "\n";
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
    });
}

} // namespace chatvault::cli
