#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chatvault/core/error.hpp"
#include "chatvault/sessions/session.hpp"

namespace chatvault::sessions {

/// One JSON file per session under a directory.
///
/// Layout: `<dir>/<id>.json`, the previous version at `<id>.json.backup`,
/// and in-flight writes at `<id>.json.tmp.<random>`. A save never truncates
/// the primary file: it writes and fsyncs a temp file and renames it into
/// place, so readers see either the old or the new complete file.
/// Safe to call from several threads.
class SessionStore {
public:
    /// Creates the directory (owner-only) if missing.
    /// @throws std::filesystem::filesystem_error if it cannot be created.
    explicit SessionStore(std::filesystem::path dir);
    virtual ~SessionStore() = default;

    SessionStore(const SessionStore&) = delete;
    auto operator=(const SessionStore&) -> SessionStore& = delete;

    auto save(const Session& session) -> VoidResult;

    /// NotFound if no file exists, Corrupted if it does not parse,
    /// StorageError if it cannot be read.
    auto load(std::string_view id) const -> Result<Session>;

    /// Like load() but logs failures and returns nullopt.
    auto load_or_null(std::string_view id) const -> std::optional<Session>;

    /// Deletes the session file and its backup. Returns false if absent.
    auto remove(std::string_view id) -> bool;

    [[nodiscard]] auto exists(std::string_view id) const -> bool;

    /// Ids of every session file, sorted.
    [[nodiscard]] auto list_ids() const -> std::vector<std::string>;

    /// Restores the backup over the primary file if the backup parses.
    auto recover_from_backup(std::string_view id) -> bool;

    /// Deletes sessions last updated before now - max_age, always keeping
    /// the `keep_minimum` most recently updated. Returns the deleted ids.
    auto cleanup_older_than(std::chrono::seconds max_age, size_t keep_minimum)
        -> std::vector<std::string>;

    [[nodiscard]] auto session_path(std::string_view id) const -> std::filesystem::path;
    [[nodiscard]] auto backup_path(std::string_view id) const -> std::filesystem::path;
    [[nodiscard]] auto dir() const -> const std::filesystem::path& { return dir_; }

    /// Filename-safe: non-empty, no path separators, no "..", no leading dot,
    /// and not the reserved name "index".
    [[nodiscard]] static auto is_valid_id(std::string_view id) -> bool;

protected:
    /// Final step of a save: atomically replaces `target` with `tmp`.
    virtual auto rename_into_place(const std::filesystem::path& tmp,
                                   const std::filesystem::path& target) -> VoidResult;

private:
    auto read_file(const std::filesystem::path& path) const -> Result<Session>;
    auto write_temp(const std::filesystem::path& tmp, const std::string& data) -> VoidResult;
    void backup_existing(std::string_view id);

    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

} // namespace chatvault::sessions
