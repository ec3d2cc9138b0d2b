#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatvault/core/error.hpp"
#include "chatvault/sessions/session.hpp"
#include "chatvault/sessions/store.hpp"

namespace chatvault::sessions {

/// Version of the index file layout. Any other version triggers a rebuild.
inline constexpr int kIndexFormatVersion = 1;

enum class SortField {
    UpdatedAt,
    CreatedAt,
    Title,
    MessageCount,
    TotalTokens,
};

NLOHMANN_JSON_SERIALIZE_ENUM(SortField, {
    {SortField::UpdatedAt, "updated_at"},
    {SortField::CreatedAt, "created_at"},
    {SortField::Title, "title"},
    {SortField::MessageCount, "message_count"},
    {SortField::TotalTokens, "total_tokens"},
})

[[nodiscard]] auto parse_sort_field(std::string_view s) -> std::optional<SortField>;

/// Filters, order and page for SessionIndex::list().
struct ListQuery {
    size_t limit = 0;   // 0 = unlimited
    size_t offset = 0;
    SortField sort = SortField::UpdatedAt;
    bool descending = true;
    std::vector<std::string> tags;           // every tag must be present
    std::optional<std::string> search;       // case-insensitive title substring
    std::optional<std::string> working_dir;  // exact match
};

/// Summary table over every session in a store, kept in `<dir>/index.json`.
///
/// The store stays the source of truth: a missing, unreadable or
/// version-mismatched index file is rebuilt from the session files.
/// Mutations mark the index dirty; save_if_dirty() persists it.
/// Thread-safe.
class SessionIndex {
public:
    explicit SessionIndex(SessionStore& store);

    /// Inserts or refreshes the summary for `session`.
    void add(const Session& session);
    void update(const Session& session);
    auto remove(std::string_view id) -> bool;

    [[nodiscard]] auto get(std::string_view id) const -> std::optional<SessionSummary>;
    [[nodiscard]] auto list(const ListQuery& query = {}) const -> std::vector<SessionSummary>;
    [[nodiscard]] auto count() const -> size_t;

    /// Re-derives every summary from the store. Returns the session count.
    auto rebuild() -> size_t;

    auto save_if_dirty() -> VoidResult;
    auto save() -> VoidResult;

    [[nodiscard]] auto is_dirty() const -> bool;
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    /// Returns false if the file is missing or unusable.
    auto load() -> bool;
    auto rebuild_locked() -> size_t;
    auto save_locked() -> VoidResult;

    SessionStore& store_;
    std::filesystem::path path_;
    std::map<std::string, SessionSummary, std::less<>> entries_;
    bool dirty_ = false;
    mutable std::mutex mutex_;
};

} // namespace chatvault::sessions
