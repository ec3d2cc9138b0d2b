#include "chatvault/sessions/index.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::sessions {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kIndexFileName = "index.json";

auto matches(const SessionSummary& s, const ListQuery& q) -> bool {
    for (const auto& tag : q.tags) {
        if (!s.tags.contains(tag)) return false;
    }
    if (q.search && !utils::contains_icase(s.title, *q.search)) {
        return false;
    }
    if (q.working_dir && s.working_dir != *q.working_dir) {
        return false;
    }
    return true;
}

/// Three-way comparison on the sort key alone.
auto compare_by(SortField field, const SessionSummary& a, const SessionSummary& b) -> int {
    auto three_way = [](const auto& x, const auto& y) { return x < y ? -1 : (y < x ? 1 : 0); };
    switch (field) {
        case SortField::UpdatedAt: return three_way(a.updated_at, b.updated_at);
        case SortField::CreatedAt: return three_way(a.created_at, b.created_at);
        case SortField::Title: return three_way(utils::to_lower(a.title), utils::to_lower(b.title));
        case SortField::MessageCount: return three_way(a.message_count, b.message_count);
        case SortField::TotalTokens: return three_way(a.total_tokens, b.total_tokens);
    }
    return 0;
}

} // namespace

auto parse_sort_field(std::string_view s) -> std::optional<SortField> {
    if (s == "updated_at" || s == "updated") return SortField::UpdatedAt;
    if (s == "created_at" || s == "created") return SortField::CreatedAt;
    if (s == "title") return SortField::Title;
    if (s == "message_count" || s == "messages") return SortField::MessageCount;
    if (s == "total_tokens" || s == "tokens") return SortField::TotalTokens;
    return std::nullopt;
}

SessionIndex::SessionIndex(SessionStore& store)
    : store_(store), path_(store.dir() / std::string(kIndexFileName)) {
    std::lock_guard lock(mutex_);
    if (load()) {
        LOG_DEBUG("Loaded session index with {} entries", entries_.size());
        return;
    }

    auto n = rebuild_locked();
    LOG_INFO("Rebuilt session index from {} session files", n);
    if (auto result = save_locked(); !result) {
        LOG_WARN("Failed to persist rebuilt index: {}", result.error().what());
    }
}

auto SessionIndex::load() -> bool {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        LOG_INFO("Session index not found at {}", path_.string());
        return false;
    }

    try {
        std::ifstream in(path_);
        auto j = json::parse(in);

        auto version = j.value("version", 0);
        if (version != kIndexFormatVersion) {
            LOG_WARN("Session index version {} != {}, rebuilding", version, kIndexFormatVersion);
            return false;
        }

        std::map<std::string, SessionSummary, std::less<>> loaded;
        for (const auto& [id, entry] : j.at("sessions").items()) {
            auto summary = entry.get<SessionSummary>();
            summary.id = id;
            loaded.emplace(id, std::move(summary));
        }
        entries_ = std::move(loaded);
        dirty_ = false;
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Session index unreadable, rebuilding: {}", e.what());
        return false;
    }
}

auto SessionIndex::rebuild_locked() -> size_t {
    entries_.clear();
    for (const auto& id : store_.list_ids()) {
        auto session = store_.load(id);
        if (!session) {
            LOG_WARN("Index rebuild skipping session {}: {}", id, session.error().what());
            continue;
        }
        entries_.emplace(id, SessionSummary::from(*session));
    }
    dirty_ = true;
    return entries_.size();
}

auto SessionIndex::rebuild() -> size_t {
    std::lock_guard lock(mutex_);
    auto n = rebuild_locked();
    LOG_INFO("Rebuilt session index: {} sessions", n);
    return n;
}

void SessionIndex::add(const Session& session) {
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(session.id(), SessionSummary::from(session));
    dirty_ = true;
}

void SessionIndex::update(const Session& session) {
    add(session);
}

auto SessionIndex::remove(std::string_view id) -> bool {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    dirty_ = true;
    return true;
}

auto SessionIndex::get(std::string_view id) const -> std::optional<SessionSummary> {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(id); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto SessionIndex::list(const ListQuery& query) const -> std::vector<SessionSummary> {
    std::vector<SessionSummary> results;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, summary] : entries_) {
            if (matches(summary, query)) results.push_back(summary);
        }
    }

    std::ranges::sort(results, [&](const SessionSummary& a, const SessionSummary& b) {
        auto c = compare_by(query.sort, a, b);
        if (c != 0) return query.descending ? c > 0 : c < 0;
        return a.id < b.id;
    });

    if (query.offset >= results.size()) {
        return {};
    }
    auto first = results.begin() + static_cast<std::ptrdiff_t>(query.offset);
    auto remaining = results.size() - query.offset;
    auto take = query.limit == 0 ? remaining : std::min(query.limit, remaining);
    return std::vector<SessionSummary>(first, first + static_cast<std::ptrdiff_t>(take));
}

auto SessionIndex::count() const -> size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

auto SessionIndex::is_dirty() const -> bool {
    std::lock_guard lock(mutex_);
    return dirty_;
}

auto SessionIndex::save_locked() -> VoidResult {
    json sessions = json::object();
    for (const auto& [id, summary] : entries_) {
        sessions[id] = summary;
    }
    json j = {
        {"version", kIndexFormatVersion},
        {"sessions", std::move(sessions)},
    };

    auto tmp_path = fs::path(path_.string() + ".tmp." + utils::generate_id(8));
    try {
        std::ofstream out(tmp_path);
        if (!out.is_open()) {
            return std::unexpected(make_error(ErrorCode::StorageError,
                "Failed to open temp file for index", tmp_path.string()));
        }
        out << j.dump(2);
        out.close();
        if (out.fail()) {
            throw std::runtime_error("write failed");
        }

        fs::rename(tmp_path, path_);
        fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Failed to write session index", e.what()));
    }

    dirty_ = false;
    LOG_DEBUG("Saved session index ({} entries)", entries_.size());
    return {};
}

auto SessionIndex::save() -> VoidResult {
    std::lock_guard lock(mutex_);
    return save_locked();
}

auto SessionIndex::save_if_dirty() -> VoidResult {
    std::lock_guard lock(mutex_);
    if (!dirty_) return {};
    return save_locked();
}

} // namespace chatvault::sessions
