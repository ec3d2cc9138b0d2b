#include "chatvault/sessions/store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::sessions {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSessionExt = ".json";
constexpr std::string_view kBackupSuffix = ".backup";
constexpr std::string_view kTempInfix = ".tmp.";
constexpr std::string_view kIndexStem = "index";  // index.json shares the directory

constexpr auto kOwnerReadWrite = fs::perms::owner_read | fs::perms::owner_write;

auto errno_message() -> std::string {
    return std::strerror(errno);
}

auto invalid_id(std::string_view id) -> Error {
    return make_error(ErrorCode::InvalidArgument, "Invalid session id", std::string(id));
}

} // namespace

SessionStore::SessionStore(fs::path dir) : dir_(std::move(dir)) {
    if (!fs::exists(dir_)) {
        fs::create_directories(dir_);
        fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace);
    }
    LOG_DEBUG("Session store at {}", dir_.string());
}

auto SessionStore::is_valid_id(std::string_view id) -> bool {
    if (id.empty() || id.front() == '.' || id == kIndexStem) return false;
    if (id.find_first_of("/\\") != std::string_view::npos) return false;
    if (id.find("..") != std::string_view::npos) return false;
    return id.find('\0') == std::string_view::npos;
}

auto SessionStore::session_path(std::string_view id) const -> fs::path {
    return dir_ / (std::string(id) + std::string(kSessionExt));
}

auto SessionStore::backup_path(std::string_view id) const -> fs::path {
    return dir_ / (std::string(id) + std::string(kSessionExt) + std::string(kBackupSuffix));
}

// -- save --------------------------------------------------------------------

void SessionStore::backup_existing(std::string_view id) {
    auto target = session_path(id);
    std::error_code ec;
    if (!fs::exists(target, ec)) return;

    auto backup = backup_path(id);
    fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_WARN("Failed to back up session {}: {}", id, ec.message());
        return;
    }
    fs::permissions(backup, kOwnerReadWrite, fs::perm_options::replace, ec);
}

auto SessionStore::write_temp(const fs::path& tmp, const std::string& data) -> VoidResult {
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Failed to create temp file", tmp.string() + ": " + errno_message()));
    }

    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = errno_message();
            ::close(fd);
            return std::unexpected(make_error(ErrorCode::StorageError,
                "Failed to write temp file", tmp.string() + ": " + err));
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        auto err = errno_message();
        ::close(fd);
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Failed to sync temp file", tmp.string() + ": " + err));
    }
    if (::close(fd) != 0) {
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Failed to close temp file", tmp.string() + ": " + errno_message()));
    }
    return {};
}

auto SessionStore::rename_into_place(const fs::path& tmp, const fs::path& target)
    -> VoidResult {
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Failed to rename session file into place", ec.message()));
    }

    // Persist the directory entry as well.
    int dir_fd = ::open(dir_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        if (::fsync(dir_fd) != 0) {
            LOG_DEBUG("fsync of {} failed: {}", dir_.string(), errno_message());
        }
        ::close(dir_fd);
    }
    return {};
}

auto SessionStore::save(const Session& session) -> VoidResult {
    if (!is_valid_id(session.id())) {
        return std::unexpected(invalid_id(session.id()));
    }

    std::string data;
    try {
        json j = session;
        data = j.dump(2);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
            "Failed to serialize session", e.what()));
    }

    std::lock_guard lock(mutex_);

    backup_existing(session.id());

    auto target = session_path(session.id());
    auto tmp = fs::path(target.string() + std::string(kTempInfix) + utils::generate_id(8));

    auto result = write_temp(tmp, data);
    if (result) {
        result = rename_into_place(tmp, target);
    }
    if (!result) {
        std::error_code ec;
        fs::remove(tmp, ec);
        LOG_ERROR("Failed to save session {}: {}", session.id(), result.error().what());
        return result;
    }

    std::error_code ec;
    fs::permissions(target, kOwnerReadWrite, fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Failed to restrict permissions on {}: {}", target.string(), ec.message());
    }

    LOG_DEBUG("Saved session {} ({} messages)", session.id(), session.message_count());
    return {};
}

// -- load --------------------------------------------------------------------

auto SessionStore::read_file(const fs::path& path) const -> Result<Session> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Session file not found", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Cannot open session file", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::StorageError,
            "Cannot read session file", path.string()));
    }

    try {
        auto j = json::parse(buffer.str());
        return j.get<Session>();
    } catch (const std::exception& e) {
        // Covers malformed JSON, schema mismatches and bad timestamps.
        return std::unexpected(make_error(ErrorCode::Corrupted,
            "Session file is corrupted", path.string() + ": " + e.what()));
    }
}

auto SessionStore::load(std::string_view id) const -> Result<Session> {
    if (!is_valid_id(id)) {
        return std::unexpected(invalid_id(id));
    }

    auto session = read_file(session_path(id));
    if (!session) {
        return session;
    }
    if (session->id() != id) {
        return std::unexpected(make_error(ErrorCode::Corrupted,
            "Session file id does not match its name",
            std::string(id) + " != " + session->id()));
    }
    return session;
}

auto SessionStore::load_or_null(std::string_view id) const -> std::optional<Session> {
    auto session = load(id);
    if (!session) {
        if (session.error().code() != ErrorCode::NotFound) {
            LOG_WARN("Failed to load session {}: {}", id, session.error().what());
        }
        return std::nullopt;
    }
    return std::move(*session);
}

// -- housekeeping ------------------------------------------------------------

auto SessionStore::remove(std::string_view id) -> bool {
    if (!is_valid_id(id)) return false;

    std::lock_guard lock(mutex_);
    std::error_code ec;
    bool removed = fs::remove(session_path(id), ec);
    if (ec) {
        LOG_WARN("Failed to delete session {}: {}", id, ec.message());
        return false;
    }
    fs::remove(backup_path(id), ec);
    if (removed) {
        LOG_INFO("Deleted session {}", id);
    }
    return removed;
}

auto SessionStore::exists(std::string_view id) const -> bool {
    if (!is_valid_id(id)) return false;
    std::error_code ec;
    return fs::is_regular_file(session_path(id), ec);
}

auto SessionStore::list_ids() const -> std::vector<std::string> {
    std::vector<std::string> ids;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        auto name = entry.path().filename().string();
        // Only "<id>.json": backups and temp files carry a further suffix.
        if (!name.ends_with(kSessionExt)) continue;
        auto id = name.substr(0, name.size() - kSessionExt.size());
        if (!is_valid_id(id)) continue;
        ids.push_back(std::move(id));
    }
    if (ec) {
        LOG_WARN("Failed to list sessions in {}: {}", dir_.string(), ec.message());
    }

    std::ranges::sort(ids);
    return ids;
}

auto SessionStore::recover_from_backup(std::string_view id) -> bool {
    if (!is_valid_id(id)) return false;

    auto backup = read_file(backup_path(id));
    if (!backup) {
        LOG_WARN("No usable backup for session {}: {}", id, backup.error().what());
        return false;
    }

    std::ifstream in(backup_path(id), std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();

    std::lock_guard lock(mutex_);
    auto target = session_path(id);
    auto tmp = fs::path(target.string() + std::string(kTempInfix) + utils::generate_id(8));
    auto result = write_temp(tmp, buffer.str());
    if (result) {
        result = rename_into_place(tmp, target);
    }
    if (!result) {
        std::error_code ec;
        fs::remove(tmp, ec);
        LOG_ERROR("Failed to restore session {} from backup: {}", id, result.error().what());
        return false;
    }

    LOG_INFO("Recovered session {} from backup", id);
    return true;
}

auto SessionStore::cleanup_older_than(std::chrono::seconds max_age, size_t keep_minimum)
    -> std::vector<std::string> {
    std::vector<std::pair<std::string, Timestamp>> sessions;
    for (const auto& id : list_ids()) {
        auto session = read_file(session_path(id));
        if (!session) {
            LOG_DEBUG("Cleanup skipping unreadable session {}", id);
            continue;
        }
        sessions.emplace_back(id, session->updated_at());
    }

    std::ranges::sort(sessions, [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    auto cutoff = utils::now() - max_age;
    std::vector<std::string> deleted;
    for (size_t i = keep_minimum; i < sessions.size(); ++i) {
        const auto& [id, updated_at] = sessions[i];
        if (updated_at < cutoff && remove(id)) {
            deleted.push_back(id);
        }
    }

    if (!deleted.empty()) {
        LOG_INFO("Cleaned up {} sessions older than {} days", deleted.size(),
                 max_age.count() / 86400);
    }
    return deleted;
}

} // namespace chatvault::sessions
