#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "chatvault/context/compaction.hpp"
#include "chatvault/context/tokens.hpp"
#include "chatvault/core/config.hpp"
#include "chatvault/core/error.hpp"
#include "chatvault/providers/provider.hpp"
#include "chatvault/sessions/checkpoint.hpp"
#include "chatvault/sessions/hooks.hpp"
#include "chatvault/sessions/index.hpp"
#include "chatvault/sessions/session.hpp"
#include "chatvault/sessions/store.hpp"

namespace chatvault::sessions {

using boost::asio::awaitable;

/// Thrown when an operation that needs a current session is called without
/// one. This is a caller bug, not a runtime condition.
class NoActiveSessionError : public std::logic_error {
public:
    explicit NoActiveSessionError(std::string_view operation);
};

struct ManagerConfig {
    std::chrono::milliseconds checkpoint_interval{60000};
    size_t title_max_length = 50;
    int64_t max_tool_result_tokens = 1000;
    std::chrono::milliseconds title_timeout{15000};

    [[nodiscard]] static auto from(const Config& config) -> ManagerConfig;
};

/// Owns the current session and keeps it durable.
///
/// At most one session is current. While one is, a background checkpoint
/// saves it every `checkpoint_interval`; switching, closing or deleting the
/// session stops that checkpoint before returning. All mutators throw
/// NoActiveSessionError when no session is current.
class SessionManager {
public:
    SessionManager(SessionStore& store, SessionIndex& index, ManagerConfig config = {},
                   std::shared_ptr<const context::TokenEstimator> estimator = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    auto operator=(const SessionManager&) -> SessionManager& = delete;

    // -- Lifecycle --

    /// Creates, persists and indexes a new session and makes it current.
    /// Any previously current session is closed first.
    auto create(std::string title = {}, std::string working_dir = {}, std::string model = {},
                std::vector<std::string> tags = {}) -> Result<Session>;

    /// Loads a session and makes it current. A corrupted file is restored
    /// from its backup when one exists.
    auto resume(std::string_view id) -> Result<Session>;

    /// Resumes the most recently updated session, if any.
    auto resume_latest() -> std::optional<Session>;

    /// Resumes `id` when given and present, otherwise creates a session.
    auto resume_or_create(std::optional<std::string> id, std::string title = {},
                          std::string working_dir = {}, std::string model = {},
                          std::vector<std::string> tags = {}) -> Result<Session>;

    /// Saves the current session and refreshes its index entry.
    auto save() -> VoidResult;

    /// Saves a detached session object and refreshes its index entry.
    auto save(const Session& session) -> VoidResult;

    /// Final save, end hook, checkpoint stopped, current cleared.
    /// No-op without a current session.
    auto close() -> VoidResult;

    /// Closes `id` if it is the current session; SessionError otherwise.
    auto close(std::string_view id) -> VoidResult;

    /// Deletes a session from disk and the index. Stops checkpointing first
    /// if it is the current session.
    auto remove(std::string_view id) -> bool;

    // -- Mutators (current session) --

    auto add_message(Role role, std::string content, std::vector<ToolCall> tool_calls = {},
                     std::optional<std::string> tool_call_id = std::nullopt,
                     std::optional<std::string> name = std::nullopt,
                     bool pinned = false) -> Message;

    auto record_tool_call(std::string tool_name, nlohmann::json arguments,
                          nlohmann::json result, std::chrono::milliseconds duration,
                          bool success = true,
                          std::optional<std::string> error = std::nullopt) -> ToolInvocation;

    void update_usage(int64_t prompt_tokens, int64_t completion_tokens);
    void reset_usage();
    void set_title(std::string title);
    auto add_tag(const std::string& tag) -> bool;
    auto remove_tag(const std::string& tag) -> bool;
    void set_metadata(const std::string& key, nlohmann::json value);

    /// Applies a compaction result to the current session.
    void replace_messages(std::vector<Message> messages);

    // -- Titles --

    /// First line of the first user message, truncated with "...", or
    /// "Session YYYY-MM-DD HH:MM" when there is none.
    [[nodiscard]] auto generate_title(const Session& session) const -> std::string;

    /// Asks the model for a title for the current session, falling back to
    /// generate_title() on any failure.
    auto suggest_title(std::shared_ptr<providers::Provider> provider) -> awaitable<std::string>;

    // -- Queries --

    /// Snapshot of the current session.
    [[nodiscard]] auto current() const -> std::optional<Session>;
    [[nodiscard]] auto has_current() const -> bool;
    [[nodiscard]] auto current_id() const -> std::optional<std::string>;

    [[nodiscard]] auto list(const ListQuery& query = {}) const -> std::vector<SessionSummary>;

    /// Saves the current session now, as the background checkpoint does.
    /// Does not fire hooks. No-op without a current session or when the
    /// session is unchanged since it was last written.
    auto checkpoint_now() -> VoidResult;

    [[nodiscard]] auto hooks() noexcept -> HookRegistry& { return hooks_; }
    [[nodiscard]] auto store() noexcept -> SessionStore& { return store_; }
    [[nodiscard]] auto index() noexcept -> SessionIndex& { return index_; }
    [[nodiscard]] auto is_checkpointing() const -> bool;

private:
    template <typename F>
    auto with_current(std::string_view operation, F&& fn);

    /// Makes `session` current and starts its checkpoint.
    void activate(Session session);
    void start_checkpointing();
    void stop_checkpointing();
    auto persist(const Session& session) -> VoidResult;

    SessionStore& store_;
    SessionIndex& index_;
    ManagerConfig config_;
    std::shared_ptr<const context::TokenEstimator> estimator_;
    context::ToolResultCompactor tool_compactor_;
    HookRegistry hooks_;

    mutable std::mutex mutex_;      // guards current_
    std::mutex save_mutex_;         // orders snapshot + write pairs
    std::optional<Session> last_persisted_;  // guarded by save_mutex_
    std::optional<Session> current_;
    mutable std::mutex checkpoint_mutex_;  // guards checkpoint_
    std::unique_ptr<CheckpointTimer> checkpoint_;
};

} // namespace chatvault::sessions
