#include "chatvault/sessions/manager.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <variant>

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::sessions {

namespace {

constexpr size_t kTitleContextMessages = 6;

constexpr std::string_view kTitleInstruction =
    "Write a short, specific title for this conversation. "
    "Reply with the title only, without quotes or punctuation at the end.";

/// Cuts `text` to at most `max_length` bytes, ending in "..." when cut.
auto truncate_title(std::string text, size_t max_length) -> std::string {
    if (text.size() <= max_length) return text;
    if (max_length <= 3) return text.substr(0, max_length);

    size_t cut = max_length - 3;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return utils::trim(text.substr(0, cut)) + "...";
}

auto first_line(std::string_view text) -> std::string {
    auto trimmed = utils::trim(text);
    return utils::trim(std::string_view(trimmed).substr(0, trimmed.find('\n')));
}

} // namespace

NoActiveSessionError::NoActiveSessionError(std::string_view operation)
    : std::logic_error("No active session: " + std::string(operation) +
                       " requires a current session") {}

auto ManagerConfig::from(const Config& config) -> ManagerConfig {
    ManagerConfig mc;
    mc.checkpoint_interval = std::chrono::seconds(config.sessions.checkpoint_interval_seconds);
    mc.title_max_length = config.sessions.title_max_length;
    mc.max_tool_result_tokens = config.context.max_tool_result_tokens;
    return mc;
}

SessionManager::SessionManager(SessionStore& store, SessionIndex& index, ManagerConfig config,
                               std::shared_ptr<const context::TokenEstimator> estimator)
    : store_(store),
      index_(index),
      config_(config),
      estimator_(estimator ? std::move(estimator)
                           : std::make_shared<context::ApproximateEstimator>()),
      tool_compactor_(config_.max_tool_result_tokens) {}

SessionManager::~SessionManager() {
    stop_checkpointing();
    if (has_current()) {
        if (auto result = checkpoint_now(); !result) {
            LOG_ERROR("Final save on shutdown failed: {}", result.error().what());
        }
    }
    if (auto result = index_.save_if_dirty(); !result) {
        LOG_WARN("Failed to save session index on shutdown: {}", result.error().what());
    }
}

template <typename F>
auto SessionManager::with_current(std::string_view operation, F&& fn) {
    std::lock_guard lock(mutex_);
    if (!current_) {
        throw NoActiveSessionError(operation);
    }
    return std::forward<F>(fn)(*current_);
}

// -- Persistence helpers --

auto SessionManager::persist(const Session& session) -> VoidResult {
    if (auto result = store_.save(session); !result) {
        return result;
    }
    last_persisted_ = session;
    index_.update(session);
    if (auto result = index_.save_if_dirty(); !result) {
        // The store is authoritative; a stale index file is rebuilt on demand.
        LOG_WARN("Failed to save session index: {}", result.error().what());
    }
    return {};
}

void SessionManager::start_checkpointing() {
    std::lock_guard lock(checkpoint_mutex_);
    checkpoint_ = std::make_unique<CheckpointTimer>(config_.checkpoint_interval, [this] {
        if (auto result = checkpoint_now(); !result) {
            LOG_WARN("Background checkpoint failed, retrying next tick: {}",
                     result.error().what());
        }
    });
    checkpoint_->start();
}

void SessionManager::stop_checkpointing() {
    std::unique_ptr<CheckpointTimer> timer;
    {
        std::lock_guard lock(checkpoint_mutex_);
        timer = std::move(checkpoint_);
    }
    if (timer) {
        timer->stop();
    }
}

auto SessionManager::is_checkpointing() const -> bool {
    std::lock_guard lock(checkpoint_mutex_);
    return checkpoint_ && checkpoint_->is_running();
}

void SessionManager::activate(Session session) {
    {
        std::lock_guard save_lock(save_mutex_);
        last_persisted_ = session;
    }
    {
        std::lock_guard lock(mutex_);
        current_ = std::move(session);
    }
    start_checkpointing();
}

// -- Lifecycle --

auto SessionManager::create(std::string title, std::string working_dir, std::string model,
                            std::vector<std::string> tags) -> Result<Session> {
    if (auto closed = close(); !closed) {
        return std::unexpected(closed.error());
    }

    Session session;
    session.set_title(std::move(title));
    session.set_working_dir(std::move(working_dir));
    session.set_model(std::move(model));
    for (const auto& tag : tags) {
        session.add_tag(tag);
    }

    {
        std::lock_guard save_lock(save_mutex_);
        if (auto result = persist(session); !result) {
            return std::unexpected(result.error());
        }
    }

    activate(session);
    hooks_.emit(SessionEvent::Start, session);
    LOG_INFO("Created session {} '{}'", session.id(), session.title());
    return session;
}

auto SessionManager::resume(std::string_view id) -> Result<Session> {
    if (auto current_session = current(); current_session && current_session->id() == id) {
        return std::move(*current_session);
    }

    auto loaded = store_.load(id);
    if (!loaded && loaded.error().code() == ErrorCode::Corrupted) {
        LOG_WARN("Session {} is corrupted, trying backup: {}", id, loaded.error().what());
        if (store_.recover_from_backup(id)) {
            loaded = store_.load(id);
        } else {
            LOG_ERROR("Session {} is corrupted and has no usable backup", id);
        }
    }
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    if (auto closed = close(); !closed) {
        return std::unexpected(closed.error());
    }

    index_.update(*loaded);
    if (auto result = index_.save_if_dirty(); !result) {
        LOG_WARN("Failed to save session index: {}", result.error().what());
    }

    activate(*loaded);
    hooks_.emit(SessionEvent::Start, *loaded);
    LOG_INFO("Resumed session {} ({} messages)", loaded->id(), loaded->message_count());
    return std::move(*loaded);
}

auto SessionManager::resume_latest() -> std::optional<Session> {
    auto latest = index_.list(ListQuery{.limit = 1});
    if (latest.empty()) {
        return std::nullopt;
    }

    auto resumed = resume(latest.front().id);
    if (!resumed) {
        LOG_WARN("Could not resume latest session {}: {}", latest.front().id,
                 resumed.error().what());
        return std::nullopt;
    }
    return std::move(*resumed);
}

auto SessionManager::resume_or_create(std::optional<std::string> id, std::string title,
                                      std::string working_dir, std::string model,
                                      std::vector<std::string> tags) -> Result<Session> {
    if (id) {
        auto resumed = resume(*id);
        if (resumed || resumed.error().code() != ErrorCode::NotFound) {
            return resumed;
        }
        LOG_INFO("Session {} not found, creating a new one", *id);
    }
    return create(std::move(title), std::move(working_dir), std::move(model), std::move(tags));
}

auto SessionManager::save() -> VoidResult {
    std::optional<Session> snapshot;
    {
        std::lock_guard save_lock(save_mutex_);
        snapshot = with_current("save", [](const Session& s) { return s; });
        if (auto result = persist(*snapshot); !result) {
            return result;
        }
    }
    hooks_.emit(SessionEvent::Save, *snapshot);
    return {};
}

auto SessionManager::save(const Session& session) -> VoidResult {
    {
        std::lock_guard save_lock(save_mutex_);
        if (auto result = persist(session); !result) {
            return result;
        }
    }
    hooks_.emit(SessionEvent::Save, session);
    return {};
}

auto SessionManager::checkpoint_now() -> VoidResult {
    std::lock_guard save_lock(save_mutex_);
    std::optional<Session> snapshot;
    {
        std::lock_guard lock(mutex_);
        if (!current_) return {};
        snapshot = *current_;
    }
    if (last_persisted_ == snapshot) {
        return {};
    }
    LOG_DEBUG("Checkpointing session {}", snapshot->id());
    return persist(*snapshot);
}

auto SessionManager::close() -> VoidResult {
    if (!has_current()) {
        return {};
    }

    stop_checkpointing();

    std::optional<Session> snapshot;
    {
        std::lock_guard save_lock(save_mutex_);
        {
            std::lock_guard lock(mutex_);
            if (!current_) return {};
            snapshot = *current_;
        }
        if (auto result = persist(*snapshot); !result) {
            LOG_ERROR("Final save of session {} failed: {}", snapshot->id(),
                      result.error().what());
            start_checkpointing();
            return result;
        }
    }

    hooks_.emit(SessionEvent::Save, *snapshot);
    hooks_.emit(SessionEvent::End, *snapshot);

    {
        std::lock_guard lock(mutex_);
        if (current_ && current_->id() == snapshot->id()) {
            current_.reset();
        }
    }
    LOG_INFO("Closed session {}", snapshot->id());
    return {};
}

auto SessionManager::close(std::string_view id) -> VoidResult {
    auto cur = current_id();
    if (!cur || *cur != id) {
        return std::unexpected(make_error(ErrorCode::SessionError,
            "Session is not open", std::string(id)));
    }
    return close();
}

auto SessionManager::remove(std::string_view id) -> bool {
    auto cur = current_id();
    if (cur && *cur == id) {
        stop_checkpointing();
        std::lock_guard save_lock(save_mutex_);
        std::lock_guard lock(mutex_);
        current_.reset();
    }

    bool removed = store_.remove(id);
    bool unindexed = index_.remove(id);
    if (unindexed) {
        if (auto result = index_.save_if_dirty(); !result) {
            LOG_WARN("Failed to save session index: {}", result.error().what());
        }
    }
    return removed || unindexed;
}

// -- Mutators --

auto SessionManager::add_message(Role role, std::string content,
                                 std::vector<ToolCall> tool_calls,
                                 std::optional<std::string> tool_call_id,
                                 std::optional<std::string> name, bool pinned) -> Message {
    Message message{
        .role = role,
        .content = std::move(content),
        .tool_calls = std::move(tool_calls),
        .tool_call_id = std::move(tool_call_id),
        .name = std::move(name),
        .timestamp = utils::now(),
        .pinned = pinned,
    };
    if (role == Role::Tool) {
        message = tool_compactor_.compact_message(message, *estimator_);
    }

    bool notify = hooks_.count(SessionEvent::Message) > 0;
    std::optional<Session> snapshot;

    auto stored = with_current("add_message", [&](Session& s) {
        s.add_message(std::move(message));
        if (role == Role::User && s.title().empty()) {
            s.set_title(generate_title(s));
        }
        if (notify) snapshot = s;
        return s.messages().back();
    });

    if (snapshot) {
        hooks_.emit(SessionEvent::Message, *snapshot, &snapshot->messages().back());
    }
    return stored;
}

auto SessionManager::record_tool_call(std::string tool_name, nlohmann::json arguments,
                                      nlohmann::json result,
                                      std::chrono::milliseconds duration, bool success,
                                      std::optional<std::string> error) -> ToolInvocation {
    ToolInvocation invocation{
        .id = utils::generate_id(),
        .tool_name = std::move(tool_name),
        .arguments = std::move(arguments),
        .result = std::move(result),
        .timestamp = utils::now(),
        .duration = duration,
        .success = success,
        .error = std::move(error),
    };
    return with_current("record_tool_call", [&](Session& s) {
        s.record_tool(std::move(invocation));
        return s.tool_history().back();
    });
}

void SessionManager::update_usage(int64_t prompt_tokens, int64_t completion_tokens) {
    with_current("update_usage", [&](Session& s) {
        s.update_usage(prompt_tokens, completion_tokens);
    });
}

void SessionManager::reset_usage() {
    with_current("reset_usage", [](Session& s) { s.reset_usage(); });
}

void SessionManager::set_title(std::string title) {
    with_current("set_title", [&](Session& s) { s.set_title(std::move(title)); });
}

auto SessionManager::add_tag(const std::string& tag) -> bool {
    return with_current("add_tag", [&](Session& s) { return s.add_tag(tag); });
}

auto SessionManager::remove_tag(const std::string& tag) -> bool {
    return with_current("remove_tag", [&](Session& s) { return s.remove_tag(tag); });
}

void SessionManager::set_metadata(const std::string& key, nlohmann::json value) {
    with_current("set_metadata", [&](Session& s) { s.set_metadata(key, std::move(value)); });
}

void SessionManager::replace_messages(std::vector<Message> messages) {
    with_current("replace_messages", [&](Session& s) {
        s.replace_messages(std::move(messages));
    });
}

// -- Titles --

auto SessionManager::generate_title(const Session& session) const -> std::string {
    for (const auto& msg : session.messages()) {
        if (msg.role != Role::User) continue;
        auto line = first_line(msg.content);
        if (!line.empty()) {
            return truncate_title(std::move(line), config_.title_max_length);
        }
    }

    auto time = Clock::to_time_t(session.created_at());
    std::tm tm_val{};
    gmtime_r(&time, &tm_val);
    std::ostringstream oss;
    oss << "Session " << std::put_time(&tm_val, "%Y-%m-%d %H:%M");
    return oss.str();
}

auto SessionManager::suggest_title(std::shared_ptr<providers::Provider> provider)
    -> awaitable<std::string> {
    using namespace boost::asio::experimental::awaitable_operators;

    auto snapshot = current();
    if (!snapshot) {
        throw NoActiveSessionError("suggest_title");
    }
    auto fallback = generate_title(*snapshot);
    if (!provider || snapshot->messages().empty()) {
        co_return fallback;
    }

    providers::CompletionRequest req;
    req.model = snapshot->model();
    req.system_prompt = std::string(kTitleInstruction);
    req.max_tokens = 30;
    for (const auto& msg : snapshot->messages()) {
        if (msg.role != Role::User && msg.role != Role::Assistant) continue;
        req.messages.push_back(msg);
        if (req.messages.size() >= kTitleContextMessages) break;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer deadline(executor, config_.title_timeout);

    std::variant<Result<providers::CompletionResponse>, std::monostate> outcome;
    try {
        outcome = co_await (provider->complete(std::move(req)) ||
                            deadline.async_wait(boost::asio::use_awaitable));
    } catch (const std::exception& e) {
        LOG_WARN("Title generation failed, using fallback: {}", e.what());
        co_return fallback;
    }

    if (outcome.index() == 1) {
        LOG_WARN("Title generation timed out, using fallback");
        co_return fallback;
    }
    auto response = std::get<0>(std::move(outcome));
    if (!response) {
        LOG_WARN("Title generation failed, using fallback: {}", response.error().what());
        co_return fallback;
    }

    auto title = first_line(response->text);
    if (title.size() >= 2 && title.front() == '"' && title.back() == '"') {
        title = utils::trim(title.substr(1, title.size() - 2));
    }
    if (title.empty()) {
        co_return fallback;
    }
    co_return truncate_title(std::move(title), config_.title_max_length);
}

// -- Queries --

auto SessionManager::current() const -> std::optional<Session> {
    std::lock_guard lock(mutex_);
    return current_;
}

auto SessionManager::has_current() const -> bool {
    std::lock_guard lock(mutex_);
    return current_.has_value();
}

auto SessionManager::current_id() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    if (!current_) return std::nullopt;
    return current_->id();
}

auto SessionManager::list(const ListQuery& query) const -> std::vector<SessionSummary> {
    return index_.list(query);
}

} // namespace chatvault::sessions
