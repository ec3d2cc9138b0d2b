#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chatvault/core/types.hpp"
#include "chatvault/sessions/session.hpp"

namespace chatvault::sessions {

enum class SessionEvent {
    Start,
    End,
    Message,
    Save,
};

/// Wire name, e.g. "session:start".
[[nodiscard]] auto to_string(SessionEvent event) -> std::string_view;
[[nodiscard]] auto parse_session_event(std::string_view name) -> std::optional<SessionEvent>;

/// Listener for a session event. `message` is set for SessionEvent::Message
/// and null otherwise.
using SessionHook = std::function<void(const Session& session, const Message* message)>;

/// Priority levels for hook ordering.
enum class HookPriority : int {
    Highest = 0,
    High    = 100,
    Normal  = 500,
    Low     = 900,
    Lowest  = 1000,
};

struct HookEntry {
    std::string name;
    SessionHook hook;
    HookPriority priority = HookPriority::Normal;
};

/// Lifecycle listeners keyed by event.
///
/// Hooks run synchronously in priority order (lowest value first, then
/// registration order). A hook that throws is logged and skipped; the
/// remaining hooks and the triggering operation continue.
class HookRegistry {
public:
    HookRegistry() = default;

    void on(SessionEvent event, std::string name, SessionHook hook,
            HookPriority priority = HookPriority::Normal);

    /// Remove a named hook from an event.
    auto remove(SessionEvent event, std::string_view name) -> bool;

    [[nodiscard]] auto count(SessionEvent event) const -> size_t;

    void clear();

    /// Runs every hook for `event`. Returns the number that completed
    /// without throwing.
    auto emit(SessionEvent event, const Session& session,
              const Message* message = nullptr) const -> size_t;

private:
    using HookList = std::vector<HookEntry>;

    static void insert_sorted(HookList& list, HookEntry entry);

    std::map<SessionEvent, HookList> hooks_;
    mutable std::mutex mutex_;
};

} // namespace chatvault::sessions
