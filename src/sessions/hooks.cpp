#include "chatvault/sessions/hooks.hpp"

#include <algorithm>

#include "chatvault/core/logger.hpp"

namespace chatvault::sessions {

auto to_string(SessionEvent event) -> std::string_view {
    switch (event) {
        case SessionEvent::Start: return "session:start";
        case SessionEvent::End: return "session:end";
        case SessionEvent::Message: return "session:message";
        case SessionEvent::Save: return "session:save";
    }
    return "session:unknown";
}

auto parse_session_event(std::string_view name) -> std::optional<SessionEvent> {
    if (name == "session:start") return SessionEvent::Start;
    if (name == "session:end") return SessionEvent::End;
    if (name == "session:message") return SessionEvent::Message;
    if (name == "session:save") return SessionEvent::Save;
    return std::nullopt;
}

// -- Insertion helper: keep sorted by priority, stable for equal priorities --

void HookRegistry::insert_sorted(HookList& list, HookEntry entry) {
    auto it = std::ranges::upper_bound(list, entry, [](const HookEntry& a, const HookEntry& b) {
        return static_cast<int>(a.priority) < static_cast<int>(b.priority);
    });
    list.insert(it, std::move(entry));
}

void HookRegistry::on(SessionEvent event, std::string name, SessionHook hook,
                      HookPriority priority) {
    LOG_DEBUG("Registering hook '{}' for {}", name, to_string(event));
    std::lock_guard lock(mutex_);
    insert_sorted(hooks_[event], HookEntry{std::move(name), std::move(hook), priority});
}

auto HookRegistry::remove(SessionEvent event, std::string_view name) -> bool {
    std::lock_guard lock(mutex_);
    auto it = hooks_.find(event);
    if (it == hooks_.end()) return false;

    auto erased = std::erase_if(it->second, [&](const HookEntry& e) {
        return e.name == name;
    });
    return erased > 0;
}

auto HookRegistry::count(SessionEvent event) const -> size_t {
    std::lock_guard lock(mutex_);
    auto it = hooks_.find(event);
    return it == hooks_.end() ? 0 : it->second.size();
}

void HookRegistry::clear() {
    std::lock_guard lock(mutex_);
    hooks_.clear();
}

auto HookRegistry::emit(SessionEvent event, const Session& session,
                        const Message* message) const -> size_t {
    // Run a copy so a hook may register or remove hooks.
    HookList hooks;
    {
        std::lock_guard lock(mutex_);
        auto it = hooks_.find(event);
        if (it == hooks_.end()) return 0;
        hooks = it->second;
    }

    size_t completed = 0;
    for (const auto& entry : hooks) {
        try {
            entry.hook(session, message);
            ++completed;
        } catch (const std::exception& e) {
            LOG_WARN("Hook '{}' for {} threw exception: {}", entry.name, to_string(event),
                     e.what());
        } catch (...) {
            LOG_WARN("Hook '{}' for {} threw a non-standard exception", entry.name,
                     to_string(event));
        }
    }
    return completed;
}

} // namespace chatvault::sessions
