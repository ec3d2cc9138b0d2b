#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "chatvault/sessions/hooks.hpp"

using namespace chatvault;
using namespace chatvault::sessions;

TEST_CASE("SessionEvent names", "[sessions][hooks]") {
    CHECK(to_string(SessionEvent::Start) == "session:start");
    CHECK(to_string(SessionEvent::End) == "session:end");
    CHECK(to_string(SessionEvent::Message) == "session:message");
    CHECK(to_string(SessionEvent::Save) == "session:save");
    CHECK(parse_session_event("session:save") == SessionEvent::Save);
    CHECK_FALSE(parse_session_event("session:explode").has_value());
}

TEST_CASE("HookRegistry runs hooks in priority order", "[sessions][hooks]") {
    HookRegistry registry;
    Session session("s1");
    std::vector<std::string> order;

    registry.on(SessionEvent::Start, "normal-1",
                [&](const Session&, const Message*) { order.push_back("normal-1"); });
    registry.on(SessionEvent::Start, "low",
                [&](const Session&, const Message*) { order.push_back("low"); },
                HookPriority::Low);
    registry.on(SessionEvent::Start, "high",
                [&](const Session&, const Message*) { order.push_back("high"); },
                HookPriority::High);
    registry.on(SessionEvent::Start, "normal-2",
                [&](const Session&, const Message*) { order.push_back("normal-2"); });

    CHECK(registry.count(SessionEvent::Start) == 4);
    CHECK(registry.emit(SessionEvent::Start, session) == 4);
    CHECK(order == std::vector<std::string>{"high", "normal-1", "normal-2", "low"});

    SECTION("other events are unaffected") {
        CHECK(registry.emit(SessionEvent::End, session) == 0);
    }

    SECTION("remove by name") {
        CHECK(registry.remove(SessionEvent::Start, "low"));
        CHECK_FALSE(registry.remove(SessionEvent::Start, "low"));
        CHECK(registry.count(SessionEvent::Start) == 3);
    }

    SECTION("clear") {
        registry.clear();
        CHECK(registry.count(SessionEvent::Start) == 0);
    }
}

TEST_CASE("A throwing hook does not stop the others", "[sessions][hooks]") {
    HookRegistry registry;
    Session session("s1");
    int ran = 0;

    registry.on(SessionEvent::Save, "first", [&](const Session&, const Message*) { ++ran; });
    registry.on(SessionEvent::Save, "broken", [](const Session&, const Message*) {
        throw std::runtime_error("hook failure");
    });
    registry.on(SessionEvent::Save, "last", [&](const Session&, const Message*) { ++ran; });

    CHECK(registry.emit(SessionEvent::Save, session) == 2);
    CHECK(ran == 2);

    SECTION("a hook throwing a non-exception type is contained too") {
        registry.on(SessionEvent::Save, "odd", [](const Session&, const Message*) {
            throw 42;
        });
        ran = 0;
        CHECK_NOTHROW(registry.emit(SessionEvent::Save, session));
        CHECK(ran == 2);
    }
}

TEST_CASE("Message hooks receive the message", "[sessions][hooks]") {
    HookRegistry registry;
    Session session("s1");
    std::string seen;

    registry.on(SessionEvent::Message, "capture", [&](const Session& s, const Message* m) {
        seen = s.id() + ":" + (m ? m->content : "<null>");
    });

    auto msg = Message::user("hello");
    registry.emit(SessionEvent::Message, session, &msg);
    CHECK(seen == "s1:hello");
}

TEST_CASE("A hook may register another hook while running", "[sessions][hooks]") {
    HookRegistry registry;
    Session session("s1");

    registry.on(SessionEvent::Start, "spawner", [&](const Session&, const Message*) {
        registry.on(SessionEvent::Start, "spawned", [](const Session&, const Message*) {});
    });

    CHECK(registry.emit(SessionEvent::Start, session) == 1);
    CHECK(registry.count(SessionEvent::Start) == 2);
}
