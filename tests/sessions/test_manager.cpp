#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "chatvault/sessions/manager.hpp"
#include "support/helpers.hpp"

using namespace chatvault;
using namespace chatvault::sessions;
using namespace std::chrono_literals;
using chatvault::testing::FakeProvider;
using chatvault::testing::TempDir;
using chatvault::testing::WordEstimator;
using chatvault::testing::run_sync;

namespace {

template <typename Pred>
auto wait_for(Pred pred, std::chrono::milliseconds timeout = 2000ms) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

void record(SessionManager& manager, SessionEvent event, std::vector<std::string>& events) {
    manager.hooks().on(event, "record-" + std::string(to_string(event)),
                       [&events, event](const Session&, const Message*) {
                           events.emplace_back(to_string(event));
                       });
}

/// Store, index and manager wired together in a scratch directory.
struct Fixture {
    explicit Fixture(ManagerConfig config = {})
        : store(dir.path()),
          index(store),
          manager(store, index, config, std::make_shared<WordEstimator>()) {}

    TempDir dir;
    SessionStore store;
    SessionIndex index;
    SessionManager manager;
};

} // namespace

TEST_CASE("SessionManager creates sessions", "[sessions][manager]") {
    Fixture f;
    std::vector<std::string> events;
    record(f.manager, SessionEvent::Start, events);

    auto created = f.manager.create("Parser work", "/src/parser", "gpt-4", {"work"});
    REQUIRE(created.has_value());

    CHECK(events == std::vector<std::string>{"session:start"});
    CHECK(f.manager.has_current());
    CHECK(f.manager.current_id() == created->id());
    CHECK(f.manager.is_checkpointing());

    auto stored = f.store.load(created->id());
    REQUIRE(stored.has_value());
    CHECK(stored->title() == "Parser work");
    CHECK(stored->working_dir() == "/src/parser");
    CHECK(stored->model() == "gpt-4");
    CHECK(stored->tags().contains("work"));

    auto summary = f.index.get(created->id());
    REQUIRE(summary.has_value());
    CHECK(summary->title == "Parser work");

    SECTION("creating another closes the first") {
        auto second = f.manager.create("Second");
        REQUIRE(second.has_value());
        CHECK(f.manager.current_id() == second->id());
        CHECK(f.index.count() == 2);
    }
}

TEST_CASE("SessionManager resumes sessions", "[sessions][manager]") {
    Fixture f;

    auto created = f.manager.create();
    REQUIRE(created.has_value());
    auto id = created->id();
    f.manager.add_message(Role::User, "remember this");
    REQUIRE(f.manager.save().has_value());
    REQUIRE(f.manager.close().has_value());
    CHECK_FALSE(f.manager.has_current());

    SECTION("by id") {
        auto resumed = f.manager.resume(id);
        REQUIRE(resumed.has_value());
        CHECK(resumed->message_count() == 1);
        CHECK(f.manager.current_id() == id);
        CHECK(f.manager.is_checkpointing());
    }

    SECTION("resuming the current session returns it") {
        REQUIRE(f.manager.resume(id).has_value());
        auto again = f.manager.resume(id);
        REQUIRE(again.has_value());
        CHECK(again->id() == id);
    }

    SECTION("unknown id is NotFound") {
        auto resumed = f.manager.resume("no-such-session");
        REQUIRE_FALSE(resumed.has_value());
        CHECK(resumed.error().code() == ErrorCode::NotFound);
    }

    SECTION("a corrupted file is restored from its backup") {
        {
            std::ofstream out(f.store.session_path(id), std::ios::trunc);
            out << "{ not json";
        }
        auto resumed = f.manager.resume(id);
        REQUIRE(resumed.has_value());
        CHECK(resumed->message_count() == 1);
        CHECK(f.store.load(id).has_value());
    }

    SECTION("resume_or_create falls back to creating") {
        auto session = f.manager.resume_or_create("missing", "Fresh");
        REQUIRE(session.has_value());
        CHECK(session->id() != "missing");
        CHECK(session->title() == "Fresh");

        auto existing = f.manager.resume_or_create(id);
        REQUIRE(existing.has_value());
        CHECK(existing->id() == id);

        auto no_id = f.manager.resume_or_create(std::nullopt, "Another");
        REQUIRE(no_id.has_value());
        CHECK(no_id->title() == "Another");
    }
}

TEST_CASE("SessionManager resumes the most recent session", "[sessions][manager]") {
    Fixture f;
    CHECK_FALSE(f.manager.resume_latest().has_value());

    REQUIRE(f.manager.create("older").has_value());
    REQUIRE(f.manager.close().has_value());
    std::this_thread::sleep_for(5ms);
    auto newer = f.manager.create("newer");
    REQUIRE(newer.has_value());
    REQUIRE(f.manager.close().has_value());

    auto latest = f.manager.resume_latest();
    REQUIRE(latest.has_value());
    CHECK(latest->id() == newer->id());
}

TEST_CASE("SessionManager close saves then ends", "[sessions][manager]") {
    Fixture f;
    std::vector<std::string> events;

    auto created = f.manager.create();
    REQUIRE(created.has_value());
    record(f.manager, SessionEvent::Save, events);
    record(f.manager, SessionEvent::End, events);

    SECTION("save emits a save event") {
        REQUIRE(f.manager.save().has_value());
        CHECK(events == std::vector<std::string>{"session:save"});
    }

    SECTION("close") {
        f.manager.add_message(Role::User, "last words");
        REQUIRE(f.manager.close().has_value());
        CHECK(events == std::vector<std::string>{"session:save", "session:end"});
        CHECK_FALSE(f.manager.has_current());
        CHECK_FALSE(f.manager.is_checkpointing());

        auto stored = f.store.load(created->id());
        REQUIRE(stored.has_value());
        CHECK(stored->message_count() == 1);

        // Nothing left to close.
        CHECK(f.manager.close().has_value());
        CHECK(events.size() == 2);
    }

    SECTION("close by id") {
        auto wrong = f.manager.close("someone-else");
        REQUIRE_FALSE(wrong.has_value());
        CHECK(wrong.error().code() == ErrorCode::SessionError);
        CHECK(f.manager.has_current());

        CHECK(f.manager.close(created->id()).has_value());
        CHECK_FALSE(f.manager.has_current());
    }
}

TEST_CASE("SessionManager removes the current session", "[sessions][manager]") {
    Fixture f;
    auto created = f.manager.create();
    REQUIRE(created.has_value());

    CHECK(f.manager.remove(created->id()));
    CHECK_FALSE(f.manager.has_current());
    CHECK_FALSE(f.manager.is_checkpointing());
    CHECK_FALSE(f.store.exists(created->id()));
    CHECK_FALSE(f.index.get(created->id()).has_value());

    CHECK_FALSE(f.manager.remove(created->id()));
}

TEST_CASE("SessionManager mutators need a current session", "[sessions][manager]") {
    Fixture f;
    CHECK_THROWS_AS(f.manager.add_message(Role::User, "hi"), NoActiveSessionError);
    CHECK_THROWS_AS(f.manager.update_usage(1, 2), NoActiveSessionError);
    CHECK_THROWS_AS(f.manager.set_title("t"), NoActiveSessionError);
    CHECK_THROWS_AS(f.manager.save(), NoActiveSessionError);
    CHECK_THROWS_AS(run_sync(f.manager.suggest_title(nullptr)), NoActiveSessionError);
    CHECK(f.manager.checkpoint_now().has_value());
}

TEST_CASE("SessionManager adds messages", "[sessions][manager]") {
    ManagerConfig config;
    config.max_tool_result_tokens = 10;
    Fixture f(config);
    REQUIRE(f.manager.create().has_value());

    SECTION("the first user message names an untitled session") {
        f.manager.add_message(Role::System, "You are helpful.");
        f.manager.add_message(Role::User, "  Fix the build on macOS\nIt fails at link time");
        f.manager.add_message(Role::User, "Another question");
        CHECK(f.manager.current()->title() == "Fix the build on macOS");
    }

    SECTION("an explicit title is kept") {
        f.manager.set_title("Chosen");
        f.manager.add_message(Role::User, "Something else entirely");
        CHECK(f.manager.current()->title() == "Chosen");
    }

    SECTION("large tool results are truncated") {
        std::string output;
        for (int i = 0; i < 100; ++i) {
            output += "word" + std::to_string(i) + " ";
        }
        auto stored = f.manager.add_message(Role::Tool, output, {}, "call_1", "grep");
        CHECK(stored.content.size() < output.size());
        CHECK(stored.content.find("[Output truncated") != std::string::npos);
        CHECK(stored.tool_call_id == "call_1");

        auto small = f.manager.add_message(Role::Tool, "three short words", {}, "call_2");
        CHECK(small.content == "three short words");
    }

    SECTION("message hooks see the stored message") {
        std::vector<std::string> seen;
        f.manager.hooks().on(SessionEvent::Message, "seen",
                             [&](const Session& s, const Message* m) {
                                 seen.push_back(m ? m->content : "<null>");
                                 CHECK(s.message_count() == seen.size());
                             });
        f.manager.add_message(Role::User, "one");
        f.manager.add_message(Role::Assistant, "two");
        CHECK(seen == std::vector<std::string>{"one", "two"});
    }
}

TEST_CASE("SessionManager records tools and usage", "[sessions][manager]") {
    Fixture f;
    REQUIRE(f.manager.create().has_value());

    auto invocation = f.manager.record_tool_call("read_file", {{"path", "a.txt"}}, "contents",
                                                 25ms);
    CHECK_FALSE(invocation.id.empty());
    CHECK(invocation.success);

    f.manager.record_tool_call("write_file", {{"path", "/etc"}}, nullptr, 3ms, false,
                               "permission denied");
    f.manager.update_usage(100, 20);
    f.manager.update_usage(50, 5);

    auto current = f.manager.current();
    REQUIRE(current.has_value());
    REQUIRE(current->tool_history().size() == 2);
    CHECK(current->tool_history()[1].error == "permission denied");
    CHECK(current->total_prompt_tokens() == 150);
    CHECK(current->total_completion_tokens() == 25);

    f.manager.reset_usage();
    CHECK(f.manager.current()->total_tokens() == 0);
}

TEST_CASE("SessionManager generates titles", "[sessions][manager]") {
    ManagerConfig config;
    config.title_max_length = 20;
    Fixture f(config);

    Session session;
    session.add_message(Message::user("This is a rather long first message"));
    CHECK(f.manager.generate_title(session) == "This is a rather...");

    Session empty;
    empty.add_message(Message::assistant("No user here"));
    auto fallback = f.manager.generate_title(empty);
    CHECK(fallback.starts_with("Session "));
    CHECK(fallback.size() == std::string("Session 2024-01-01 00:00").size());
}

TEST_CASE("SessionManager asks a provider for a title", "[sessions][manager]") {
    ManagerConfig config;
    config.title_timeout = 50ms;
    Fixture f(config);
    REQUIRE(f.manager.create({}, {}, "gpt-4").has_value());
    f.manager.add_message(Role::User, "How do I read a file in chunks");
    f.manager.add_message(Role::Assistant, "Use a buffered reader");

    SECTION("uses the model's reply") {
        auto provider = std::make_shared<FakeProvider>("\"Reading files in chunks\"\nextra");
        auto title = run_sync(f.manager.suggest_title(provider));
        CHECK(title == "Reading files in chunks");
        REQUIRE(provider->last_request.has_value());
        CHECK(provider->last_request->model == "gpt-4");
        CHECK(provider->last_request->messages.size() == 2);
    }

    SECTION("falls back on a provider error") {
        auto provider = std::make_shared<FakeProvider>();
        provider->error = make_error(ErrorCode::ProviderError, "rate limited");
        CHECK(run_sync(f.manager.suggest_title(provider)) == "How do I read a file in chunks");
    }

    SECTION("falls back when the provider throws") {
        auto provider = std::make_shared<FakeProvider>();
        provider->throw_error = true;
        CHECK(run_sync(f.manager.suggest_title(provider)) == "How do I read a file in chunks");
    }

    SECTION("falls back on timeout") {
        auto provider = std::make_shared<FakeProvider>("Too late");
        provider->delay = 2000ms;
        CHECK(run_sync(f.manager.suggest_title(provider)) == "How do I read a file in chunks");
    }

    SECTION("falls back without a provider") {
        CHECK(run_sync(f.manager.suggest_title(nullptr)) == "How do I read a file in chunks");
    }
}

TEST_CASE("SessionManager checkpoints in the background", "[sessions][manager]") {
    ManagerConfig config;
    config.checkpoint_interval = 20ms;
    Fixture f(config);

    auto created = f.manager.create();
    REQUIRE(created.has_value());
    auto id = created->id();

    std::vector<std::string> events;
    record(f.manager, SessionEvent::Save, events);

    f.manager.add_message(Role::User, "unsaved so far");
    CHECK(wait_for([&] {
        auto stored = f.store.load(id);
        return stored && stored->message_count() == 1;
    }));
    CHECK(events.empty());
}

TEST_CASE("Idle checkpoints keep the previous version as backup", "[sessions][manager]") {
    ManagerConfig config;
    config.checkpoint_interval = 10ms;
    Fixture f(config);

    auto created = f.manager.create();
    REQUIRE(created.has_value());
    auto id = created->id();

    auto backup_messages = [&] {
        std::ifstream in(f.store.backup_path(id));
        return nlohmann::json::parse(in).get<Session>().message_count();
    };

    auto stored_messages = [&](size_t n) {
        return wait_for([&] {
            auto stored = f.store.load(id);
            return stored && stored->message_count() == n;
        });
    };

    f.manager.add_message(Role::User, "first");
    REQUIRE(stored_messages(1));
    REQUIRE(backup_messages() == 0);

    // Several ticks pass with nothing to write.
    std::this_thread::sleep_for(100ms);
    CHECK(backup_messages() == 0);
    CHECK(f.manager.checkpoint_now().has_value());
    CHECK(backup_messages() == 0);

    f.manager.add_message(Role::User, "second");
    REQUIRE(stored_messages(2));
    CHECK(backup_messages() == 1);
}

TEST_CASE("SessionManager saves on destruction", "[sessions][manager]") {
    TempDir dir;
    SessionStore store(dir.path());
    SessionIndex index(store);
    std::string id;
    {
        SessionManager manager(store, index);
        auto created = manager.create();
        REQUIRE(created.has_value());
        id = created->id();
        manager.add_message(Role::User, "written on shutdown");
    }

    auto stored = store.load(id);
    REQUIRE(stored.has_value());
    CHECK(stored->message_count() == 1);
    CHECK(index.get(id)->message_count == 1);
}
