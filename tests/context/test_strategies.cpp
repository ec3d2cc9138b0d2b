#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "chatvault/context/strategies.hpp"
#include "support/helpers.hpp"

using namespace chatvault;
using namespace chatvault::context;

namespace {

/// "m0".."m{n-1}" user messages; each costs 6 under WordEstimator.
auto numbered(size_t n) -> std::vector<Message> {
    std::vector<Message> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(Message::user("m" + std::to_string(i)));
    }
    return out;
}

auto contents(const std::vector<Message>& msgs) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& m : msgs) out.push_back(m.content);
    return out;
}

auto marker_total(const std::vector<Message>& msgs) -> size_t {
    return static_cast<size_t>(std::ranges::count_if(msgs, is_omission_marker));
}

auto tool_exchange() -> std::vector<Message> {
    auto call = Message::assistant("");
    call.tool_calls.push_back(ToolCall{"c1", "search", json::object()});
    return {
        Message::user("u0"),
        call,
        Message::tool_result("c1", "r"),
        Message::user("u1"),
        Message::user("u2"),
    };
}

auto calling(std::string id) -> Message {
    auto call = Message::assistant("");
    call.tool_calls.push_back(ToolCall{std::move(id), "search", json::object()});
    return call;
}

/// Every surviving tool result has its call, and every surviving call has
/// all of its results (the inputs used here answer every call).
auto pairs_intact(const std::vector<Message>& msgs) -> bool {
    std::set<std::string> calls;
    std::set<std::string> answered;
    for (const auto& m : msgs) {
        for (const auto& call : m.tool_calls) calls.insert(call.id);
        if (m.role == Role::Tool && m.tool_call_id) {
            if (!calls.contains(*m.tool_call_id)) return false;
            answered.insert(*m.tool_call_id);
        }
    }
    return calls == answered;
}

} // namespace

TEST_CASE("eviction_groups binds tool results to their call", "[context][strategies]") {
    auto groups = eviction_groups(tool_exchange());
    REQUIRE(groups.size() == 4);
    CHECK(groups[0] == std::vector<size_t>{0});
    CHECK(groups[1] == std::vector<size_t>{1, 2});
    CHECK(groups[2] == std::vector<size_t>{3});

    SECTION("an orphan tool result is its own group") {
        std::vector<Message> msgs = {Message::tool_result("missing", "r"), Message::user("x")};
        CHECK(eviction_groups(msgs).size() == 2);
    }
}

TEST_CASE("SlidingWindowStrategy keeps system messages and the last N", "[context][strategies]") {
    testing::WordEstimator est;
    auto msgs = numbered(20);
    msgs.insert(msgs.begin(), Message::system("sys"));

    SlidingWindowStrategy window(5);
    auto result = window.truncate(msgs, 1'000'000, est);

    REQUIRE(result.size() == 6);
    CHECK(result[0].role == Role::System);
    CHECK(contents(result) ==
          std::vector<std::string>{"sys", "m15", "m16", "m17", "m18", "m19"});

    SECTION("short lists are unchanged") {
        auto few = numbered(3);
        CHECK(window.truncate(few, 0, est) == few);
    }

    SECTION("without system preservation the system message is windowed too") {
        SlidingWindowStrategy plain(5, false);
        auto out = plain.truncate(msgs, 1'000'000, est);
        CHECK(out.size() == 5);
        CHECK(out.front().content == "m15");
    }
}

TEST_CASE("SlidingWindowStrategy never splits a tool call from its result",
          "[context][strategies]") {
    testing::WordEstimator est;
    std::vector<Message> msgs = {
        Message::user("u0"), calling("c1"), Message::tool_result("c1", "r"), Message::user("u1"),
    };

    SECTION("a pair straddling the window edge is dropped whole") {
        auto out = SlidingWindowStrategy(2).truncate(msgs, 1'000'000, est);
        CHECK(contents(out) == std::vector<std::string>{"u1"});
        CHECK(pairs_intact(out));
    }

    SECTION("a pair inside the window is kept whole") {
        auto out = SlidingWindowStrategy(3).truncate(msgs, 1'000'000, est);
        REQUIRE(out.size() == 3);
        CHECK(out[0].has_tool_calls());
        CHECK(out[1].tool_call_id == "c1");
        CHECK(pairs_intact(out));
    }

    SECTION("the newest pair survives even when larger than the window") {
        std::vector<Message> tail_pair = {
            Message::user("u0"), calling("c2"), Message::tool_result("c2", "r"),
        };
        auto out = SlidingWindowStrategy(1).truncate(tail_pair, 1'000'000, est);
        CHECK(out.size() == 2);
        CHECK(pairs_intact(out));
    }

    SECTION("every window size keeps pairs intact") {
        for (size_t window = 0; window <= msgs.size(); ++window) {
            CHECK(pairs_intact(SlidingWindowStrategy(window).truncate(msgs, 0, est)));
        }
    }
}

TEST_CASE("TokenBudgetStrategy drops the oldest messages first", "[context][strategies]") {
    testing::WordEstimator est;
    TokenBudgetStrategy strategy;

    SECTION("input that fits is returned unchanged") {
        auto msgs = numbered(10);
        CHECK(strategy.truncate(msgs, est.count_messages(msgs), est) == msgs);
    }

    SECTION("oldest messages go until the list fits") {
        auto result = strategy.truncate(numbered(10), 40, est);
        CHECK(contents(result) ==
              std::vector<std::string>{"m4", "m5", "m6", "m7", "m8", "m9"});
        CHECK(est.count_messages(result) <= 40);
    }

    SECTION("system messages are preserved") {
        auto msgs = numbered(20);
        msgs.insert(msgs.begin(), Message::system("sys"));
        auto result = strategy.truncate(msgs, 40, est);
        CHECK(result.front().content == "sys");
        CHECK(result.size() == 6);
        CHECK(result.back().content == "m19");
    }

    SECTION("a tool call and its result leave together") {
        auto result = strategy.truncate(tool_exchange(), 30, est);
        CHECK(contents(result) == std::vector<std::string>{"u1", "u2"});
        CHECK(std::ranges::none_of(result, [](const Message& m) {
            return m.role == Role::Tool;
        }));
    }

    SECTION("result fits every reachable budget") {
        auto msgs = numbered(12);
        for (int64_t budget = 0; budget <= 90; budget += 7) {
            CHECK(est.count_messages(strategy.truncate(msgs, budget, est)) <= budget);
        }
    }
}

TEST_CASE("SmartTruncationStrategy leaves one omission marker", "[context][strategies]") {
    testing::WordEstimator est;
    SmartTruncationStrategy smart(2, 3);
    auto msgs = numbered(10);

    auto result = smart.truncate(msgs, 50, est);

    REQUIRE(result.size() == 6);
    CHECK(result[0].content == "m0");
    CHECK(result[1].content == "m1");
    CHECK(is_omission_marker(result[2]));
    CHECK(result[2].content == "[5 messages omitted]");
    CHECK(result[2].timestamp == msgs[2].timestamp);
    CHECK(result[5].content == "m9");
    CHECK(marker_total(result) == 1);
    CHECK(est.count_messages(result) <= 50);

    SECTION("truncating again at the same budget changes nothing") {
        CHECK(smart.truncate(result, 50, est) == result);
    }

    SECTION("a second pass folds the earlier marker into one") {
        auto again = smart.truncate(result, 30, est);
        CHECK(marker_total(again) == 1);
        CHECK(contents(again) ==
              std::vector<std::string>{"m0", "[8 messages omitted]", "m9"});
        CHECK(est.count_messages(again) <= 30);
    }

    SECTION("system messages stay outside the candidate set") {
        auto with_system = msgs;
        with_system.insert(with_system.begin(), Message::system("rules"));
        auto out = smart.truncate(with_system, 56, est);
        CHECK(out.front().content == "rules");
        CHECK(marker_total(out) == 1);
    }

    SECTION("budget is honored whenever a marker plus one message fits") {
        for (int64_t budget = 20; budget <= 70; budget += 5) {
            auto out = smart.truncate(msgs, budget, est);
            CHECK(est.count_messages(out) <= budget);
            CHECK(marker_total(out) <= 1);
            CHECK(out.back().content == "m9");
        }
    }
}

TEST_CASE("SmartTruncationStrategy never splits a tool call from its result",
          "[context][strategies]") {
    testing::WordEstimator est;
    std::vector<Message> msgs = {
        Message::user("u0"), calling("c1"), Message::tool_result("c1", "r"),
        Message::user("u1"), Message::user("u2"), Message::user("u3"),
    };
    SmartTruncationStrategy smart(2, 2);

    SECTION("a pair at the head edge goes into the gap whole") {
        auto out = smart.truncate(msgs, est.count_messages(msgs) - 1, est);
        CHECK(contents(out) ==
              std::vector<std::string>{"u0", "[3 messages omitted]", "u2", "u3"});
        CHECK(pairs_intact(out));
    }

    SECTION("a pair at the tail is kept whole") {
        std::vector<Message> tail_pair = {
            Message::user("u0"), Message::user("u1"), Message::user("u2"),
            calling("c2"), Message::tool_result("c2", "r"),
        };
        SmartTruncationStrategy narrow(1, 1);
        auto out = narrow.truncate(tail_pair, est.count_messages(tail_pair) - 1, est);
        CHECK(pairs_intact(out));
        REQUIRE(out.size() >= 2);
        CHECK(out.back().tool_call_id == "c2");
        CHECK(marker_total(out) == 1);
    }

    SECTION("pairs stay intact across budgets") {
        for (int64_t budget = 0; budget <= est.count_messages(msgs); budget += 4) {
            CHECK(pairs_intact(smart.truncate(msgs, budget, est)));
        }
    }
}

TEST_CASE("SelectiveStrategy keeps pinned messages and preserved roles", "[context][strategies]") {
    testing::WordEstimator est;
    auto msgs = numbered(6);
    msgs[1].pinned = true;

    SelectiveStrategy selective;
    auto result = selective.truncate(msgs, 21, est);
    CHECK(contents(result) == std::vector<std::string>{"m1", "m4", "m5"});

    SECTION("assistant role can be preserved") {
        std::vector<Message> mixed = {
            Message::assistant("a0"), Message::user("u0"), Message::user("u1"),
            Message::user("u2"),
        };
        SelectiveStrategy keep_assistant({Role::System, Role::Assistant});
        // a0 and u2 cost 6 each: 12 + 3 = 15.
        auto out = keep_assistant.truncate(mixed, 15, est);
        CHECK(contents(out) == std::vector<std::string>{"a0", "u2"});
    }
}

TEST_CASE("CompositeStrategy stops once the list fits", "[context][strategies]") {
    testing::WordEstimator est;
    CompositeStrategy composite({
        std::make_shared<SlidingWindowStrategy>(3),
        std::make_shared<TokenBudgetStrategy>(),
    });
    CHECK(composite.stage_count() == 2);

    auto msgs = numbered(10);

    SECTION("already fitting input is untouched") {
        CHECK(composite.truncate(msgs, 1000, est) == msgs);
    }

    SECTION("later stages run only while over budget") {
        auto result = composite.truncate(msgs, 20, est);
        CHECK(contents(result) == std::vector<std::string>{"m8", "m9"});
    }
}

TEST_CASE("make_strategy maps context modes", "[context][strategies]") {
    ContextConfig config;
    CHECK((*make_strategy("sliding_window", config))->name() == "sliding_window");
    CHECK((*make_strategy("token_budget", config))->name() == "token_budget");
    CHECK((*make_strategy("smart", config))->name() == "smart");
    CHECK((*make_strategy("summarize", config))->name() == "smart");
    CHECK((*make_strategy("selective", config))->name() == "selective");

    auto bad = make_strategy("bogus", config);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::InvalidConfig);
}
