#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatvault {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

enum class Role {
    System,
    User,
    Assistant,
    Tool,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::System, "system"},
    {Role::User, "user"},
    {Role::Assistant, "assistant"},
    {Role::Tool, "tool"},
})

[[nodiscard]] auto role_to_string(Role role) -> std::string_view;
[[nodiscard]] auto parse_role(std::string_view s) -> std::optional<Role>;

/// A tool invocation requested by the assistant.
struct ToolCall {
    std::string id;
    std::string name;
    json arguments = json::object();

    auto operator==(const ToolCall&) const -> bool = default;
};

void to_json(json& j, const ToolCall& c);
void from_json(const json& j, ToolCall& c);

/// One conversation turn.
struct Message {
    Role role = Role::User;
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::optional<std::string> tool_call_id;  // links a tool result to its call
    std::optional<std::string> name;
    Timestamp timestamp{};
    bool pinned = false;  // never evicted by selective truncation or compaction

    [[nodiscard]] auto has_tool_calls() const noexcept -> bool { return !tool_calls.empty(); }

    auto operator==(const Message&) const -> bool = default;

    static auto system(std::string content) -> Message;
    static auto user(std::string content) -> Message;
    static auto assistant(std::string content) -> Message;
    static auto tool_result(std::string tool_call_id, std::string content,
                            std::optional<std::string> name = std::nullopt) -> Message;
};

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);

} // namespace chatvault
