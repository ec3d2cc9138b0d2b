#include "chatvault/core/types.hpp"
#include "chatvault/core/utils.hpp"

#include <stdexcept>

namespace chatvault {

auto role_to_string(Role role) -> std::string_view {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

auto parse_role(std::string_view s) -> std::optional<Role> {
    if (s == "system") return Role::System;
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    if (s == "tool") return Role::Tool;
    return std::nullopt;
}

void to_json(json& j, const ToolCall& c) {
    j = json{{"id", c.id}, {"name", c.name}, {"arguments", c.arguments}};
}

void from_json(const json& j, ToolCall& c) {
    j.at("id").get_to(c.id);
    j.at("name").get_to(c.name);
    c.arguments = j.value("arguments", json::object());
}

void to_json(json& j, const Message& m) {
    j = json{
        {"role", m.role},
        {"content", m.content},
        {"timestamp", utils::format_iso8601(m.timestamp)},
    };
    if (!m.tool_calls.empty()) j["tool_calls"] = m.tool_calls;
    if (m.tool_call_id) j["tool_call_id"] = *m.tool_call_id;
    if (m.name) j["name"] = *m.name;
    if (m.pinned) j["pinned"] = true;
}

void from_json(const json& j, Message& m) {
    auto role = parse_role(j.at("role").get<std::string>());
    if (!role) {
        throw std::invalid_argument("unknown message role: " + j.at("role").get<std::string>());
    }
    m.role = *role;
    j.at("content").get_to(m.content);

    m.tool_calls.clear();
    if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
        m.tool_calls = j["tool_calls"].get<std::vector<ToolCall>>();
    }
    m.tool_call_id.reset();
    if (j.contains("tool_call_id") && !j["tool_call_id"].is_null()) {
        m.tool_call_id = j["tool_call_id"].get<std::string>();
    }
    m.name.reset();
    if (j.contains("name") && !j["name"].is_null()) {
        m.name = j["name"].get<std::string>();
    }
    m.pinned = j.value("pinned", false);

    m.timestamp = Timestamp{};
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        auto parsed = utils::parse_iso8601(j["timestamp"].get<std::string>());
        if (!parsed) {
            throw std::invalid_argument("malformed message timestamp");
        }
        m.timestamp = *parsed;
    }
}

auto Message::system(std::string content) -> Message {
    return Message{.role = Role::System, .content = std::move(content), .timestamp = utils::now()};
}

auto Message::user(std::string content) -> Message {
    return Message{.role = Role::User, .content = std::move(content), .timestamp = utils::now()};
}

auto Message::assistant(std::string content) -> Message {
    return Message{.role = Role::Assistant, .content = std::move(content), .timestamp = utils::now()};
}

auto Message::tool_result(std::string tool_call_id, std::string content,
                          std::optional<std::string> name) -> Message {
    return Message{
        .role = Role::Tool,
        .content = std::move(content),
        .tool_call_id = std::move(tool_call_id),
        .name = std::move(name),
        .timestamp = utils::now(),
    };
}

} // namespace chatvault
