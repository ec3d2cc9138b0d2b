#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatvault/core/types.hpp"

namespace chatvault::sessions {

using json = nlohmann::json;

/// Version written into every session file.
inline constexpr int kSessionFormatVersion = 1;

/// Record of one executed tool call.
struct ToolInvocation {
    std::string id;
    std::string tool_name;
    json arguments = json::object();
    json result;  // null when the tool produced nothing
    Timestamp timestamp{};
    std::chrono::milliseconds duration{0};
    bool success = true;
    std::optional<std::string> error;

    auto operator==(const ToolInvocation&) const -> bool = default;
};

void to_json(json& j, const ToolInvocation& t);
void from_json(const json& j, ToolInvocation& t);

/// One persisted conversation: messages, tool log, usage and metadata.
///
/// The id never changes after construction. Every mutator refreshes
/// updated_at, which never moves backwards.
class Session {
public:
    /// A fresh session with a generated id.
    Session();
    explicit Session(std::string id);

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto title() const noexcept -> const std::string& { return title_; }
    [[nodiscard]] auto created_at() const noexcept -> Timestamp { return created_at_; }
    [[nodiscard]] auto updated_at() const noexcept -> Timestamp { return updated_at_; }
    [[nodiscard]] auto working_dir() const noexcept -> const std::string& { return working_dir_; }
    [[nodiscard]] auto model() const noexcept -> const std::string& { return model_; }
    [[nodiscard]] auto messages() const noexcept -> const std::vector<Message>& { return messages_; }
    [[nodiscard]] auto tool_history() const noexcept -> const std::vector<ToolInvocation>& {
        return tool_history_;
    }
    [[nodiscard]] auto total_prompt_tokens() const noexcept -> int64_t { return prompt_tokens_; }
    [[nodiscard]] auto total_completion_tokens() const noexcept -> int64_t {
        return completion_tokens_;
    }
    [[nodiscard]] auto tags() const noexcept -> const std::set<std::string>& { return tags_; }
    [[nodiscard]] auto metadata() const noexcept -> const json& { return metadata_; }

    [[nodiscard]] auto message_count() const noexcept -> size_t { return messages_.size(); }
    [[nodiscard]] auto total_tokens() const noexcept -> int64_t {
        return prompt_tokens_ + completion_tokens_;
    }
    [[nodiscard]] auto last_message() const -> const Message*;
    [[nodiscard]] auto messages_by_role(Role role) const -> std::vector<Message>;

    void add_message(Message message);
    void add_messages(std::vector<Message> messages);

    /// Swaps in a compacted message list.
    void replace_messages(std::vector<Message> messages);

    void record_tool(ToolInvocation invocation);

    /// Adds to the cumulative counters. Negative deltas are ignored.
    void update_usage(int64_t prompt_tokens, int64_t completion_tokens);
    void reset_usage();

    void set_title(std::string title);
    void set_working_dir(std::string dir);
    void set_model(std::string model);

    /// Returns false if the tag was already present.
    auto add_tag(const std::string& tag) -> bool;
    /// Returns false if the tag was absent.
    auto remove_tag(const std::string& tag) -> bool;

    void set_metadata(const std::string& key, json value);
    auto erase_metadata(const std::string& key) -> bool;

    void touch();

    auto operator==(const Session&) const -> bool = default;

    friend void to_json(json& j, const Session& s);
    friend void from_json(const json& j, Session& s);

private:
    std::string id_;
    std::string title_;
    Timestamp created_at_{};
    Timestamp updated_at_{};
    std::string working_dir_;
    std::string model_;
    std::vector<Message> messages_;
    std::vector<ToolInvocation> tool_history_;
    int64_t prompt_tokens_ = 0;
    int64_t completion_tokens_ = 0;
    std::set<std::string> tags_;
    json metadata_ = json::object();
};

/// Index projection of a Session: no message bodies.
struct SessionSummary {
    std::string id;
    std::string title;
    Timestamp created_at{};
    Timestamp updated_at{};
    size_t message_count = 0;
    int64_t total_tokens = 0;
    std::set<std::string> tags;
    std::string working_dir;
    std::string model;

    [[nodiscard]] static auto from(const Session& session) -> SessionSummary;

    auto operator==(const SessionSummary&) const -> bool = default;
};

void to_json(json& j, const SessionSummary& s);
void from_json(const json& j, SessionSummary& s);

} // namespace chatvault::sessions
