#include "chatvault/sessions/session.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

#include "chatvault/core/utils.hpp"

namespace chatvault::sessions {

namespace {

auto timestamp_from(const json& j, const char* key) -> Timestamp {
    if (!j.contains(key) || j[key].is_null()) return Timestamp{};
    auto text = j[key].get<std::string>();
    auto ts = utils::parse_iso8601(text);
    if (!ts) {
        throw std::invalid_argument(std::string("Malformed timestamp in '") + key + "': " + text);
    }
    return *ts;
}

} // namespace

// -- ToolInvocation ----------------------------------------------------------

void to_json(json& j, const ToolInvocation& t) {
    j = json{
        {"id", t.id},
        {"tool_name", t.tool_name},
        {"arguments", t.arguments},
        {"result", t.result},
        {"timestamp", utils::format_iso8601(t.timestamp)},
        {"duration", static_cast<double>(t.duration.count()) / 1000.0},
        {"success", t.success},
        {"error", t.error ? json(*t.error) : json(nullptr)},
    };
}

void from_json(const json& j, ToolInvocation& t) {
    t.id = j.value("id", "");
    t.tool_name = j.at("tool_name").get<std::string>();
    t.arguments = j.value("arguments", json::object());
    t.result = j.contains("result") ? j["result"] : json(nullptr);
    t.timestamp = timestamp_from(j, "timestamp");
    t.duration = std::chrono::milliseconds{std::llround(j.value("duration", 0.0) * 1000.0)};
    t.success = j.value("success", true);
    if (j.contains("error") && !j["error"].is_null()) {
        t.error = j["error"].get<std::string>();
    } else {
        t.error.reset();
    }
}

// -- Session -----------------------------------------------------------------

Session::Session() : Session(utils::generate_uuid()) {}

Session::Session(std::string id)
    : id_(std::move(id)), created_at_(utils::now()), updated_at_(created_at_) {}

auto Session::last_message() const -> const Message* {
    return messages_.empty() ? nullptr : &messages_.back();
}

auto Session::messages_by_role(Role role) const -> std::vector<Message> {
    std::vector<Message> out;
    std::ranges::copy_if(messages_, std::back_inserter(out),
                         [role](const Message& m) { return m.role == role; });
    return out;
}

void Session::add_message(Message message) {
    if (message.timestamp == Timestamp{}) {
        message.timestamp = utils::now();
    }
    messages_.push_back(std::move(message));
    touch();
}

void Session::add_messages(std::vector<Message> messages) {
    for (auto& msg : messages) {
        if (msg.timestamp == Timestamp{}) msg.timestamp = utils::now();
        messages_.push_back(std::move(msg));
    }
    touch();
}

void Session::replace_messages(std::vector<Message> messages) {
    messages_ = std::move(messages);
    touch();
}

void Session::record_tool(ToolInvocation invocation) {
    if (invocation.id.empty()) {
        invocation.id = utils::generate_id();
    }
    if (invocation.timestamp == Timestamp{}) {
        invocation.timestamp = utils::now();
    }
    tool_history_.push_back(std::move(invocation));
    touch();
}

void Session::update_usage(int64_t prompt_tokens, int64_t completion_tokens) {
    prompt_tokens_ += std::max<int64_t>(prompt_tokens, 0);
    completion_tokens_ += std::max<int64_t>(completion_tokens, 0);
    touch();
}

void Session::reset_usage() {
    prompt_tokens_ = 0;
    completion_tokens_ = 0;
    touch();
}

void Session::set_title(std::string title) {
    title_ = std::move(title);
    touch();
}

void Session::set_working_dir(std::string dir) {
    working_dir_ = std::move(dir);
    touch();
}

void Session::set_model(std::string model) {
    model_ = std::move(model);
    touch();
}

auto Session::add_tag(const std::string& tag) -> bool {
    auto inserted = tags_.insert(tag).second;
    if (inserted) touch();
    return inserted;
}

auto Session::remove_tag(const std::string& tag) -> bool {
    auto erased = tags_.erase(tag) > 0;
    if (erased) touch();
    return erased;
}

void Session::set_metadata(const std::string& key, json value) {
    metadata_[key] = std::move(value);
    touch();
}

auto Session::erase_metadata(const std::string& key) -> bool {
    auto erased = metadata_.erase(key) > 0;
    if (erased) touch();
    return erased;
}

void Session::touch() {
    updated_at_ = std::max(updated_at_, utils::now());
}

void to_json(json& j, const Session& s) {
    j = json{
        {"version", kSessionFormatVersion},
        {"id", s.id_},
        {"title", s.title_},
        {"created_at", utils::format_iso8601(s.created_at_)},
        {"updated_at", utils::format_iso8601(s.updated_at_)},
        {"working_dir", s.working_dir_},
        {"model", s.model_},
        {"messages", s.messages_},
        {"tool_history", s.tool_history_},
        {"total_prompt_tokens", s.prompt_tokens_},
        {"total_completion_tokens", s.completion_tokens_},
        {"tags", s.tags_},
        {"metadata", s.metadata_},
    };
}

void from_json(const json& j, Session& s) {
    auto id = j.at("id").get<std::string>();
    if (id.empty()) {
        throw std::invalid_argument("Session file has an empty id");
    }
    s.id_ = std::move(id);
    s.title_ = j.value("title", "");
    s.created_at_ = timestamp_from(j, "created_at");
    s.updated_at_ = timestamp_from(j, "updated_at");
    s.working_dir_ = j.value("working_dir", "");
    s.model_ = j.value("model", "");
    s.messages_ = j.value("messages", std::vector<Message>{});
    s.tool_history_ = j.value("tool_history", std::vector<ToolInvocation>{});
    s.prompt_tokens_ = j.value("total_prompt_tokens", int64_t{0});
    s.completion_tokens_ = j.value("total_completion_tokens", int64_t{0});
    s.tags_ = j.value("tags", std::set<std::string>{});
    s.metadata_ = j.value("metadata", json::object());
    if (!s.metadata_.is_object()) {
        throw std::invalid_argument("Session metadata must be an object");
    }
}

// -- SessionSummary ----------------------------------------------------------

auto SessionSummary::from(const Session& session) -> SessionSummary {
    return SessionSummary{
        .id = session.id(),
        .title = session.title(),
        .created_at = session.created_at(),
        .updated_at = session.updated_at(),
        .message_count = session.message_count(),
        .total_tokens = session.total_tokens(),
        .tags = session.tags(),
        .working_dir = session.working_dir(),
        .model = session.model(),
    };
}

void to_json(json& j, const SessionSummary& s) {
    j = json{
        {"id", s.id},
        {"title", s.title},
        {"created_at", utils::format_iso8601(s.created_at)},
        {"updated_at", utils::format_iso8601(s.updated_at)},
        {"message_count", s.message_count},
        {"total_tokens", s.total_tokens},
        {"tags", s.tags},
        {"working_dir", s.working_dir},
        {"model", s.model},
    };
}

void from_json(const json& j, SessionSummary& s) {
    s.id = j.at("id").get<std::string>();
    s.title = j.value("title", "");
    s.created_at = timestamp_from(j, "created_at");
    s.updated_at = timestamp_from(j, "updated_at");
    s.message_count = j.value("message_count", size_t{0});
    s.total_tokens = j.value("total_tokens", int64_t{0});
    s.tags = j.value("tags", std::set<std::string>{});
    s.working_dir = j.value("working_dir", "");
    s.model = j.value("model", "");
}

} // namespace chatvault::sessions
