#include "chatvault/context/compaction.hpp"

#include <algorithm>
#include <variant>

#include <boost/asio/experimental/awaitable_operators.hpp>

#include "chatvault/context/strategies.hpp"
#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::context {

namespace {

constexpr size_t kMaxSummaryLineChars = 500;
constexpr int64_t kTruncationNoticeReserve = 50;
constexpr size_t kBoundarySearchWindow = 100;

constexpr std::string_view kSummaryInstruction =
    "Summarize the following conversation so it can replace the original "
    "messages. Keep decisions made, files and commands involved, open tasks, "
    "and any facts the assistant will need later. Be concise.";

auto eligible(const Message& m) -> bool {
    return !m.pinned && m.role != Role::System;
}

} // namespace

// -- ContextCompactor --------------------------------------------------------

ContextCompactor::ContextCompactor(std::shared_ptr<providers::Provider> provider,
                                   CompactorConfig config)
    : provider_(std::move(provider)), config_(std::move(config)) {}

auto ContextCompactor::find_run(const std::vector<Message>& messages) const
    -> std::optional<std::pair<size_t, size_t>> {
    if (messages.size() <= config_.preserve_last) return std::nullopt;
    const size_t limit = messages.size() - config_.preserve_last;

    size_t first = 0;
    while (first < limit && !eligible(messages[first])) ++first;
    size_t last = first;
    while (last < limit && eligible(messages[last])) ++last;

    // Map each index to its eviction group so the run never splits a pair.
    std::vector<size_t> group_of(messages.size());
    std::vector<std::pair<size_t, size_t>> bounds;  // min, max index per group
    for (const auto& group : eviction_groups(messages)) {
        for (auto i : group) group_of[i] = bounds.size();
        bounds.emplace_back(group.front(), group.back());
    }

    bool changed = true;
    while (changed && first < last) {
        changed = false;
        if (bounds[group_of[last - 1]].second >= last) {
            last = bounds[group_of[last - 1]].first;
            changed = true;
        }
        if (first < last && bounds[group_of[first]].first < first) {
            ++first;
            changed = true;
        }
    }

    if (last < first || last - first < std::max<size_t>(config_.min_messages, 1)) {
        return std::nullopt;
    }
    return std::make_pair(first, last);
}

auto ContextCompactor::format_for_summary(const std::vector<Message>& messages)
    -> std::string {
    std::string out;
    for (const auto& msg : messages) {
        std::string content = msg.content;
        if (content.size() > kMaxSummaryLineChars) {
            content = content.substr(0, kMaxSummaryLineChars) + "...";
        }
        if (!out.empty()) out += '\n';
        out += role_to_string(msg.role);
        out += ": ";
        out += content;
        for (const auto& call : msg.tool_calls) {
            out += " [tool call: " + call.name + "]";
        }
    }
    return out;
}

auto ContextCompactor::summarize(const std::vector<Message>& messages)
    -> awaitable<Result<std::string>> {
    using namespace boost::asio::experimental::awaitable_operators;

    if (!provider_) {
        co_return make_fail(make_error(ErrorCode::ProviderError,
            "No provider configured for summarization"));
    }

    providers::CompletionRequest req;
    req.model = config_.model;
    req.system_prompt = std::string(kSummaryInstruction);
    req.max_tokens = config_.max_summary_tokens;
    req.messages.push_back(Message::user(format_for_summary(messages)));

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer deadline(executor, config_.timeout);

    std::variant<Result<providers::CompletionResponse>, std::monostate> outcome;
    try {
        outcome = co_await (provider_->complete(std::move(req)) ||
                            deadline.async_wait(boost::asio::use_awaitable));
    } catch (const std::exception& e) {
        co_return make_fail(make_error(ErrorCode::ProviderError,
            "Summarization request threw", e.what()));
    }

    if (outcome.index() == 1) {
        co_return make_fail(make_error(ErrorCode::Timeout,
            "Summarization timed out",
            std::to_string(config_.timeout.count()) + "ms"));
    }

    auto response = std::get<0>(std::move(outcome));
    if (!response) {
        co_return make_fail(response.error());
    }

    auto text = utils::trim(response->text);
    if (text.empty()) {
        co_return make_fail(make_error(ErrorCode::ProviderError,
            "Provider returned an empty summary"));
    }
    co_return text;
}

auto ContextCompactor::compact(std::vector<Message> messages)
    -> awaitable<std::vector<Message>> {
    if (messages.size() <= config_.message_floor) {
        co_return messages;
    }

    auto run = find_run(messages);
    if (!run) {
        LOG_DEBUG("Compaction: no run of at least {} messages to summarize",
                  config_.min_messages);
        co_return messages;
    }
    auto [first, last] = *run;

    std::vector<Message> span(messages.begin() + static_cast<std::ptrdiff_t>(first),
                              messages.begin() + static_cast<std::ptrdiff_t>(last));
    auto summary = co_await summarize(span);
    if (!summary) {
        LOG_WARN("Compaction skipped, keeping {} messages: {}",
                 messages.size(), summary.error().what());
        co_return messages;
    }

    Message replacement{
        .role = Role::System,
        .content = std::string(kSummaryPrefix) + *summary,
        .name = std::string(kSummaryMessageName),
        .timestamp = span.back().timestamp,
    };

    std::vector<Message> result;
    result.reserve(messages.size() - span.size() + 1);
    std::move(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(first),
              std::back_inserter(result));
    result.push_back(std::move(replacement));
    std::move(messages.begin() + static_cast<std::ptrdiff_t>(last), messages.end(),
              std::back_inserter(result));

    LOG_INFO("Compacted {} messages into a summary ({} -> {} messages)",
             span.size(), messages.size(), result.size());
    co_return result;
}

// -- ToolResultCompactor -----------------------------------------------------

ToolResultCompactor::ToolResultCompactor(int64_t max_result_tokens)
    : max_result_tokens_(max_result_tokens) {}

auto ToolResultCompactor::compact_result(const std::string& text,
                                         const TokenEstimator& estimator) const
    -> std::string {
    auto tokens = estimator.count(text);
    if (tokens <= max_result_tokens_ || text.empty()) {
        return text;
    }

    auto target = std::max<int64_t>(max_result_tokens_ - kTruncationNoticeReserve, 1);
    auto chars_per_token = static_cast<double>(text.size()) / static_cast<double>(tokens);
    auto cut = std::min(text.size(),
                        static_cast<size_t>(static_cast<double>(target) * chars_per_token));

    // Prefer a line break, then a word break, close to the estimate.
    auto floor = cut > kBoundarySearchWindow ? cut - kBoundarySearchWindow : 0;
    auto head = std::string_view(text).substr(0, cut);
    if (auto nl = head.rfind('\n'); nl != std::string_view::npos && nl > floor) {
        cut = nl;
    } else if (auto sp = head.rfind(' '); sp != std::string_view::npos && sp > floor) {
        cut = sp;
    }
    // Never split a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    auto kept = text.substr(0, cut);
    auto removed = tokens - estimator.count(kept);
    return kept + "\n[Output truncated - " + std::to_string(removed) + " tokens removed]";
}

auto ToolResultCompactor::compact_message(const Message& message,
                                          const TokenEstimator& estimator) const
    -> Message {
    if (message.role != Role::Tool) {
        return message;
    }
    auto compacted = message;
    compacted.content = compact_result(message.content, estimator);
    return compacted;
}

} // namespace chatvault::context
