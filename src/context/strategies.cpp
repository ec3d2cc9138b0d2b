#include "chatvault/context/strategies.hpp"

#include <algorithm>
#include <charconv>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "chatvault/core/logger.hpp"

namespace chatvault::context {

namespace {

using ProtectedFn = std::function<bool(const Message&)>;

/// Drops the oldest unprotected eviction group until the list fits.
/// A group with any protected member is kept whole.
auto evict_oldest(const std::vector<Message>& messages, int64_t budget,
                  const TokenEstimator& estimator, const ProtectedFn& is_protected)
    -> std::vector<Message> {
    if (estimator.count_messages(messages) <= budget) {
        return messages;
    }

    std::vector<int64_t> costs;
    costs.reserve(messages.size());
    int64_t body = 0;
    for (const auto& msg : messages) {
        costs.push_back(estimator.count_message(msg));
        body += costs.back();
    }

    std::vector<bool> kept(messages.size(), true);
    size_t remaining = messages.size();
    auto total = [&] {
        return remaining == 0 ? int64_t{0} : body + TokenEstimator::kReplyPriming;
    };

    for (const auto& group : eviction_groups(messages)) {
        if (total() <= budget) break;

        bool locked = std::ranges::any_of(group, [&](size_t i) {
            return is_protected(messages[i]);
        });
        if (locked) continue;

        for (auto i : group) {
            kept[i] = false;
            body -= costs[i];
            --remaining;
        }
    }

    std::vector<Message> result;
    result.reserve(remaining);
    for (size_t i = 0; i < messages.size(); ++i) {
        if (kept[i]) result.push_back(messages[i]);
    }

    if (total() > budget) {
        LOG_DEBUG("Protected messages alone exceed budget ({} > {})", total(), budget);
    }
    return result;
}

auto marker_count(const Message& marker) -> size_t {
    std::string_view text = marker.content;
    if (text.empty() || text.front() != '[') return 0;
    size_t value = 0;
    std::from_chars(text.data() + 1, text.data() + text.size(), value);
    return value;
}

auto make_marker(size_t omitted, Timestamp at) -> Message {
    return Message{
        .role = Role::System,
        .content = "[" + std::to_string(omitted) + " messages omitted]",
        .name = std::string(kOmissionMarkerName),
        .timestamp = at,
    };
}

} // namespace

auto eviction_groups(const std::vector<Message>& messages)
    -> std::vector<std::vector<size_t>> {
    std::vector<std::vector<size_t>> groups;
    std::unordered_map<std::string, size_t> owner;  // tool call id -> group

    for (size_t i = 0; i < messages.size(); ++i) {
        const auto& msg = messages[i];
        if (msg.role == Role::Tool && msg.tool_call_id) {
            if (auto it = owner.find(*msg.tool_call_id); it != owner.end()) {
                groups[it->second].push_back(i);
                continue;
            }
        }
        groups.push_back({i});
        if (msg.role == Role::Assistant) {
            for (const auto& call : msg.tool_calls) {
                owner[call.id] = groups.size() - 1;
            }
        }
    }
    return groups;
}

auto is_omission_marker(const Message& message) -> bool {
    return message.role == Role::System && message.name &&
           *message.name == kOmissionMarkerName;
}

// -- SlidingWindowStrategy ---------------------------------------------------

SlidingWindowStrategy::SlidingWindowStrategy(size_t window_size, bool preserve_system)
    : window_size_(window_size), preserve_system_(preserve_system) {}

auto SlidingWindowStrategy::truncate(const std::vector<Message>& messages,
                                     int64_t /*budget*/,
                                     const TokenEstimator& /*estimator*/) const
    -> std::vector<Message> {
    auto keeps_always = [&](const Message& m) {
        return preserve_system_ && m.role == Role::System;
    };

    // Walk groups newest first; the window ends at the first group that
    // would overflow it, so a tool call never loses its results.
    std::vector<bool> kept(messages.size(), false);
    size_t taken = 0;
    bool closed = false;
    auto groups = eviction_groups(messages);
    for (auto it = groups.rbegin(); it != groups.rend(); ++it) {
        const auto& group = *it;
        if (keeps_always(messages[group.front()])) {
            kept[group.front()] = true;
            continue;
        }
        bool newest = taken == 0 && window_size_ > 0;
        if (closed || (!newest && taken + group.size() > window_size_)) {
            closed = true;
            continue;
        }
        taken += group.size();
        for (auto i : group) kept[i] = true;
    }

    std::vector<Message> result;
    for (size_t i = 0; i < messages.size(); ++i) {
        if (kept[i]) result.push_back(messages[i]);
    }
    return result;
}

// -- TokenBudgetStrategy -----------------------------------------------------

TokenBudgetStrategy::TokenBudgetStrategy(bool preserve_system)
    : preserve_system_(preserve_system) {}

auto TokenBudgetStrategy::truncate(const std::vector<Message>& messages, int64_t budget,
                                   const TokenEstimator& estimator) const
    -> std::vector<Message> {
    return evict_oldest(messages, budget, estimator, [this](const Message& m) {
        return preserve_system_ && m.role == Role::System;
    });
}

// -- SmartTruncationStrategy -------------------------------------------------

SmartTruncationStrategy::SmartTruncationStrategy(size_t preserve_first, size_t preserve_last,
                                                 bool preserve_system)
    : preserve_first_(preserve_first),
      preserve_last_(preserve_last),
      preserve_system_(preserve_system) {}

auto SmartTruncationStrategy::truncate(const std::vector<Message>& messages, int64_t budget,
                                       const TokenEstimator& estimator) const
    -> std::vector<Message> {
    if (estimator.count_messages(messages) <= budget) {
        return messages;
    }

    // Markers left by an earlier pass are folded into the new one.
    size_t prior_omitted = 0;
    size_t candidate_messages = 0;
    std::vector<std::vector<size_t>> candidates;
    for (auto& group : eviction_groups(messages)) {
        const auto& first = messages[group.front()];
        if (is_omission_marker(first)) {
            prior_omitted += marker_count(first);
        } else if (!(preserve_system_ && first.role == Role::System)) {
            candidate_messages += group.size();
            candidates.push_back(std::move(group));
        }
    }

    // `head` and `tail` are message counts; only whole groups are kept, and
    // the newest group always survives while `tail` is at least one.
    auto build = [&](size_t head, size_t tail) {
        size_t head_end = 0;
        for (size_t taken = 0; head_end < candidates.size() &&
                               taken + candidates[head_end].size() <= head;
             ++head_end) {
            taken += candidates[head_end].size();
        }
        size_t tail_begin = candidates.size();
        for (size_t taken = 0; tail_begin > head_end; --tail_begin) {
            auto size = candidates[tail_begin - 1].size();
            bool newest = taken == 0 && tail > 0;
            if (!newest && taken + size > tail) break;
            taken += size;
        }

        std::unordered_set<size_t> dropped;
        for (size_t g = head_end; g < tail_begin; ++g) {
            dropped.insert(candidates[g].begin(), candidates[g].end());
        }
        auto omitted = dropped.size() + prior_omitted;

        std::vector<Message> out;
        out.reserve(messages.size() - dropped.size() + 1);
        bool marker_placed = false;
        for (size_t i = 0; i < messages.size(); ++i) {
            bool gap = dropped.contains(i) || is_omission_marker(messages[i]);
            if (!gap) {
                out.push_back(messages[i]);
                continue;
            }
            if (!marker_placed && omitted > 0) {
                out.push_back(make_marker(omitted, messages[i].timestamp));
                marker_placed = true;
            }
        }
        return out;
    };

    size_t head = std::min(preserve_first_, candidate_messages);
    size_t tail = std::min(preserve_last_, candidate_messages - head);
    auto result = build(head, tail);

    while (estimator.count_messages(result) > budget) {
        if (tail > 1) {
            --tail;
        } else if (head > 0) {
            --head;
        } else {
            break;
        }
        result = build(head, tail);
    }
    return result;
}

// -- SelectiveStrategy -------------------------------------------------------

SelectiveStrategy::SelectiveStrategy(std::set<Role> preserve_roles, bool preserve_pinned)
    : preserve_roles_(std::move(preserve_roles)), preserve_pinned_(preserve_pinned) {}

auto SelectiveStrategy::truncate(const std::vector<Message>& messages, int64_t budget,
                                 const TokenEstimator& estimator) const
    -> std::vector<Message> {
    return evict_oldest(messages, budget, estimator, [this](const Message& m) {
        return preserve_roles_.contains(m.role) || (preserve_pinned_ && m.pinned);
    });
}

// -- CompositeStrategy -------------------------------------------------------

CompositeStrategy::CompositeStrategy(
    std::vector<std::shared_ptr<const TruncationStrategy>> stages)
    : stages_(std::move(stages)) {}

auto CompositeStrategy::truncate(const std::vector<Message>& messages, int64_t budget,
                                 const TokenEstimator& estimator) const
    -> std::vector<Message> {
    auto current = messages;
    for (const auto& stage : stages_) {
        if (estimator.count_messages(current) <= budget) break;
        current = stage->truncate(current, budget, estimator);
        LOG_DEBUG("Composite stage '{}' left {} messages", stage->name(), current.size());
    }
    return current;
}

auto make_strategy(std::string_view mode, const ContextConfig& config)
    -> Result<std::shared_ptr<const TruncationStrategy>> {
    if (mode == "sliding_window") {
        return std::make_shared<SlidingWindowStrategy>(config.window_size);
    }
    if (mode == "token_budget") {
        return std::make_shared<TokenBudgetStrategy>();
    }
    if (mode == "smart" || mode == "summarize") {
        return std::make_shared<SmartTruncationStrategy>(config.preserve_first,
                                                         config.preserve_last);
    }
    if (mode == "selective") {
        return std::make_shared<SelectiveStrategy>();
    }
    return std::unexpected(make_error(ErrorCode::InvalidConfig,
        "Unknown context mode", std::string(mode)));
}

} // namespace chatvault::context
