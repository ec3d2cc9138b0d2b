#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string_view>
#include <vector>

#include "chatvault/context/tokens.hpp"
#include "chatvault/core/config.hpp"
#include "chatvault/core/error.hpp"
#include "chatvault/core/types.hpp"

namespace chatvault::context {

/// Name carried by the synthetic "[N messages omitted]" message.
inline constexpr std::string_view kOmissionMarkerName = "omission_marker";

/// A truncation policy: a pure transformation of a message list.
///
/// Every implementation guarantees that the result's estimated cost fits
/// the budget whenever a shrinking solution exists, that surviving messages
/// keep their relative order, and that the only content it fabricates is a
/// clearly named omission marker. Input that already fits is returned
/// unchanged, except by SlidingWindowStrategy which ignores the budget.
class TruncationStrategy {
public:
    virtual ~TruncationStrategy() = default;

    [[nodiscard]] virtual auto truncate(const std::vector<Message>& messages,
                                        int64_t budget,
                                        const TokenEstimator& estimator) const
        -> std::vector<Message> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Indices of messages that must be evicted together: an assistant turn
/// carrying tool calls plus every tool result answering one of those calls.
/// Every other message forms a group of one. Groups are ordered by their
/// first index.
[[nodiscard]] auto eviction_groups(const std::vector<Message>& messages)
    -> std::vector<std::vector<size_t>>;

[[nodiscard]] auto is_omission_marker(const Message& message) -> bool;

/// Keeps the last N messages, plus every system message when preserve_system
/// is set. Budget is not consulted. The window holds whole eviction groups
/// only, so it may keep fewer than N; the newest group is kept even when it
/// alone is larger than N.
class SlidingWindowStrategy : public TruncationStrategy {
public:
    explicit SlidingWindowStrategy(size_t window_size = 20, bool preserve_system = true);

    [[nodiscard]] auto truncate(const std::vector<Message>& messages, int64_t budget,
                                const TokenEstimator& estimator) const
        -> std::vector<Message> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "sliding_window"; }

private:
    size_t window_size_;
    bool preserve_system_;
};

/// Drops the oldest non-system eviction group until the list fits.
class TokenBudgetStrategy : public TruncationStrategy {
public:
    explicit TokenBudgetStrategy(bool preserve_system = true);

    [[nodiscard]] auto truncate(const std::vector<Message>& messages, int64_t budget,
                                const TokenEstimator& estimator) const
        -> std::vector<Message> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "token_budget"; }

private:
    bool preserve_system_;
};

/// Keeps the first K and last M non-system messages with a single
/// "[N messages omitted]" marker at the gap. If that still does not fit,
/// the tail shrinks (down to one) and then the head (down to zero).
/// Head and tail are made of whole eviction groups.
class SmartTruncationStrategy : public TruncationStrategy {
public:
    SmartTruncationStrategy(size_t preserve_first = 2, size_t preserve_last = 10,
                            bool preserve_system = true);

    [[nodiscard]] auto truncate(const std::vector<Message>& messages, int64_t budget,
                                const TokenEstimator& estimator) const
        -> std::vector<Message> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "smart"; }

private:
    size_t preserve_first_;
    size_t preserve_last_;
    bool preserve_system_;
};

/// Always keeps messages whose role is in the preserve set or that are
/// pinned; the rest are evicted oldest group first until the list fits.
class SelectiveStrategy : public TruncationStrategy {
public:
    explicit SelectiveStrategy(std::set<Role> preserve_roles = {Role::System},
                               bool preserve_pinned = true);

    [[nodiscard]] auto truncate(const std::vector<Message>& messages, int64_t budget,
                                const TokenEstimator& estimator) const
        -> std::vector<Message> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "selective"; }

private:
    std::set<Role> preserve_roles_;
    bool preserve_pinned_;
};

/// Runs stages in order, each on the previous stage's output, and stops as
/// soon as the list fits.
class CompositeStrategy : public TruncationStrategy {
public:
    explicit CompositeStrategy(std::vector<std::shared_ptr<const TruncationStrategy>> stages);

    [[nodiscard]] auto truncate(const std::vector<Message>& messages, int64_t budget,
                                const TokenEstimator& estimator) const
        -> std::vector<Message> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "composite"; }

    [[nodiscard]] auto stage_count() const noexcept -> size_t { return stages_.size(); }

private:
    std::vector<std::shared_ptr<const TruncationStrategy>> stages_;
};

/// Builds the strategy for a context mode: "sliding_window", "token_budget",
/// "smart", "selective", or "summarize" (smart truncation behind the
/// compactor).
[[nodiscard]] auto make_strategy(std::string_view mode, const ContextConfig& config)
    -> Result<std::shared_ptr<const TruncationStrategy>>;

} // namespace chatvault::context
