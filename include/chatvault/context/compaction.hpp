#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "chatvault/context/tokens.hpp"
#include "chatvault/core/error.hpp"
#include "chatvault/core/types.hpp"
#include "chatvault/providers/provider.hpp"

namespace chatvault::context {

using boost::asio::awaitable;

/// Name carried by the synthetic summary message.
inline constexpr std::string_view kSummaryMessageName = "compaction_summary";
inline constexpr std::string_view kSummaryPrefix = "[Previous conversation summary]\n";

struct CompactorConfig {
    size_t message_floor = 20;   // compaction runs only above this many messages
    size_t preserve_last = 10;   // most recent messages never summarized
    size_t min_messages = 5;     // shortest run worth summarizing
    int max_summary_tokens = 500;
    std::chrono::milliseconds timeout{30000};
    std::string model;           // forwarded to the provider; empty = provider default
};

/// Replaces the oldest run of old turns with one model-written summary.
///
/// Compaction never fails from the caller's point of view: a provider
/// error, exception, empty reply or timeout leaves the input untouched and
/// is logged as a warning.
class ContextCompactor {
public:
    ContextCompactor(std::shared_ptr<providers::Provider> provider, CompactorConfig config = {});

    /// Returns the compacted list, or `messages` unchanged if nothing could
    /// be (or should be) summarized.
    auto compact(std::vector<Message> messages) -> awaitable<std::vector<Message>>;

    /// Asks the provider for a summary of `messages`, bounded by the
    /// configured timeout.
    auto summarize(const std::vector<Message>& messages) -> awaitable<Result<std::string>>;

    /// Half-open range [first, last) of the run compact() would replace:
    /// the oldest contiguous non-pinned non-system messages before the
    /// preserved tail, never splitting a tool call from its results.
    [[nodiscard]] auto find_run(const std::vector<Message>& messages) const
        -> std::optional<std::pair<size_t, size_t>>;

    /// One "role: content" line per message, long content cut with "...".
    [[nodiscard]] static auto format_for_summary(const std::vector<Message>& messages)
        -> std::string;

    [[nodiscard]] auto config() const noexcept -> const CompactorConfig& { return config_; }

private:
    std::shared_ptr<providers::Provider> provider_;
    CompactorConfig config_;
};

/// Caps the size of individual tool results.
class ToolResultCompactor {
public:
    explicit ToolResultCompactor(int64_t max_result_tokens = 1000);

    /// Truncates `text` near the token ceiling, preferring a newline or
    /// space boundary, and appends "[Output truncated - N tokens removed]".
    [[nodiscard]] auto compact_result(const std::string& text,
                                      const TokenEstimator& estimator) const -> std::string;

    /// Applies compact_result() to a tool-role message; any other message is
    /// returned as is.
    [[nodiscard]] auto compact_message(const Message& message,
                                       const TokenEstimator& estimator) const -> Message;

    [[nodiscard]] auto max_result_tokens() const noexcept -> int64_t { return max_result_tokens_; }

private:
    int64_t max_result_tokens_;
};

} // namespace chatvault::context
