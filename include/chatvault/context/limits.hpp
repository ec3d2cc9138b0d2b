#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatvault/context/tokens.hpp"
#include "chatvault/core/types.hpp"

namespace chatvault::context {

struct ModelLimits {
    int64_t context_window = 32768;
    int64_t max_output = 4096;
};

/// Limits assumed for models missing from the table.
inline constexpr ModelLimits kDefaultModelLimits{32768, 4096};

/// Looks a model up in the known-model table. A leading "provider/" or
/// "provider:" is ignored; exact matches win over the longest prefix match.
[[nodiscard]] auto lookup_model_limits(std::string_view model) -> std::optional<ModelLimits>;

/// Like lookup_model_limits(), falling back to kDefaultModelLimits.
[[nodiscard]] auto limits_for(std::string_view model) -> ModelLimits;

/// Breakdown of a context window.
struct ContextBudget {
    int64_t total = 0;
    int64_t reserved_output = 0;
    int64_t system_overhead = 0;
    int64_t tool_overhead = 0;

    /// Tokens left for conversation messages, never negative.
    [[nodiscard]] auto available() const noexcept -> int64_t {
        auto left = total - reserved_output - system_overhead - tool_overhead;
        return left > 0 ? left : 0;
    }
};

void to_json(nlohmann::json& j, const ContextBudget& b);

/// Tracks token usage of a conversation against a model's context window.
///
/// current_tokens() is always the system prompt plus tool schemas plus
/// message_tokens(), and message_tokens() equals the estimator's
/// count_messages() over the tracked list however it was built: the reply
/// priming is charged once while any message is tracked.
class BudgetTracker {
public:
    BudgetTracker(std::string_view model, std::shared_ptr<const TokenEstimator> estimator);
    BudgetTracker(ModelLimits limits, std::shared_ptr<const TokenEstimator> estimator);

    void set_system_prompt(std::string_view prompt);
    void set_tool_schemas(const std::vector<nlohmann::json>& schemas);

    void add(const Message& message);
    void set_messages(const std::vector<Message>& messages);

    /// Clears tracked messages. System prompt and tool schemas are kept.
    void reset();

    [[nodiscard]] auto current_tokens() const noexcept -> int64_t;
    [[nodiscard]] auto exceeds_limit() const noexcept -> bool;
    [[nodiscard]] auto available() const noexcept -> int64_t;

    /// Fraction of the usable window (total minus reserved output) in use.
    [[nodiscard]] auto utilization() const noexcept -> double;

    [[nodiscard]] auto budget() const noexcept -> ContextBudget;

    /// Tokens the message list alone may occupy.
    [[nodiscard]] auto message_budget() const noexcept -> int64_t;

    [[nodiscard]] auto limits() const noexcept -> const ModelLimits& { return limits_; }
    [[nodiscard]] auto message_tokens() const noexcept -> int64_t;
    [[nodiscard]] auto system_tokens() const noexcept -> int64_t { return system_tokens_; }
    [[nodiscard]] auto tool_tokens() const noexcept -> int64_t { return tool_tokens_; }

private:
    ModelLimits limits_;
    std::shared_ptr<const TokenEstimator> estimator_;
    int64_t system_tokens_ = 0;
    int64_t tool_tokens_ = 0;
    int64_t message_tokens_ = 0;  // sum of count_message(), without priming
    size_t message_count_ = 0;
};

} // namespace chatvault::context
