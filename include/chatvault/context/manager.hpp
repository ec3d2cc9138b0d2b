#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "chatvault/context/compaction.hpp"
#include "chatvault/context/limits.hpp"
#include "chatvault/context/strategies.hpp"
#include "chatvault/context/tokens.hpp"
#include "chatvault/core/config.hpp"
#include "chatvault/core/error.hpp"
#include "chatvault/providers/provider.hpp"

namespace chatvault::context {

using boost::asio::awaitable;

/// Assembles a bounded message list for one model request.
///
/// Owns the estimator, budget tracker and truncation strategy for a model,
/// plus a compactor when a provider is supplied.
class ContextManager {
public:
    /// @throws std::invalid_argument if config.mode names no strategy.
    ContextManager(std::string model, ContextConfig config,
                   std::shared_ptr<providers::Provider> provider = nullptr);

    void set_system_prompt(std::string_view prompt);
    void set_tool_schemas(const std::vector<nlohmann::json>& schemas);

    auto set_mode(std::string_view mode) -> VoidResult;
    [[nodiscard]] auto mode() const noexcept -> const std::string& { return config_.mode; }

    /// Shrinks `messages` to fit the message budget. Falls back to a plain
    /// token-budget pass if the configured strategy leaves it over, and
    /// returns BudgetExceeded if even that cannot fit.
    auto prepare(const std::vector<Message>& messages) -> Result<std::vector<Message>>;

    /// Summarizes old turns once utilization reaches `threshold`. Returns
    /// the input unchanged below it or when no compactor is configured.
    auto compact_if_needed(std::vector<Message> messages, double threshold)
        -> awaitable<std::vector<Message>>;

    /// Same as compact_if_needed() using the configured compact_threshold.
    auto compact_if_needed(std::vector<Message> messages) -> awaitable<std::vector<Message>>;

    /// Token usage snapshot for `messages`: token_count, max_tokens,
    /// available, utilization_percent, message_count, mode.
    [[nodiscard]] auto stats(const std::vector<Message>& messages) -> nlohmann::json;

    [[nodiscard]] auto tracker() noexcept -> BudgetTracker& { return tracker_; }
    [[nodiscard]] auto estimator() const noexcept -> const std::shared_ptr<CachingEstimator>& {
        return estimator_;
    }
    [[nodiscard]] auto strategy() const noexcept -> const TruncationStrategy& { return *strategy_; }
    [[nodiscard]] auto compactor() noexcept -> ContextCompactor* { return compactor_.get(); }
    [[nodiscard]] auto model() const noexcept -> const std::string& { return model_; }

private:
    std::string model_;
    ContextConfig config_;
    std::shared_ptr<CachingEstimator> estimator_;
    BudgetTracker tracker_;
    std::shared_ptr<const TruncationStrategy> strategy_;
    std::unique_ptr<ContextCompactor> compactor_;
};

} // namespace chatvault::context
