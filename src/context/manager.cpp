#include "chatvault/context/manager.hpp"

#include <cmath>
#include <stdexcept>

#include "chatvault/core/logger.hpp"

namespace chatvault::context {

ContextManager::ContextManager(std::string model, ContextConfig config,
                               std::shared_ptr<providers::Provider> provider)
    : model_(std::move(model)),
      config_(std::move(config)),
      estimator_(make_estimator(model_, config_)),
      tracker_(model_, estimator_) {
    auto strategy = make_strategy(config_.mode, config_);
    if (!strategy) {
        throw std::invalid_argument(strategy.error().what());
    }
    strategy_ = std::move(*strategy);

    if (provider) {
        CompactorConfig cc;
        cc.message_floor = config_.compaction_message_floor;
        cc.preserve_last = config_.compaction_preserve_last;
        cc.min_messages = config_.compaction_min_messages;
        cc.max_summary_tokens = config_.max_summary_tokens;
        cc.timeout = std::chrono::seconds(config_.compaction_timeout_seconds);
        cc.model = model_;
        compactor_ = std::make_unique<ContextCompactor>(std::move(provider), std::move(cc));
    }

    LOG_DEBUG("Context manager for '{}': mode={}, window={} tokens", model_,
              config_.mode, tracker_.limits().context_window);
}

void ContextManager::set_system_prompt(std::string_view prompt) {
    tracker_.set_system_prompt(prompt);
}

void ContextManager::set_tool_schemas(const std::vector<nlohmann::json>& schemas) {
    tracker_.set_tool_schemas(schemas);
}

auto ContextManager::set_mode(std::string_view mode) -> VoidResult {
    auto strategy = make_strategy(mode, config_);
    if (!strategy) {
        return std::unexpected(strategy.error());
    }
    strategy_ = std::move(*strategy);
    config_.mode = std::string(mode);
    return {};
}

auto ContextManager::prepare(const std::vector<Message>& messages)
    -> Result<std::vector<Message>> {
    auto budget = tracker_.message_budget();

    auto result = strategy_->truncate(messages, budget, *estimator_);
    auto cost = estimator_->count_messages(result);

    if (cost > budget) {
        LOG_DEBUG("Strategy '{}' left {} tokens over a {} budget, applying token budget",
                  strategy_->name(), cost, budget);
        result = TokenBudgetStrategy{}.truncate(result, budget, *estimator_);
        cost = estimator_->count_messages(result);
    }

    if (cost > budget) {
        return std::unexpected(make_error(ErrorCode::BudgetExceeded,
            "Context does not fit the model budget",
            std::to_string(cost) + " > " + std::to_string(budget) + " tokens"));
    }

    if (result.size() != messages.size()) {
        LOG_INFO("Context truncated from {} to {} messages ({} tokens)",
                 messages.size(), result.size(), cost);
    }
    tracker_.set_messages(result);
    return result;
}

auto ContextManager::compact_if_needed(std::vector<Message> messages, double threshold)
    -> awaitable<std::vector<Message>> {
    if (!compactor_) {
        co_return messages;
    }

    tracker_.set_messages(messages);
    if (tracker_.utilization() < threshold) {
        co_return messages;
    }

    LOG_INFO("Context at {:.0f}% of budget, compacting", tracker_.utilization() * 100.0);
    auto compacted = co_await compactor_->compact(std::move(messages));
    tracker_.set_messages(compacted);
    co_return compacted;
}

auto ContextManager::compact_if_needed(std::vector<Message> messages)
    -> awaitable<std::vector<Message>> {
    co_return co_await compact_if_needed(std::move(messages), config_.compact_threshold);
}

auto ContextManager::stats(const std::vector<Message>& messages) -> nlohmann::json {
    tracker_.set_messages(messages);
    auto usable = tracker_.limits().context_window - tracker_.limits().max_output;
    return nlohmann::json{
        {"token_count", tracker_.current_tokens()},
        {"max_tokens", usable},
        {"available", tracker_.available()},
        {"utilization_percent", std::round(tracker_.utilization() * 1000.0) / 10.0},
        {"message_count", messages.size()},
        {"mode", config_.mode},
        {"budget", tracker_.budget()},
    };
}

} // namespace chatvault::context
