#include "chatvault/context/limits.hpp"

#include <stdexcept>
#include <utility>

#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::context {

namespace {

auto known_models() -> const std::vector<std::pair<std::string_view, ModelLimits>>& {
    static const std::vector<std::pair<std::string_view, ModelLimits>> table = {
        // Anthropic
        {"claude-opus-4", {200000, 32000}},
        {"claude-sonnet-4", {200000, 64000}},
        {"claude-3-7-sonnet", {200000, 64000}},
        {"claude-3-5-sonnet", {200000, 8192}},
        {"claude-3-5-haiku", {200000, 8192}},
        {"claude-3-opus", {200000, 4096}},
        {"claude-3-haiku", {200000, 4096}},
        {"claude", {200000, 4096}},
        // OpenAI
        {"gpt-4.1", {1047576, 32768}},
        {"gpt-4o-mini", {128000, 16384}},
        {"gpt-4o", {128000, 16384}},
        {"gpt-4-turbo", {128000, 4096}},
        {"gpt-4-32k", {32768, 4096}},
        {"gpt-4", {8192, 4096}},
        {"gpt-3.5-turbo", {16385, 4096}},
        {"o1-mini", {128000, 65536}},
        {"o1", {200000, 100000}},
        {"o3-mini", {200000, 100000}},
        {"o3", {200000, 100000}},
        {"o4-mini", {200000, 100000}},
        // Google
        {"gemini-2.5-pro", {1048576, 65536}},
        {"gemini-2.5-flash", {1048576, 65536}},
        {"gemini-2.0-flash", {1048576, 8192}},
        {"gemini-1.5-pro", {2097152, 8192}},
        {"gemini-1.5-flash", {1048576, 8192}},
        // Open weights
        {"llama-3.3", {131072, 4096}},
        {"llama-3.1", {131072, 4096}},
        {"llama3", {8192, 2048}},
        {"mistral-large", {131072, 4096}},
        {"mixtral-8x7b", {32768, 4096}},
        {"codestral", {262144, 4096}},
    };
    return table;
}

auto strip_provider(std::string id) -> std::string {
    if (auto sep = id.find_first_of("/:"); sep != std::string::npos) {
        return id.substr(sep + 1);
    }
    return id;
}

} // namespace

auto lookup_model_limits(std::string_view model) -> std::optional<ModelLimits> {
    auto id = strip_provider(utils::to_lower(utils::trim(model)));
    if (id.empty()) return std::nullopt;

    const auto& table = known_models();
    for (const auto& [name, limits] : table) {
        if (id == name) return limits;
    }

    std::optional<ModelLimits> best;
    size_t best_len = 0;
    for (const auto& [name, limits] : table) {
        if (id.starts_with(name) && name.size() > best_len) {
            best = limits;
            best_len = name.size();
        }
    }
    return best;
}

auto limits_for(std::string_view model) -> ModelLimits {
    if (auto limits = lookup_model_limits(model)) {
        return *limits;
    }
    LOG_WARN("Unknown model '{}', assuming {} token context window", model,
             kDefaultModelLimits.context_window);
    return kDefaultModelLimits;
}

void to_json(nlohmann::json& j, const ContextBudget& b) {
    j = nlohmann::json{
        {"total", b.total},
        {"reserved_output", b.reserved_output},
        {"system_overhead", b.system_overhead},
        {"tool_overhead", b.tool_overhead},
        {"available", b.available()},
    };
}

// -- BudgetTracker -----------------------------------------------------------

BudgetTracker::BudgetTracker(std::string_view model,
                             std::shared_ptr<const TokenEstimator> estimator)
    : BudgetTracker(limits_for(model), std::move(estimator)) {}

BudgetTracker::BudgetTracker(ModelLimits limits,
                             std::shared_ptr<const TokenEstimator> estimator)
    : limits_(limits), estimator_(std::move(estimator)) {
    if (!estimator_) {
        throw std::invalid_argument("BudgetTracker requires a token estimator");
    }
}

void BudgetTracker::set_system_prompt(std::string_view prompt) {
    system_tokens_ = prompt.empty()
        ? 0
        : estimator_->count_message(Message::system(std::string(prompt)));
}

void BudgetTracker::set_tool_schemas(const std::vector<nlohmann::json>& schemas) {
    tool_tokens_ = 0;
    for (const auto& schema : schemas) {
        tool_tokens_ += estimator_->count(schema.dump());
    }
}

void BudgetTracker::add(const Message& message) {
    message_tokens_ += estimator_->count_message(message);
    ++message_count_;
}

void BudgetTracker::set_messages(const std::vector<Message>& messages) {
    reset();
    for (const auto& msg : messages) {
        add(msg);
    }
}

void BudgetTracker::reset() {
    message_tokens_ = 0;
    message_count_ = 0;
}

auto BudgetTracker::message_tokens() const noexcept -> int64_t {
    if (message_count_ == 0) return 0;
    return message_tokens_ + TokenEstimator::kReplyPriming;
}

auto BudgetTracker::current_tokens() const noexcept -> int64_t {
    return system_tokens_ + tool_tokens_ + message_tokens();
}

auto BudgetTracker::exceeds_limit() const noexcept -> bool {
    return current_tokens() > limits_.context_window - limits_.max_output;
}

auto BudgetTracker::available() const noexcept -> int64_t {
    auto left = limits_.context_window - limits_.max_output - current_tokens();
    return left > 0 ? left : 0;
}

auto BudgetTracker::utilization() const noexcept -> double {
    auto usable = limits_.context_window - limits_.max_output;
    if (usable <= 0) return 1.0;
    return static_cast<double>(current_tokens()) / static_cast<double>(usable);
}

auto BudgetTracker::budget() const noexcept -> ContextBudget {
    return ContextBudget{
        .total = limits_.context_window,
        .reserved_output = limits_.max_output,
        .system_overhead = system_tokens_,
        .tool_overhead = tool_tokens_,
    };
}

auto BudgetTracker::message_budget() const noexcept -> int64_t {
    return budget().available();
}

} // namespace chatvault::context
