#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "chatvault/core/error.hpp"
#include "chatvault/core/types.hpp"

namespace chatvault::providers {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Request sent to a model for a single completion.
struct CompletionRequest {
    std::string model;
    std::vector<Message> messages;
    std::optional<std::string> system_prompt;  // instruction for the task
    std::optional<int> max_tokens;
};

/// Completion result returned by a provider.
struct CompletionResponse {
    std::string text;
    std::string model;
    int input_tokens = 0;
    int output_tokens = 0;
};

/// Abstract boundary to whatever produces summaries and titles.
///
/// Implementations translate the request into their service's native API.
/// Callers bound every call with their own deadline; providers do not retry.
class Provider {
public:
    virtual ~Provider() = default;

    virtual auto complete(CompletionRequest req)
        -> awaitable<Result<CompletionResponse>> = 0;

    /// Return the provider name (e.g. "anthropic", "local").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace chatvault::providers
