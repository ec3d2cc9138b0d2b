#pragma once

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include "chatvault/context/tokens.hpp"
#include "chatvault/core/utils.hpp"
#include "chatvault/providers/provider.hpp"

namespace chatvault::testing {

/// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                ("chatvault_test_" + utils::generate_id(12))) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/// Runs a coroutine to completion on a private io_context.
template <typename T>
auto run_sync(boost::asio::awaitable<T> task) -> T {
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task),
        [&](std::exception_ptr e, T value) {
            error = e;
            if (!e) result.emplace(std::move(value));
        });
    ioc.run();
    if (error) std::rethrow_exception(error);
    return std::move(*result);
}

/// One token per whitespace-delimited word. Keeps expected costs easy to
/// compute by hand: a user message "a b c" costs 4 + 3 + 1 = 8.
class WordEstimator : public context::TokenEstimator {
public:
    [[nodiscard]] auto count(std::string_view text) const -> int64_t override {
        std::istringstream in{std::string(text)};
        int64_t words = 0;
        std::string word;
        while (in >> word) ++words;
        return words;
    }
    [[nodiscard]] auto name() const -> std::string_view override { return "words"; }
};

/// Scripted provider for compaction and title tests.
class FakeProvider : public providers::Provider {
public:
    explicit FakeProvider(std::string reply = "summary text") : reply_(std::move(reply)) {}

    auto complete(providers::CompletionRequest req)
        -> boost::asio::awaitable<Result<providers::CompletionResponse>> override {
        ++calls;
        last_request = req;

        if (delay.count() > 0) {
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(executor, delay);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
        if (throw_error) {
            throw std::runtime_error("provider exploded");
        }
        if (error) {
            co_return make_fail(*error);
        }
        co_return providers::CompletionResponse{
            .text = reply_, .model = req.model, .input_tokens = 10, .output_tokens = 5};
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "fake"; }

    std::chrono::milliseconds delay{0};
    std::optional<Error> error;
    bool throw_error = false;
    int calls = 0;
    std::optional<providers::CompletionRequest> last_request;

private:
    std::string reply_;
};

} // namespace chatvault::testing
