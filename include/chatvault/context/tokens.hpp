#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chatvault/core/config.hpp"
#include "chatvault/core/types.hpp"

namespace chatvault::context {

/// Maps text and messages to an estimated token count.
///
/// count_messages() charges, per message, a fixed framing overhead plus the
/// content, role, optional name and every tool call's name and serialized
/// arguments, then adds a reply-priming constant for non-empty lists.
/// Implementations are deterministic and never mutate their input.
class TokenEstimator {
public:
    static constexpr int64_t kMessageOverhead = 4;
    static constexpr int64_t kReplyPriming = 3;
    static constexpr int64_t kToolCallOverhead = 3;
    static constexpr int64_t kNameOverhead = 1;

    virtual ~TokenEstimator() = default;

    [[nodiscard]] virtual auto count(std::string_view text) const -> int64_t = 0;

    [[nodiscard]] virtual auto count_message(const Message& message) const -> int64_t;

    [[nodiscard]] virtual auto count_messages(const std::vector<Message>& messages) const
        -> int64_t;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Word-based estimate: ceil(words * tokens_per_word + punctuation * tokens_per_char).
class ApproximateEstimator : public TokenEstimator {
public:
    explicit ApproximateEstimator(double tokens_per_word = 1.3, double tokens_per_char = 0.25);

    [[nodiscard]] auto count(std::string_view text) const -> int64_t override;
    [[nodiscard]] auto name() const -> std::string_view override { return "approximate"; }

    [[nodiscard]] auto tokens_per_word() const noexcept -> double { return tokens_per_word_; }

private:
    double tokens_per_word_;
    double tokens_per_char_;
};

/// Average characters a vocabulary packs into one token, per piece class.
struct EncodingProfile {
    std::string family;
    double letters_per_token = 4.0;
    int digits_per_token = 3;
    double symbols_per_token = 1.5;
};

/// Model-aware estimate that splits text the way byte-pair vocabularies
/// pre-tokenize it (contractions, letter runs, digit groups, symbol runs,
/// whitespace) and charges every piece against the family's profile.
class VocabularyEstimator : public TokenEstimator {
public:
    explicit VocabularyEstimator(EncodingProfile profile);

    [[nodiscard]] auto count(std::string_view text) const -> int64_t override;
    [[nodiscard]] auto name() const -> std::string_view override { return "vocabulary"; }

    [[nodiscard]] auto profile() const noexcept -> const EncodingProfile& { return profile_; }

private:
    EncodingProfile profile_;
};

/// Returns the encoding profile for a model identifier, matched
/// case-insensitively by family prefix, or nullopt if unsupported.
[[nodiscard]] auto lookup_encoding_profile(std::string_view model)
    -> std::optional<EncodingProfile>;

/// LRU memoizing decorator keyed by a SHA-256 digest of the input.
/// Thread-safe: truncation policies and the background checkpoint may count
/// concurrently.
class CachingEstimator : public TokenEstimator {
public:
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        size_t size = 0;
        size_t max_size = 0;
        int hit_rate_percent = 0;
    };

    /// @throws std::invalid_argument if max_size is zero.
    explicit CachingEstimator(std::shared_ptr<const TokenEstimator> inner,
                              size_t max_size = 1000);

    [[nodiscard]] auto count(std::string_view text) const -> int64_t override;
    [[nodiscard]] auto count_messages(const std::vector<Message>& messages) const
        -> int64_t override;
    [[nodiscard]] auto name() const -> std::string_view override { return inner_->name(); }

    [[nodiscard]] auto stats() const -> Stats;
    void clear();

    [[nodiscard]] auto inner() const -> const TokenEstimator& { return *inner_; }

private:
    using LruList = std::list<std::pair<std::string, int64_t>>;

    auto lookup_or_compute(const std::string& key,
                           const std::function<int64_t()>& compute) const -> int64_t;

    std::shared_ptr<const TokenEstimator> inner_;
    size_t max_size_;

    mutable std::mutex mutex_;
    mutable LruList lru_;
    mutable std::unordered_map<std::string, LruList::iterator> entries_;
    mutable uint64_t hits_ = 0;
    mutable uint64_t misses_ = 0;
};

/// Builds the caching estimator for a model: vocabulary-aware for known
/// families, approximate (with a warning) otherwise.
[[nodiscard]] auto make_estimator(std::string_view model, const ContextConfig& config = {})
    -> std::shared_ptr<CachingEstimator>;

} // namespace chatvault::context
