#include "chatvault/context/tokens.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "chatvault/core/logger.hpp"
#include "chatvault/core/utils.hpp"

namespace chatvault::context {

// -- TokenEstimator ----------------------------------------------------------

auto TokenEstimator::count_message(const Message& message) const -> int64_t {
    int64_t total = kMessageOverhead;
    total += count(message.content);
    total += count(role_to_string(message.role));
    if (message.name) {
        total += count(*message.name) + kNameOverhead;
    }
    for (const auto& call : message.tool_calls) {
        total += count(call.name);
        total += count(call.arguments.dump());
        total += kToolCallOverhead;
    }
    return total;
}

auto TokenEstimator::count_messages(const std::vector<Message>& messages) const -> int64_t {
    if (messages.empty()) return 0;

    int64_t total = kReplyPriming;
    for (const auto& msg : messages) {
        total += count_message(msg);
    }
    return total;
}

// -- ApproximateEstimator ----------------------------------------------------

ApproximateEstimator::ApproximateEstimator(double tokens_per_word, double tokens_per_char)
    : tokens_per_word_(tokens_per_word), tokens_per_char_(tokens_per_char) {}

auto ApproximateEstimator::count(std::string_view text) const -> int64_t {
    if (text.empty()) return 0;

    int64_t words = 0;
    int64_t punctuation = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
            continue;
        }
        if (!in_word) {
            ++words;
            in_word = true;
        }
        if (std::ispunct(c)) {
            ++punctuation;
        }
    }

    auto estimate = static_cast<double>(words) * tokens_per_word_ +
                    static_cast<double>(punctuation) * tokens_per_char_;
    return static_cast<int64_t>(std::ceil(estimate));
}

// -- VocabularyEstimator -----------------------------------------------------

namespace {

// UTF-8 sequences outside ASCII rarely merge; most land at one token per
// code point, which is two to four bytes.
constexpr double kMultibyteBytesPerToken = 2.5;

auto is_letter(unsigned char c) -> bool { return std::isalpha(c) != 0; }
auto is_digit(unsigned char c) -> bool { return std::isdigit(c) != 0; }
auto is_space(unsigned char c) -> bool { return std::isspace(c) != 0; }
auto is_multibyte(unsigned char c) -> bool { return c >= 0x80; }

auto ceil_div(size_t length, double per_token) -> int64_t {
    return static_cast<int64_t>(std::ceil(static_cast<double>(length) / per_token));
}

/// Length of an English contraction suffix starting at an apostrophe, or 0.
auto contraction_length(std::string_view text, size_t pos) -> size_t {
    if (text[pos] != '\'') return 0;
    static constexpr std::array<std::string_view, 7> suffixes = {
        "ll", "re", "ve", "s", "t", "m", "d",
    };
    auto rest = text.substr(pos + 1);
    for (auto suffix : suffixes) {
        if (rest.size() >= suffix.size() &&
            utils::to_lower(rest.substr(0, suffix.size())) == suffix &&
            (rest.size() == suffix.size() ||
             !is_letter(static_cast<unsigned char>(rest[suffix.size()])))) {
            return suffix.size() + 1;
        }
    }
    return 0;
}

struct FamilyPrefix {
    std::string_view prefix;
    EncodingProfile profile;
};

auto family_table() -> const std::vector<FamilyPrefix>& {
    static const std::vector<FamilyPrefix> table = {
        {"gpt-", {"gpt", 4.0, 3, 1.5}},
        {"chatgpt", {"gpt", 4.0, 3, 1.5}},
        {"o1", {"gpt", 4.0, 3, 1.5}},
        {"o3", {"gpt", 4.0, 3, 1.5}},
        {"o4", {"gpt", 4.0, 3, 1.5}},
        {"claude", {"claude", 3.6, 1, 1.4}},
        {"gemini", {"gemini", 4.2, 1, 1.5}},
        {"llama", {"llama", 3.8, 1, 1.2}},
        {"mistral", {"mistral", 3.7, 1, 1.2}},
        {"mixtral", {"mistral", 3.7, 1, 1.2}},
        {"codestral", {"mistral", 3.7, 1, 1.2}},
    };
    return table;
}

} // namespace

VocabularyEstimator::VocabularyEstimator(EncodingProfile profile)
    : profile_(std::move(profile)) {}

auto VocabularyEstimator::count(std::string_view text) const -> int64_t {
    int64_t total = 0;
    size_t pos = 0;
    const size_t n = text.size();

    while (pos < n) {
        auto c = static_cast<unsigned char>(text[pos]);

        if (auto len = contraction_length(text, pos); len > 0) {
            total += 1;
            pos += len;
            continue;
        }

        // A single leading space is absorbed into the following word.
        if (c == ' ' && pos + 1 < n) {
            auto next = static_cast<unsigned char>(text[pos + 1]);
            if (is_letter(next) || is_digit(next) || is_multibyte(next)) {
                ++pos;
                continue;
            }
        }

        size_t start = pos;
        if (is_letter(c)) {
            while (pos < n && is_letter(static_cast<unsigned char>(text[pos]))) ++pos;
            total += ceil_div(pos - start, profile_.letters_per_token);
        } else if (is_digit(c)) {
            while (pos < n && is_digit(static_cast<unsigned char>(text[pos]))) ++pos;
            total += ceil_div(pos - start, static_cast<double>(profile_.digits_per_token));
        } else if (is_multibyte(c)) {
            while (pos < n && is_multibyte(static_cast<unsigned char>(text[pos]))) ++pos;
            total += ceil_div(pos - start, kMultibyteBytesPerToken);
        } else if (is_space(c)) {
            int64_t newlines = 0;
            while (pos < n && is_space(static_cast<unsigned char>(text[pos]))) {
                if (text[pos] == '\n') ++newlines;
                ++pos;
            }
            // Runs of newlines merge; indentation after them is one more piece.
            total += newlines > 0 ? 1 : 0;
            if (pos - start > static_cast<size_t>(newlines)) total += 1;
        } else {
            while (pos < n) {
                auto d = static_cast<unsigned char>(text[pos]);
                if (is_letter(d) || is_digit(d) || is_space(d) || is_multibyte(d)) break;
                if (pos > start && contraction_length(text, pos) > 0) break;
                ++pos;
            }
            total += ceil_div(pos - start, profile_.symbols_per_token);
        }
    }
    return total;
}

auto lookup_encoding_profile(std::string_view model) -> std::optional<EncodingProfile> {
    auto id = utils::to_lower(model);
    // "anthropic/claude-..." and "openai:gpt-4o" name the same families.
    if (auto sep = id.find_first_of("/:"); sep != std::string::npos) {
        id = id.substr(sep + 1);
    }
    for (const auto& entry : family_table()) {
        if (id.starts_with(entry.prefix)) {
            return entry.profile;
        }
    }
    return std::nullopt;
}

// -- CachingEstimator --------------------------------------------------------

CachingEstimator::CachingEstimator(std::shared_ptr<const TokenEstimator> inner,
                                   size_t max_size)
    : inner_(std::move(inner)), max_size_(max_size) {
    if (!inner_) {
        throw std::invalid_argument("CachingEstimator requires an inner estimator");
    }
    if (max_size_ == 0) {
        throw std::invalid_argument("CachingEstimator max_size must be positive");
    }
}

auto CachingEstimator::lookup_or_compute(const std::string& key,
                                         const std::function<int64_t()>& compute) const
    -> int64_t {
    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            lru_.splice(lru_.begin(), lru_, it->second);
            ++hits_;
            return it->second->second;
        }
        ++misses_;
    }

    // Computed outside the lock; a concurrent duplicate computes the same value.
    auto value = compute();

    std::lock_guard lock(mutex_);
    if (entries_.contains(key)) {
        return value;
    }
    lru_.emplace_front(key, value);
    entries_[key] = lru_.begin();
    while (entries_.size() > max_size_) {
        entries_.erase(lru_.back().first);
        lru_.pop_back();
    }
    return value;
}

auto CachingEstimator::count(std::string_view text) const -> int64_t {
    if (text.empty()) return 0;
    return lookup_or_compute("t:" + utils::sha256(text),
                             [&] { return inner_->count(text); });
}

auto CachingEstimator::count_messages(const std::vector<Message>& messages) const
    -> int64_t {
    if (messages.empty()) return 0;

    // Timestamps and pins carry no tokens, so they stay out of the key.
    json canonical = json::array();
    for (const auto& msg : messages) {
        json entry = {{"role", msg.role}, {"content", msg.content}};
        if (msg.name) entry["name"] = *msg.name;
        if (msg.has_tool_calls()) entry["tool_calls"] = msg.tool_calls;
        canonical.push_back(std::move(entry));
    }
    return lookup_or_compute("m:" + utils::sha256(canonical.dump()),
                             [&] { return inner_->count_messages(messages); });
}

auto CachingEstimator::stats() const -> Stats {
    std::lock_guard lock(mutex_);
    Stats s;
    s.hits = hits_;
    s.misses = misses_;
    s.size = entries_.size();
    s.max_size = max_size_;
    auto total = hits_ + misses_;
    s.hit_rate_percent = total > 0 ? static_cast<int>(hits_ * 100 / total) : 0;
    return s;
}

void CachingEstimator::clear() {
    std::lock_guard lock(mutex_);
    lru_.clear();
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

auto make_estimator(std::string_view model, const ContextConfig& config)
    -> std::shared_ptr<CachingEstimator> {
    std::shared_ptr<const TokenEstimator> inner;
    if (auto profile = lookup_encoding_profile(model)) {
        LOG_DEBUG("Using {} vocabulary estimator for model '{}'", profile->family, model);
        inner = std::make_shared<VocabularyEstimator>(std::move(*profile));
    } else {
        LOG_WARN("No vocabulary profile for model '{}', using approximate estimator", model);
        inner = std::make_shared<ApproximateEstimator>(config.tokens_per_word,
                                                       config.tokens_per_char);
    }
    return std::make_shared<CachingEstimator>(std::move(inner),
                                              config.estimator_cache_size);
}

} // namespace chatvault::context
