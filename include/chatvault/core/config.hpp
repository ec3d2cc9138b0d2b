#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chatvault/core/types.hpp"

// Lets the NLOHMANN_DEFINE macros below read and write optional fields;
// a missing or null value maps to std::nullopt.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace chatvault {

struct SessionConfig {
    std::optional<std::string> dir;  // defaults to <data_dir>/sessions
    int checkpoint_interval_seconds = 60;
    size_t title_max_length = 50;
    int cleanup_max_age_days = 30;
    size_t cleanup_keep_minimum = 10;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SessionConfig, dir, checkpoint_interval_seconds,
    title_max_length, cleanup_max_age_days, cleanup_keep_minimum)

struct ContextConfig {
    std::string mode = "smart";  // sliding_window, token_budget, smart, selective, summarize
    double tokens_per_word = 1.3;
    double tokens_per_char = 0.25;
    size_t estimator_cache_size = 1000;
    size_t window_size = 20;
    size_t preserve_first = 2;
    size_t preserve_last = 10;
    size_t compaction_message_floor = 20;
    size_t compaction_preserve_last = 10;
    size_t compaction_min_messages = 5;
    int compaction_timeout_seconds = 30;
    int max_summary_tokens = 500;
    int max_tool_result_tokens = 1000;
    double compact_threshold = 0.8;  // utilization that triggers summarization
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ContextConfig, mode, tokens_per_word,
    tokens_per_char, estimator_cache_size, window_size, preserve_first, preserve_last,
    compaction_message_floor, compaction_preserve_last, compaction_min_messages,
    compaction_timeout_seconds, max_summary_tokens, max_tool_result_tokens, compact_threshold)

struct Config {
    std::string log_level = "info";
    std::optional<std::string> data_dir;
    SessionConfig sessions;
    ContextConfig context;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, data_dir, sessions, context)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;

/// Overlays CHATVAULT_* environment variables onto an existing config.
void apply_env_overrides(Config& config);

auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Resolves the directory holding session files for this config.
auto sessions_dir(const Config& config) -> std::filesystem::path;

} // namespace chatvault
