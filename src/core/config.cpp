#include "chatvault/core/config.hpp"
#include "chatvault/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace chatvault {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        // Older configs spelled the summarize mode "summary".
        if (j.contains("context") && j["context"].is_object() &&
            j["context"].value("mode", "") == "summary") {
            LOG_WARN("Config: context.mode 'summary' is deprecated, using 'summarize'");
            j["context"]["mode"] = "summarize";
        }

        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("CHATVAULT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CHATVAULT_DATA_DIR")) {
        config.data_dir = val;
    }
    if (auto* val = std::getenv("CHATVAULT_SESSIONS_DIR")) {
        config.sessions.dir = val;
    }
    if (auto* val = std::getenv("CHATVAULT_CHECKPOINT_INTERVAL")) {
        try {
            auto seconds = std::stoi(val);
            if (seconds > 0) {
                config.sessions.checkpoint_interval_seconds = seconds;
            } else {
                LOG_WARN("Ignoring non-positive CHATVAULT_CHECKPOINT_INTERVAL={}", val);
            }
        } catch (const std::exception&) {
            LOG_WARN("Ignoring malformed CHATVAULT_CHECKPOINT_INTERVAL={}", val);
        }
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("CHATVAULT_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".chatvault";
}

auto sessions_dir(const Config& config) -> std::filesystem::path {
    if (config.sessions.dir) {
        return *config.sessions.dir;
    }
    auto base = config.data_dir ? std::filesystem::path(*config.data_dir) : default_data_dir();
    return base / "sessions";
}

} // namespace chatvault
