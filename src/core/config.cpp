#include "chatrelay/core/config.hpp"
#include "chatrelay/core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace chatrelay {

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
        auto config = j.get<Config>();

        config.relay.finish_reason = resolve_env_refs(config.relay.finish_reason);
        config.relay.stream_model = resolve_env_refs(config.relay.stream_model);
        for (auto& setting : config.relay.safety_settings) {
            setting.category = resolve_env_refs(setting.category);
            setting.threshold = resolve_env_refs(setting.threshold);
        }

        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("CHATRELAY_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("CHATRELAY_STREAM_MODEL")) {
        config.relay.stream_model = val;
    }
    if (auto* val = std::getenv("CHATRELAY_STREAM_TIMEOUT_MS")) {
        std::string_view text(val);
        int timeout = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), timeout);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            config.relay.stream_timeout_ms = timeout;
        } else {
            LOG_WARN("Ignoring CHATRELAY_STREAM_TIMEOUT_MS='{}': not an integer", text);
        }
    }
}

auto validate_config(const Config& config) -> VoidResult {
    if (config.relay.stream_timeout_ms < 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "relay.stream_timeout_ms must not be negative"));
    }
    for (const auto& setting : config.relay.safety_settings) {
        if (setting.category.empty() || setting.threshold.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "relay.safety_settings entries need a category and a threshold"));
        }
    }
    if (config.tokenizer.default_chars_per_token <= 0.0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "tokenizer.default_chars_per_token must be positive"));
    }
    for (const auto& [prefix, ratio] : config.tokenizer.chars_per_token) {
        if (ratio <= 0.0) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "tokenizer.chars_per_token must be positive",
                prefix));
        }
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace chatrelay
