#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatrelay/core/error.hpp"
#include "chatrelay/protocol/gemini.hpp"

namespace chatrelay {

using json = nlohmann::json;

struct RelayConfig {
    std::vector<protocol::gemini::SafetySetting> safety_settings =
        protocol::gemini::default_safety_settings();
    std::string finish_reason = "stop";
    // Reported as `model` in stream chunks instead of the requested model.
    std::string stream_model = "gemini";
    int stream_timeout_ms = 0;  // 0 = no deadline
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RelayConfig, safety_settings, finish_reason, stream_model, stream_timeout_ms)

struct TokenizerConfig {
    double default_chars_per_token = 4.0;
    // Keyed by model-name prefix; the longest matching prefix wins.
    std::map<std::string, double> chars_per_token;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TokenizerConfig, default_chars_per_token, chars_per_token)

struct Config {
    std::string log_level = "info";
    RelayConfig relay;
    TokenizerConfig tokenizer;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, relay, tokenizer)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// Applies CHATRELAY_LOG_LEVEL, CHATRELAY_STREAM_TIMEOUT_MS and
/// CHATRELAY_STREAM_MODEL on top of `config`.
void apply_env_overrides(Config& config);

auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace chatrelay
