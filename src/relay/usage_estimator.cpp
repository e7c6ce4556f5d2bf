#include "chatrelay/relay/usage_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "chatrelay/core/utils.hpp"

namespace chatrelay::relay {

namespace {

auto flush_ascii_run(std::size_t run, double ratio) -> int {
    if (run == 0) return 0;
    return static_cast<int>(std::ceil(static_cast<double>(run) / ratio));
}

} // anonymous namespace

EstimatingTokenizer::EstimatingTokenizer(TokenizerConfig config)
    : config_(std::move(config)) {}

auto EstimatingTokenizer::chars_per_token(std::string_view model) const -> double {
    auto normalized = utils::to_lower(model);
    double ratio = config_.default_chars_per_token;
    std::size_t best = 0;
    for (const auto& [prefix, value] : config_.chars_per_token) {
        auto key = utils::to_lower(prefix);
        if (key.size() >= best && normalized.starts_with(key) && value > 0.0) {
            best = key.size();
            ratio = value;
        }
    }
    return ratio > 0.0 ? ratio : 4.0;
}

auto EstimatingTokenizer::count_tokens(std::string_view text,
                                       std::string_view model) const -> int {
    const double ratio = chars_per_token(model);

    int tokens = 0;
    std::size_t ascii_run = 0;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            ++ascii_run;
            continue;
        }
        tokens += flush_ascii_run(ascii_run, ratio);
        ascii_run = 0;
        // Continuation bytes (10xxxxxx) belong to the code point already counted.
        if ((c & 0xC0) != 0x80) {
            ++tokens;
        }
    }
    tokens += flush_ascii_run(ascii_run, ratio);
    return tokens;
}

UsageEstimator::UsageEstimator(std::shared_ptr<const Tokenizer> tokenizer)
    : tokenizer_(std::move(tokenizer)) {
    if (!tokenizer_) {
        throw std::invalid_argument("UsageEstimator requires a tokenizer");
    }
}

auto UsageEstimator::completion_tokens(std::string_view text,
                                       std::string_view model) const -> int {
    auto count = tokenizer_->count_tokens(text, model);
    return count < 0 ? 0 : count;
}

auto UsageEstimator::make_usage(int prompt_tokens, std::string_view text,
                                std::string_view model) const -> protocol::neutral::Usage {
    protocol::neutral::Usage usage;
    usage.prompt_tokens = prompt_tokens < 0 ? 0 : prompt_tokens;
    usage.completion_tokens = completion_tokens(text, model);
    // Saturates rather than wrapping when the counts are near INT_MAX.
    auto total = static_cast<int64_t>(usage.prompt_tokens) + usage.completion_tokens;
    usage.total_tokens = static_cast<int>(
        std::min<int64_t>(total, std::numeric_limits<int>::max()));
    return usage;
}

} // namespace chatrelay::relay
