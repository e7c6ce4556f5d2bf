#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "chatrelay/core/config.hpp"
#include "chatrelay/protocol/neutral.hpp"

namespace chatrelay::relay {

/// Model-aware token counter. Implementations must be deterministic for a
/// given (text, model) pair and safe to call from any thread.
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    [[nodiscard]] virtual auto count_tokens(std::string_view text,
                                            std::string_view model) const -> int = 0;
};

/// Character-ratio tokenizer used when no vocabulary-backed tokenizer is
/// wired in. ASCII runs cost ceil(chars / ratio) where the ratio is chosen
/// by the longest configured model-name prefix; every non-ASCII code point
/// costs one token.
class EstimatingTokenizer final : public Tokenizer {
public:
    explicit EstimatingTokenizer(TokenizerConfig config = {});

    [[nodiscard]] auto count_tokens(std::string_view text,
                                    std::string_view model) const -> int override;

    [[nodiscard]] auto chars_per_token(std::string_view model) const -> double;

private:
    TokenizerConfig config_;
};

/// Completion-token accounting for a finished response.
class UsageEstimator {
public:
    explicit UsageEstimator(std::shared_ptr<const Tokenizer> tokenizer);

    [[nodiscard]] auto completion_tokens(std::string_view text,
                                         std::string_view model) const -> int;

    /// Combines the caller's prompt count with the counted completion. A negative
    /// prompt count reads as zero and the total saturates at INT_MAX.
    [[nodiscard]] auto make_usage(int prompt_tokens, std::string_view text,
                                  std::string_view model) const -> protocol::neutral::Usage;

private:
    std::shared_ptr<const Tokenizer> tokenizer_;
};

} // namespace chatrelay::relay
