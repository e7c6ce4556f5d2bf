#pragma once

#include <string>
#include <vector>

#include "chatrelay/core/error.hpp"
#include "chatrelay/protocol/gemini.hpp"
#include "chatrelay/protocol/neutral.hpp"

namespace chatrelay::relay {

/// Neutral chat request -> Gemini generateContent request.
///
/// Messages map one-to-one in order with their role preserved. The safety
/// settings are fixed at construction and sent with every request.
/// Note that `topK` and `maxOutputTokens` are both taken from the caller's
/// `max_tokens`.
class RequestTranslator {
public:
    explicit RequestTranslator(
        std::vector<protocol::gemini::SafetySetting> safety_settings =
            protocol::gemini::default_safety_settings());

    [[nodiscard]] auto translate(const protocol::neutral::ChatRequest& request) const
        -> protocol::gemini::ChatRequest;

    /// translate() followed by compact JSON encoding.
    [[nodiscard]] auto encode(const protocol::neutral::ChatRequest& request) const
        -> Result<std::string>;

    [[nodiscard]] auto safety_settings() const noexcept
        -> const std::vector<protocol::gemini::SafetySetting>& {
        return safety_settings_;
    }

private:
    std::vector<protocol::gemini::SafetySetting> safety_settings_;
};

} // namespace chatrelay::relay
