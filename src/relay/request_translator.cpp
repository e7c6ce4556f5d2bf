#include "chatrelay/relay/request_translator.hpp"

#include "chatrelay/core/logger.hpp"

namespace chatrelay::relay {

namespace gemini = protocol::gemini;
namespace neutral = protocol::neutral;

RequestTranslator::RequestTranslator(std::vector<gemini::SafetySetting> safety_settings)
    : safety_settings_(std::move(safety_settings)) {}

auto RequestTranslator::translate(const neutral::ChatRequest& request) const
    -> gemini::ChatRequest {
    gemini::ChatRequest out;
    out.safety_settings = safety_settings_;
    out.generation_config = gemini::GenerationConfig{
        .temperature = request.temperature,
        .top_p = request.top_p,
        .top_k = request.max_tokens,
        .max_output_tokens = request.max_tokens,
    };

    out.contents.reserve(request.messages.size());
    for (const auto& msg : request.messages) {
        out.contents.push_back(gemini::RequestContent{
            .role = msg.role,
            .parts = gemini::RequestPart{.text = msg.content_as_text()},
        });
    }

    LOG_DEBUG("Translated chat request: model={} messages={} max_tokens={}",
              request.model, out.contents.size(), request.max_tokens);
    return out;
}

auto RequestTranslator::encode(const neutral::ChatRequest& request) const
    -> Result<std::string> {
    return gemini::encode_request(translate(request));
}

} // namespace chatrelay::relay
