#include "chatrelay/relay/response_translator.hpp"

#include <stdexcept>

#include "chatrelay/core/logger.hpp"
#include "chatrelay/core/utils.hpp"

namespace chatrelay::relay {

namespace gemini = protocol::gemini;
namespace neutral = protocol::neutral;

auto candidate_text(const gemini::Candidate& candidate) -> std::string {
    if (candidate.content.parts.empty()) {
        return {};
    }
    return candidate.content.parts.front().text;
}

auto first_candidate_text(const gemini::ChatResponse& response) -> std::string {
    if (response.candidates.empty()) {
        return {};
    }
    return candidate_text(response.candidates.front());
}

ResponseTranslator::ResponseTranslator(std::shared_ptr<const UsageEstimator> usage,
                                       std::string finish_reason)
    : usage_(std::move(usage)), finish_reason_(std::move(finish_reason)) {
    if (!usage_) {
        throw std::invalid_argument("ResponseTranslator requires a usage estimator");
    }
}

auto ResponseTranslator::translate(const gemini::ChatResponse& response,
                                   std::string_view model,
                                   int prompt_tokens) const
    -> Result<neutral::ChatResponse> {
    if (response.candidates.empty()) {
        return std::unexpected(make_error(
            ErrorCode::UpstreamEmptyResult, "No candidates returned"));
    }

    neutral::ChatResponse out;
    out.id = utils::completion_id();
    out.created = utils::unix_timestamp();
    out.model = std::string(model);
    out.choices.reserve(response.candidates.size());

    int index = 0;
    for (const auto& candidate : response.candidates) {
        out.choices.push_back(neutral::Choice{
            .index = index++,
            .message = neutral::ResponseMessage{
                .role = std::string(neutral::kAssistantRole),
                .content = candidate_text(candidate),
            },
            .finish_reason = finish_reason_,
        });
    }

    // Usage counts the first candidate only.
    out.usage = usage_->make_usage(prompt_tokens, out.choices.front().message.content, model);

    LOG_DEBUG("Translated Gemini response: choices={} prompt_tokens={} completion_tokens={}",
              out.choices.size(), out.usage.prompt_tokens, out.usage.completion_tokens);
    return out;
}

auto ResponseTranslator::to_stream_chunk(const gemini::ChatResponse& response,
                                         const ChunkStamp& stamp) const
    -> neutral::StreamChunk {
    neutral::StreamChunk chunk;
    chunk.id = stamp.id;
    chunk.created = stamp.created;
    chunk.model = stamp.model;

    neutral::StreamChoice choice;
    choice.delta.content = first_candidate_text(response);
    choice.finish_reason = finish_reason_;
    chunk.choices.push_back(std::move(choice));
    return chunk;
}

} // namespace chatrelay::relay
