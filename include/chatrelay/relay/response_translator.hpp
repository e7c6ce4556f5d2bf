#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "chatrelay/core/error.hpp"
#include "chatrelay/protocol/gemini.hpp"
#include "chatrelay/protocol/neutral.hpp"
#include "chatrelay/relay/usage_estimator.hpp"

namespace chatrelay::relay {

/// Text of a candidate: its first content part. Further parts are not read;
/// a candidate without parts yields an empty string.
[[nodiscard]] auto candidate_text(const protocol::gemini::Candidate& candidate) -> std::string;

/// Text of the first candidate, or empty when there is none.
[[nodiscard]] auto first_candidate_text(const protocol::gemini::ChatResponse& response)
    -> std::string;

/// Identity fields stamped on a stream chunk.
struct ChunkStamp {
    std::string id;
    int64_t created = 0;
    std::string model;
};

/// Gemini response -> neutral response, with usage.
class ResponseTranslator {
public:
    ResponseTranslator(std::shared_ptr<const UsageEstimator> usage,
                       std::string finish_reason = "stop");

    /// Fails with UpstreamEmptyResult when there are no candidates.
    [[nodiscard]] auto translate(const protocol::gemini::ChatResponse& response,
                                 std::string_view model,
                                 int prompt_tokens) const
        -> Result<protocol::neutral::ChatResponse>;

    /// The single chunk emitted when a buffered reply is delivered as a
    /// stream. Unlike translate(), an empty candidate list is tolerated and
    /// produces an empty delta.
    [[nodiscard]] auto to_stream_chunk(const protocol::gemini::ChatResponse& response,
                                       const ChunkStamp& stamp) const
        -> protocol::neutral::StreamChunk;

    [[nodiscard]] auto finish_reason() const noexcept -> const std::string& {
        return finish_reason_;
    }

    [[nodiscard]] auto usage_estimator() const noexcept -> const UsageEstimator& {
        return *usage_;
    }

private:
    std::shared_ptr<const UsageEstimator> usage_;
    std::string finish_reason_;
};

} // namespace chatrelay::relay
