#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatrelay/core/cancellation.hpp"
#include "chatrelay/core/config.hpp"
#include "chatrelay/protocol/gemini.hpp"
#include "chatrelay/protocol/neutral.hpp"
#include "chatrelay/relay/error_classifier.hpp"
#include "chatrelay/relay/request_translator.hpp"
#include "chatrelay/relay/response_translator.hpp"
#include "chatrelay/relay/response_writer.hpp"
#include "chatrelay/relay/upstream_body.hpp"
#include "chatrelay/relay/usage_estimator.hpp"

namespace chatrelay::relay {

/// Outcome of a relayed call as seen by the gateway: usage on success, a
/// wire-ready error otherwise.
template <typename T>
using RelayResult = std::expected<T, ErrorEnvelope>;

/// Entry point used by the gateway for one Gemini-backed chat completion.
///
/// The gateway builds the upstream body with build_request()/encode_request(),
/// performs the call itself, then hands the reply to relay_response() or
/// relay_stream() depending on whether the caller asked for a stream.
/// Stateless between calls; one instance may serve concurrent requests.
class ChatRelay {
public:
    ChatRelay(RelayConfig config, std::shared_ptr<const Tokenizer> tokenizer);

    /// Uses an EstimatingTokenizer configured from `config.tokenizer`.
    explicit ChatRelay(const Config& config);

    [[nodiscard]] auto build_request(const protocol::neutral::ChatRequest& request) const
        -> protocol::gemini::ChatRequest;

    [[nodiscard]] auto encode_request(const protocol::neutral::ChatRequest& request) const
        -> Result<std::string>;

    /// Reads, closes and decodes the reply, then translates it. Nothing is
    /// written.
    [[nodiscard]] auto translate_response(UpstreamReply reply,
                                          std::string_view model,
                                          int prompt_tokens) const
        -> RelayResult<protocol::neutral::ChatResponse>;

    /// translate_response() followed by writing the upstream status,
    /// an application/json content type and the encoded body.
    [[nodiscard]] auto relay_response(UpstreamReply reply,
                                      std::string_view model,
                                      int prompt_tokens,
                                      ResponseWriter& writer) const
        -> RelayResult<protocol::neutral::Usage>;

    /// Emulated stream delivery. Errors are returned only when the stream
    /// could not be started; once started, usage counts whatever text was
    /// delivered (none after a background failure).
    auto relay_stream(UpstreamReply reply,
                      std::string model,
                      int prompt_tokens,
                      ResponseWriter& writer,
                      CancellationToken token = {}) const
        -> boost::asio::awaitable<RelayResult<protocol::neutral::Usage>>;

    [[nodiscard]] auto request_translator() const noexcept -> const RequestTranslator& {
        return request_translator_;
    }
    [[nodiscard]] auto response_translator() const noexcept -> const ResponseTranslator& {
        return *response_translator_;
    }
    [[nodiscard]] auto config() const noexcept -> const RelayConfig& { return config_; }

private:
    RelayConfig config_;
    std::shared_ptr<const UsageEstimator> usage_;
    RequestTranslator request_translator_;
    std::shared_ptr<const ResponseTranslator> response_translator_;
};

} // namespace chatrelay::relay
