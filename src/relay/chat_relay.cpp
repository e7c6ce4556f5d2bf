#include "chatrelay/relay/chat_relay.hpp"

#include <chrono>

#include "chatrelay/core/logger.hpp"
#include "chatrelay/relay/stream_emulator.hpp"

namespace chatrelay::relay {

using boost::asio::awaitable;

namespace gemini = protocol::gemini;
namespace neutral = protocol::neutral;

ChatRelay::ChatRelay(RelayConfig config, std::shared_ptr<const Tokenizer> tokenizer)
    : config_(std::move(config))
    , usage_(std::make_shared<const UsageEstimator>(std::move(tokenizer)))
    , request_translator_(config_.safety_settings)
    , response_translator_(
          std::make_shared<const ResponseTranslator>(usage_, config_.finish_reason)) {}

ChatRelay::ChatRelay(const Config& config)
    : ChatRelay(config.relay, std::make_shared<const EstimatingTokenizer>(config.tokenizer)) {}

auto ChatRelay::build_request(const neutral::ChatRequest& request) const
    -> gemini::ChatRequest {
    return request_translator_.translate(request);
}

auto ChatRelay::encode_request(const neutral::ChatRequest& request) const
    -> Result<std::string> {
    return request_translator_.encode(request);
}

auto ChatRelay::translate_response(UpstreamReply reply,
                                   std::string_view model,
                                   int prompt_tokens) const
    -> RelayResult<neutral::ChatResponse> {
    auto body = reply.body.read_all();
    if (!body) {
        LOG_ERROR("read upstream response failed: {}", body.error().what());
        return std::unexpected(classify_error(make_error(
            ErrorCode::TransportReadFailure,
            "Failed to read upstream response body",
            body.error().what())));
    }

    if (auto closed = reply.body.close(); !closed) {
        LOG_ERROR("close upstream response failed: {}", closed.error().what());
        return std::unexpected(classify_error(make_error(
            ErrorCode::BodyCloseFailure,
            "Failed to close upstream response body",
            closed.error().what())));
    }

    auto decoded = gemini::decode_response(*body);
    if (!decoded) {
        LOG_ERROR("decode upstream response failed: {}", decoded.error().what());
        return std::unexpected(classify_error(decoded.error()));
    }

    auto translated = response_translator_->translate(*decoded, model, prompt_tokens);
    if (!translated) {
        LOG_WARN("upstream returned no candidates (status {})", reply.status);
        return std::unexpected(classify_error(translated.error(), reply.status));
    }
    return std::move(*translated);
}

auto ChatRelay::relay_response(UpstreamReply reply,
                               std::string_view model,
                               int prompt_tokens,
                               ResponseWriter& writer) const
    -> RelayResult<neutral::Usage> {
    const int status = reply.status;
    auto response = translate_response(std::move(reply), model, prompt_tokens);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }

    auto encoded = neutral::encode_response(*response);
    if (!encoded) {
        LOG_ERROR("encode chat response failed: {}", encoded.error().what());
        return std::unexpected(classify_error(encoded.error()));
    }

    VoidResult written = writer.write_head(status, json_headers());
    if (written) written = writer.write(*encoded);
    if (written) written = writer.flush();
    if (!written) {
        LOG_ERROR("write chat response failed: {}", written.error().what());
        return std::unexpected(classify_error(make_error(
            ErrorCode::WriteFailure,
            "Failed to write response body",
            written.error().what())));
    }

    return response->usage;
}

auto ChatRelay::relay_stream(UpstreamReply reply,
                             std::string model,
                             int prompt_tokens,
                             ResponseWriter& writer,
                             CancellationToken token) const
    -> awaitable<RelayResult<neutral::Usage>> {
    StreamEmulator emulator(response_translator_, StreamOptions{
        .model = config_.stream_model,
        .timeout = std::chrono::milliseconds(config_.stream_timeout_ms),
    });

    auto outcome = co_await emulator.run(std::move(reply.body), writer, std::move(token));

    RelayResult<neutral::Usage> result;
    if (!outcome) {
        result = std::unexpected(classify_error(outcome.error()));
        co_return result;
    }

    result = usage_->make_usage(prompt_tokens, outcome->response_text, model);
    LOG_DEBUG("stream relayed: model={} frames={} completion_tokens={}",
              model, outcome->frames_written, result->completion_tokens);
    co_return result;
}

} // namespace chatrelay::relay
