#include "chatrelay/relay/error_classifier.hpp"

#include "chatrelay/core/utils.hpp"

namespace chatrelay::relay {

namespace {

constexpr auto kRelayErrorType = "chatrelay_error";
constexpr auto kServerErrorType = "server_error";

auto relay_code(ErrorCode code) -> std::string {
    switch (code) {
        case ErrorCode::TransportReadFailure: return "read_response_body_failed";
        case ErrorCode::BodyCloseFailure: return "close_response_body_failed";
        case ErrorCode::DecodeFailure: return "unmarshal_response_body_failed";
        case ErrorCode::EncodeFailure: return "marshal_response_body_failed";
        case ErrorCode::WriteFailure: return "write_response_body_failed";
        default: return utils::to_lower(error_code_to_string(code));
    }
}

} // anonymous namespace

void to_json(json& j, const ErrorEnvelope& e) {
    json inner{
        {"message", e.message},
        {"type", e.type},
        {"code", e.code},
    };
    inner["param"] = e.param ? json(*e.param) : json("");
    j = json{{"error", inner}};
}

auto classify_error(const Error& error, int upstream_status) -> ErrorEnvelope {
    ErrorEnvelope envelope;

    if (error.code() == ErrorCode::UpstreamEmptyResult) {
        envelope.message = std::string(error.message());
        envelope.type = kServerErrorType;
        envelope.code = kInternalServerError;
        envelope.http_status = upstream_status;
        return envelope;
    }

    envelope.message = error.what();
    envelope.type = kRelayErrorType;
    envelope.code = relay_code(error.code());
    envelope.http_status = kInternalServerError;
    return envelope;
}

auto encode_envelope(const ErrorEnvelope& envelope) -> std::string {
    // Messages may embed upstream bytes; replace rather than throw on bad UTF-8.
    return json(envelope).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace chatrelay::relay
