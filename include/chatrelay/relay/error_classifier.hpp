#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chatrelay/core/error.hpp"

namespace chatrelay::relay {

using json = nlohmann::json;

inline constexpr int kInternalServerError = 500;

/// Wire-level error returned to the caller of the neutral protocol.
/// `code` is a string for relay failures and the number 500 for an empty
/// upstream result, matching what neutral-protocol clients already parse.
struct ErrorEnvelope {
    std::string message;
    std::string type;
    std::optional<std::string> param;
    json code;
    int http_status = kInternalServerError;
};

/// Serializes as {"error": {"message", "type", "param", "code"}}.
void to_json(json& j, const ErrorEnvelope& e);

/// Maps an internal failure to the envelope. Transport and codec failures
/// report 500; UpstreamEmptyResult forwards `upstream_status`, since an
/// upstream may answer non-200 with an empty but well-formed body.
[[nodiscard]] auto classify_error(const Error& error,
                                  int upstream_status = kInternalServerError) -> ErrorEnvelope;

/// The envelope's body, as written to the caller.
[[nodiscard]] auto encode_envelope(const ErrorEnvelope& envelope) -> std::string;

} // namespace chatrelay::relay
