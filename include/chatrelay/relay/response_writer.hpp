#pragma once

#include <map>
#include <ostream>
#include <string>
#include <string_view>

#include "chatrelay/core/error.hpp"

namespace chatrelay::relay {

using Headers = std::map<std::string, std::string>;

/// The literal payload of the final event-stream frame.
inline constexpr std::string_view kDoneSentinel = "[DONE]";

/// Caller-owned transport the relay writes its reply through. Writes are
/// synchronous from the relay's point of view and report failure through
/// VoidResult; a failed write is never retried.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual auto write_head(int status, const Headers& headers) -> VoidResult = 0;
    virtual auto write(std::string_view data) -> VoidResult = 0;
    virtual auto flush() -> VoidResult = 0;
};

/// Headers for a server-push reply.
[[nodiscard]] auto event_stream_headers() -> Headers;

/// Headers for a buffered JSON reply.
[[nodiscard]] auto json_headers() -> Headers;

/// "data: " + payload + blank line.
[[nodiscard]] auto format_data_frame(std::string_view payload) -> std::string;

/// The terminal frame, "data: [DONE]" + blank line.
[[nodiscard]] auto done_frame() -> std::string;

/// Writes a reply to a std::ostream, status and headers as an HTTP-like
/// preamble when `include_head` is set.
class StreamWriter final : public ResponseWriter {
public:
    explicit StreamWriter(std::ostream& out, bool include_head = false);

    auto write_head(int status, const Headers& headers) -> VoidResult override;
    auto write(std::string_view data) -> VoidResult override;
    auto flush() -> VoidResult override;

private:
    std::ostream& out_;
    bool include_head_;
};

} // namespace chatrelay::relay
