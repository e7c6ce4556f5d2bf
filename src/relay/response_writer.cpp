#include "chatrelay/relay/response_writer.hpp"

namespace chatrelay::relay {

auto event_stream_headers() -> Headers {
    return {
        {"Content-Type", "text/event-stream"},
        {"Cache-Control", "no-cache"},
        {"Connection", "keep-alive"},
        {"Transfer-Encoding", "chunked"},
        {"X-Accel-Buffering", "no"},
    };
}

auto json_headers() -> Headers {
    return {{"Content-Type", "application/json"}};
}

auto format_data_frame(std::string_view payload) -> std::string {
    std::string frame;
    frame.reserve(payload.size() + 8);
    frame += "data: ";
    frame += payload;
    frame += "\n\n";
    return frame;
}

auto done_frame() -> std::string {
    return format_data_frame(kDoneSentinel);
}

StreamWriter::StreamWriter(std::ostream& out, bool include_head)
    : out_(out), include_head_(include_head) {}

auto StreamWriter::write_head(int status, const Headers& headers) -> VoidResult {
    if (!include_head_) return {};
    out_ << "HTTP/1.1 " << status << "\r\n";
    for (const auto& [name, value] : headers) {
        out_ << name << ": " << value << "\r\n";
    }
    out_ << "\r\n";
    if (!out_) {
        return std::unexpected(make_error(ErrorCode::WriteFailure, "Failed to write response head"));
    }
    return {};
}

auto StreamWriter::write(std::string_view data) -> VoidResult {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out_) {
        return std::unexpected(make_error(ErrorCode::WriteFailure, "Failed to write response body"));
    }
    return {};
}

auto StreamWriter::flush() -> VoidResult {
    out_.flush();
    if (!out_) {
        return std::unexpected(make_error(ErrorCode::WriteFailure, "Failed to flush response"));
    }
    return {};
}

} // namespace chatrelay::relay
