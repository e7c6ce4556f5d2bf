#include "chatrelay/relay/upstream_body.hpp"

#include <utility>

#include "chatrelay/core/logger.hpp"

namespace chatrelay::relay {

// -- ScopedBody --

ScopedBody::ScopedBody(std::unique_ptr<UpstreamBody> body)
    : body_(std::move(body)) {}

ScopedBody::~ScopedBody() {
    if (body_ && !closed_) {
        if (auto result = close(); !result) {
            LOG_WARN("Upstream body close on release failed: {}", result.error().what());
        }
    }
}

ScopedBody::ScopedBody(ScopedBody&& other) noexcept
    : body_(std::move(other.body_)), closed_(std::exchange(other.closed_, false)) {}

ScopedBody& ScopedBody::operator=(ScopedBody&& other) noexcept {
    if (this != &other) {
        if (body_ && !closed_) {
            if (auto result = close(); !result) {
                LOG_WARN("Upstream body close on reassignment failed: {}",
                         result.error().what());
            }
        }
        body_ = std::move(other.body_);
        closed_ = std::exchange(other.closed_, false);
    }
    return *this;
}

auto ScopedBody::read_all(const CancellationToken& token) -> Result<std::string> {
    if (!body_) {
        return std::unexpected(make_error(
            ErrorCode::TransportReadFailure, "No upstream body to read"));
    }
    if (closed_) {
        return std::unexpected(make_error(
            ErrorCode::TransportReadFailure, "Upstream body already closed"));
    }
    return body_->read_all(token);
}

auto ScopedBody::close() -> VoidResult {
    if (!body_ || closed_) {
        LOG_DEBUG("Upstream body already released, ignoring close");
        return {};
    }
    closed_ = true;
    return body_->close();
}

// -- BufferedBody --

BufferedBody::BufferedBody(std::string data)
    : data_(std::move(data)) {}

auto BufferedBody::read_all(const CancellationToken& token) -> Result<std::string> {
    if (token.is_cancelled()) {
        return std::unexpected(make_error(ErrorCode::Cancelled, "Upstream read cancelled"));
    }
    if (closed_) {
        return std::unexpected(make_error(
            ErrorCode::TransportReadFailure, "Read on closed body"));
    }
    if (consumed_) {
        return std::string{};
    }
    consumed_ = true;
    return std::move(data_);
}

auto BufferedBody::close() -> VoidResult {
    closed_ = true;
    return {};
}

auto make_buffered_reply(int status, std::string body) -> UpstreamReply {
    return UpstreamReply{
        .status = status,
        .body = ScopedBody(std::make_unique<BufferedBody>(std::move(body))),
    };
}

} // namespace chatrelay::relay
