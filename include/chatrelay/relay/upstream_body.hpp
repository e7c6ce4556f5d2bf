#pragma once

#include <memory>
#include <string>

#include "chatrelay/core/cancellation.hpp"
#include "chatrelay/core/error.hpp"

namespace chatrelay::relay {

/// Body of an upstream HTTP response, produced by the transport layer.
///
/// `read_all` blocks until the body is fully read; implementations should
/// poll `token` and return a Cancelled error once it fires. `close` releases
/// the underlying connection. Neither is ever called concurrently.
class UpstreamBody {
public:
    virtual ~UpstreamBody() = default;

    virtual auto read_all(const CancellationToken& token) -> Result<std::string> = 0;
    virtual auto close() -> VoidResult = 0;
};

/// Exclusive owner of an UpstreamBody. Move-only; ownership is handed from
/// task to task by moving the handle.
///
/// The underlying body is closed at most once: the first close() forwards
/// to the body and reports its outcome, later calls are no-ops returning
/// success. The destructor closes a body that is still open and logs, but
/// never propagates, a close failure.
class ScopedBody {
public:
    ScopedBody() = default;
    explicit ScopedBody(std::unique_ptr<UpstreamBody> body);
    ~ScopedBody();

    ScopedBody(const ScopedBody&) = delete;
    ScopedBody& operator=(const ScopedBody&) = delete;
    ScopedBody(ScopedBody&& other) noexcept;
    ScopedBody& operator=(ScopedBody&& other) noexcept;

    auto read_all(const CancellationToken& token = {}) -> Result<std::string>;
    auto close() -> VoidResult;

    [[nodiscard]] auto valid() const noexcept -> bool { return body_ != nullptr; }
    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }

private:
    std::unique_ptr<UpstreamBody> body_;
    bool closed_ = false;
};

/// An upstream body that is already in memory.
class BufferedBody final : public UpstreamBody {
public:
    explicit BufferedBody(std::string data);

    auto read_all(const CancellationToken& token) -> Result<std::string> override;
    auto close() -> VoidResult override;

private:
    std::string data_;
    bool consumed_ = false;
    bool closed_ = false;
};

/// What the gateway hands the adapter after performing the upstream call.
struct UpstreamReply {
    int status = 200;
    ScopedBody body;
};

/// Convenience for callers holding a fully-read body.
[[nodiscard]] auto make_buffered_reply(int status, std::string body) -> UpstreamReply;

} // namespace chatrelay::relay
