#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatrelay/core/cancellation.hpp"
#include "chatrelay/core/error.hpp"
#include "chatrelay/relay/response_translator.hpp"
#include "chatrelay/relay/response_writer.hpp"
#include "chatrelay/relay/upstream_body.hpp"

namespace chatrelay::relay {

/// Lifecycle of one emulated stream:
/// Idle -> Fetching -> {Delivered, Failed} -> Closed.
enum class StreamState {
    Idle,
    Fetching,
    Delivered,
    Failed,
    Closed,
};

auto to_string(StreamState state) -> std::string_view;

struct StreamOptions {
    /// Value of the `model` field in emitted chunks.
    std::string model = "gemini";
    /// Zero disables the deadline.
    std::chrono::milliseconds timeout{0};
};

struct StreamOutcome {
    /// Delivered or Failed once the fetch finished; Fetching when the stream
    /// was cancelled before the fetch reported back.
    StreamState fetch_state = StreamState::Idle;
    /// First-candidate text, empty unless Delivered.
    std::string response_text;
    std::size_t frames_written = 0;
    /// True when the terminal frame reached the writer.
    bool completed = false;
    bool cancelled = false;
};

/// Delivers a buffered upstream reply as a server-push stream.
///
/// One emulator serves one request. run() writes the event-stream head,
/// hands the body to a background thread that reads, closes, decodes and
/// translates it, and drives the writer from a strand until the background
/// side signals completion. The writer always sees either
/// [content frame, terminal frame] or [terminal frame]; the terminal frame
/// is last and written once. Background failures are logged only.
class StreamEmulator {
public:
    StreamEmulator(std::shared_ptr<const ResponseTranslator> translator,
                   StreamOptions options = {});

    StreamEmulator(const StreamEmulator&) = delete;
    StreamEmulator& operator=(const StreamEmulator&) = delete;

    /// Fails (WriteFailure) only when the stream could not be started; the
    /// body is closed in that case too. Must be called once.
    auto run(ScopedBody body, ResponseWriter& writer, CancellationToken token = {})
        -> boost::asio::awaitable<Result<StreamOutcome>>;

    [[nodiscard]] auto state() const noexcept -> StreamState {
        return state_.load(std::memory_order_acquire);
    }

private:
    auto drive(ScopedBody body, ResponseWriter& writer, CancellationToken token)
        -> boost::asio::awaitable<Result<StreamOutcome>>;

    std::shared_ptr<const ResponseTranslator> translator_;
    StreamOptions options_;
    std::atomic<StreamState> state_{StreamState::Idle};
};

} // namespace chatrelay::relay
