#include "chatrelay/relay/stream_emulator.hpp"

#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatrelay/core/logger.hpp"
#include "chatrelay/core/utils.hpp"

namespace chatrelay::relay {

using boost::asio::awaitable;

namespace gemini = protocol::gemini;
namespace neutral = protocol::neutral;

auto to_string(StreamState state) -> std::string_view {
    switch (state) {
        case StreamState::Idle: return "idle";
        case StreamState::Fetching: return "fetching";
        case StreamState::Delivered: return "delivered";
        case StreamState::Failed: return "failed";
        case StreamState::Closed: return "closed";
        default: return "unknown";
    }
}

namespace {

enum class MessageKind {
    Content,
    Done,
};

struct StreamMessage {
    MessageKind kind;
    std::string payload;
};

/// Single ordered channel between the fetch thread and the driver loop.
/// Content, when present, is always enqueued ahead of Done.
struct FetchChannel {
    std::mutex mtx;
    std::deque<StreamMessage> messages;
    std::string response_text;
    StreamState fetch_state = StreamState::Fetching;

    void finish_delivered(std::string payload, std::string text) {
        std::lock_guard lock(mtx);
        response_text = std::move(text);
        fetch_state = StreamState::Delivered;
        messages.push_back({MessageKind::Content, std::move(payload)});
        messages.push_back({MessageKind::Done, {}});
    }

    void finish_failed() {
        std::lock_guard lock(mtx);
        fetch_state = StreamState::Failed;
        messages.push_back({MessageKind::Done, {}});
    }
};

/// Runs on the fetch thread. Owns the body for its whole lifetime and
/// closes it exactly once on every path.
void fetch_and_publish(ScopedBody body,
                       const ResponseTranslator& translator,
                       const ChunkStamp& stamp,
                       const CancellationToken& token,
                       FetchChannel& channel) {
    auto data = body.read_all(token);
    if (!data) {
        if (auto closed = body.close(); !closed) {
            LOG_WARN("error closing stream response after failed read: {}",
                     closed.error().what());
        }
        if (data.error().code() == ErrorCode::Cancelled) {
            LOG_INFO("stream response read abandoned: {}", data.error().what());
        } else {
            LOG_ERROR("error reading stream response: {}", data.error().what());
        }
        channel.finish_failed();
        return;
    }

    if (auto closed = body.close(); !closed) {
        LOG_ERROR("error closing stream response: {}", closed.error().what());
        channel.finish_failed();
        return;
    }

    auto decoded = gemini::decode_response(*data);
    if (!decoded) {
        LOG_ERROR("error unmarshalling stream response: {}", decoded.error().what());
        channel.finish_failed();
        return;
    }

    auto chunk = translator.to_stream_chunk(*decoded, stamp);
    auto payload = neutral::encode_chunk(chunk);
    if (!payload) {
        LOG_ERROR("error marshalling stream response: {}", payload.error().what());
        channel.finish_failed();
        return;
    }

    if (token.is_cancelled()) {
        LOG_DEBUG("stream {} cancelled before delivery, chunk discarded", stamp.id);
    }
    channel.finish_delivered(std::move(*payload), first_candidate_text(*decoded));
}

auto write_frame(ResponseWriter& writer, std::string_view frame) -> VoidResult {
    if (auto written = writer.write(frame); !written) {
        return written;
    }
    return writer.flush();
}

} // anonymous namespace

StreamEmulator::StreamEmulator(std::shared_ptr<const ResponseTranslator> translator,
                               StreamOptions options)
    : translator_(std::move(translator)), options_(std::move(options)) {
    if (!translator_) {
        throw std::invalid_argument("StreamEmulator requires a response translator");
    }
}

auto StreamEmulator::run(ScopedBody body, ResponseWriter& writer, CancellationToken token)
    -> awaitable<Result<StreamOutcome>> {
    auto expected = StreamState::Idle;
    if (!state_.compare_exchange_strong(expected, StreamState::Fetching)) {
        co_return make_fail(make_error(
            ErrorCode::InvalidArgument, "StreamEmulator::run called more than once"));
    }

    // The driver runs on its own strand so that wakeups posted by the fetch
    // thread cannot interleave with the check-then-wait in the loop.
    auto executor = co_await boost::asio::this_coro::executor;
    co_return co_await boost::asio::co_spawn(
        boost::asio::make_strand(executor),
        drive(std::move(body), writer, std::move(token)),
        boost::asio::use_awaitable);
}

auto StreamEmulator::drive(ScopedBody body, ResponseWriter& writer, CancellationToken token)
    -> awaitable<Result<StreamOutcome>> {
    auto executor = co_await boost::asio::this_coro::executor;
    StreamOutcome outcome;

    auto started = writer.write_head(200, event_stream_headers());
    if (started) {
        started = writer.flush();
    }
    if (!started) {
        if (auto closed = body.close(); !closed) {
            LOG_WARN("error closing stream response: {}", closed.error().what());
        }
        state_.store(StreamState::Closed, std::memory_order_release);
        co_return make_fail(make_error(
            ErrorCode::WriteFailure,
            "Failed to start event stream",
            started.error().what()));
    }

    ChunkStamp stamp{
        .id = utils::completion_id(),
        .created = utils::unix_timestamp(),
        .model = options_.model,
    };

    auto channel = std::make_shared<FetchChannel>();
    auto timer = std::make_shared<boost::asio::steady_timer>(
        executor, boost::asio::steady_timer::time_point::max());

    // Caller cancellation and the optional deadline both fire `stop`.
    auto stop = std::make_shared<CancellationSource>();
    auto caller_link = token.on_cancel([stop] { stop->cancel(); });
    auto wake = stop->token().on_cancel([timer] {
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    });

    std::shared_ptr<boost::asio::steady_timer> deadline;
    if (options_.timeout.count() > 0) {
        deadline = std::make_shared<boost::asio::steady_timer>(executor, options_.timeout);
        boost::asio::co_spawn(executor,
            [deadline, stop, id = stamp.id]() -> awaitable<void> {
                boost::system::error_code ec;
                co_await deadline->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (!ec) {
                    LOG_WARN("stream {} exceeded its deadline, terminating", id);
                    stop->cancel();
                }
            },
            boost::asio::detached);
    }

    LOG_DEBUG("stream {} fetching upstream body", stamp.id);

    // Outstanding work keeps the executor's context running until the fetch
    // thread has posted its final wakeup.
    boost::asio::any_io_executor work = boost::asio::prefer(
        executor, boost::asio::execution::outstanding_work.tracked);

    std::thread([channel, timer, work, stamp,
                 translator = translator_,
                 fetch_token = stop->token(),
                 body = std::move(body)]() mutable {
        fetch_and_publish(std::move(body), *translator, stamp, fetch_token, *channel);

        auto notify_executor = timer->get_executor();
        boost::asio::post(notify_executor, [timer = std::move(timer)] { timer->cancel(); });
        work = boost::asio::any_io_executor();
    }).detach();

    auto stop_token = stop->token();
    bool finished = false;
    while (!finished) {
        std::deque<StreamMessage> batch;
        {
            std::lock_guard lock(channel->mtx);
            batch.swap(channel->messages);
        }

        for (auto& message : batch) {
            if (message.kind == MessageKind::Content) {
                state_.store(StreamState::Delivered, std::memory_order_release);
                if (auto written = write_frame(writer, format_data_frame(message.payload));
                    !written) {
                    LOG_WARN("stream {} write failed, stopping: {}",
                             stamp.id, written.error().what());
                    finished = true;
                    break;
                }
                ++outcome.frames_written;
                continue;
            }

            if (state_.load(std::memory_order_acquire) != StreamState::Delivered) {
                state_.store(StreamState::Failed, std::memory_order_release);
            }
            if (auto written = write_frame(writer, done_frame()); written) {
                ++outcome.frames_written;
                outcome.completed = true;
            } else {
                LOG_WARN("stream {} terminal frame write failed: {}",
                         stamp.id, written.error().what());
            }
            finished = true;
            break;
        }
        if (finished) break;

        if (stop_token.is_cancelled()) {
            LOG_INFO("stream {} cancelled, sending terminal frame", stamp.id);
            outcome.cancelled = true;
            if (auto written = write_frame(writer, done_frame()); written) {
                ++outcome.frames_written;
                outcome.completed = true;
            } else {
                LOG_WARN("stream {} terminal frame write failed: {}",
                         stamp.id, written.error().what());
            }
            break;
        }

        boost::system::error_code ec;
        timer->expires_at(boost::asio::steady_timer::time_point::max());
        co_await timer->async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    wake.reset();
    caller_link.reset();
    if (deadline) {
        deadline->cancel();
    }

    {
        std::lock_guard lock(channel->mtx);
        outcome.fetch_state = channel->fetch_state;
        if (outcome.fetch_state == StreamState::Delivered) {
            outcome.response_text = channel->response_text;
        }
    }

    state_.store(StreamState::Closed, std::memory_order_release);
    LOG_DEBUG("stream {} closed: fetch={} frames={} completed={}",
              stamp.id, to_string(outcome.fetch_state), outcome.frames_written,
              outcome.completed);
    co_return outcome;
}

} // namespace chatrelay::relay
