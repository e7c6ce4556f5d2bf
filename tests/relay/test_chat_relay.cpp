#include <catch2/catch_test_macros.hpp>

#include <memory>

#include <nlohmann/json.hpp>

#include "chatrelay/relay/chat_relay.hpp"

#include "support/relay_fakes.hpp"

using namespace chatrelay;
using namespace chatrelay::relay;
using chatrelay::testing::FakeBody;
using chatrelay::testing::RecordingWriter;
using chatrelay::testing::run_sync;
using json = nlohmann::json;

namespace {

auto make_relay(RelayConfig config = {}) -> ChatRelay {
    return ChatRelay(std::move(config), std::make_shared<testing::ByteTokenizer>());
}

auto reply(int status, std::string body,
           std::shared_ptr<FakeBody::Counters> counters,
           bool fail_read = false, bool fail_close = false) -> UpstreamReply {
    auto fake = std::make_unique<FakeBody>(std::move(body), std::move(counters));
    fake->fail_read = fail_read;
    fake->fail_close = fail_close;
    return UpstreamReply{.status = status, .body = ScopedBody(std::move(fake))};
}

} // namespace

TEST_CASE("ChatRelay builds the upstream request", "[relay][chat]") {
    auto relay = make_relay();
    auto request = protocol::neutral::decode_request(
        R"({"model":"gemini-pro","messages":[{"role":"user","content":"hi"}],"temperature":0.5,"max_tokens":16})");
    REQUIRE(request.has_value());

    auto built = relay.build_request(*request);
    REQUIRE(built.contents.size() == 1);
    CHECK(built.generation_config.top_k == 16);

    auto encoded = relay.encode_request(*request);
    REQUIRE(encoded.has_value());
    auto j = json::parse(*encoded);
    CHECK(j["contents"][0]["parts"]["text"] == "hi");
    CHECK(j["safety_settings"].size() == 4);
}

TEST_CASE("ChatRelay relays a buffered response", "[relay][chat]") {
    auto counters = std::make_shared<FakeBody::Counters>();
    auto relay = make_relay();
    RecordingWriter writer;

    auto usage = relay.relay_response(reply(200, testing::kHelloResponse, counters),
                                      "gemini-pro", 5, writer);
    REQUIRE(usage.has_value());
    CHECK(usage->prompt_tokens == 5);
    CHECK(usage->completion_tokens == 5);
    CHECK(usage->total_tokens == 10);

    CHECK(writer.status == 200);
    CHECK(writer.headers == json_headers());
    auto body = json::parse(writer.body());
    CHECK(body["object"] == "chat.completion");
    CHECK(body["model"] == "gemini-pro");
    CHECK(body["choices"][0]["message"]["content"] == "hello");
    CHECK(body["choices"][0]["finish_reason"] == "stop");
    CHECK(body["usage"]["total_tokens"] == 10);

    CHECK(counters->closes == 1);
}

TEST_CASE("ChatRelay forwards the upstream status on success", "[relay][chat]") {
    auto counters = std::make_shared<FakeBody::Counters>();
    auto relay = make_relay();
    RecordingWriter writer;

    auto usage = relay.relay_response(reply(203, testing::kHelloResponse, counters),
                                      "gemini-pro", 0, writer);
    REQUIRE(usage.has_value());
    CHECK(writer.status == 203);
}

TEST_CASE("ChatRelay classifies an empty candidate list with the upstream status", "[relay][chat]") {
    auto counters = std::make_shared<FakeBody::Counters>();
    auto relay = make_relay();
    RecordingWriter writer;

    auto usage = relay.relay_response(reply(503, testing::kEmptyResponse, counters),
                                      "gemini-pro", 5, writer);
    REQUIRE_FALSE(usage.has_value());
    CHECK(usage.error().http_status == 503);
    CHECK(usage.error().type == "server_error");
    CHECK(usage.error().code == 500);
    CHECK(usage.error().message == "No candidates returned");

    CHECK(writer.heads == 0);
    CHECK(writer.writes.empty());
    CHECK(counters->closes == 1);
}

TEST_CASE("ChatRelay classifies transport and codec failures", "[relay][chat]") {
    auto counters = std::make_shared<FakeBody::Counters>();
    auto relay = make_relay();
    RecordingWriter writer;

    SECTION("read failure") {
        auto usage = relay.relay_response(
            reply(200, testing::kHelloResponse, counters, true), "gemini-pro", 0, writer);
        REQUIRE_FALSE(usage.has_value());
        CHECK(usage.error().code == "read_response_body_failed");
        CHECK(usage.error().http_status == 500);
    }

    SECTION("close failure") {
        auto usage = relay.relay_response(
            reply(200, testing::kHelloResponse, counters, false, true), "gemini-pro", 0, writer);
        REQUIRE_FALSE(usage.has_value());
        CHECK(usage.error().code == "close_response_body_failed");
    }

    SECTION("malformed body") {
        auto usage = relay.relay_response(
            reply(200, "<html>", counters), "gemini-pro", 0, writer);
        REQUIRE_FALSE(usage.has_value());
        CHECK(usage.error().code == "unmarshal_response_body_failed");
        CHECK(usage.error().type == "chatrelay_error");
    }

    SECTION("candidate of the wrong type") {
        auto usage = relay.relay_response(
            reply(200, R"({"candidates":[42]})", counters), "gemini-pro", 0, writer);
        REQUIRE_FALSE(usage.has_value());
        CHECK(usage.error().code == "unmarshal_response_body_failed");
        CHECK(usage.error().http_status == 500);
        CHECK(writer.heads == 0);
    }

    SECTION("write failure") {
        writer.fail_writes = true;
        auto usage = relay.relay_response(
            reply(200, testing::kHelloResponse, counters), "gemini-pro", 0, writer);
        REQUIRE_FALSE(usage.has_value());
        CHECK(usage.error().code == "write_response_body_failed");
    }

    // Every path releases the body exactly once.
    CHECK(counters->closes == 1);
}

TEST_CASE("ChatRelay relays an emulated stream", "[relay][chat]") {
    auto counters = std::make_shared<FakeBody::Counters>();
    RecordingWriter writer;

    SECTION("success") {
        auto relay = make_relay();
        auto usage = run_sync(relay.relay_stream(
            reply(200, testing::kHelloResponse, counters), "gemini-pro", 5, writer));
        REQUIRE(usage.has_value());
        CHECK(usage->completion_tokens == 5);
        CHECK(usage->total_tokens == 10);
        REQUIRE(writer.writes.size() == 2);
        CHECK(writer.writes[1] == done_frame());
    }

    SECTION("empty candidate list") {
        auto relay = make_relay();
        auto usage = run_sync(relay.relay_stream(
            reply(503, testing::kEmptyResponse, counters), "gemini-pro", 5, writer));
        REQUIRE(usage.has_value());
        CHECK(usage->completion_tokens == 0);
        REQUIRE(writer.writes.size() == 2);
        CHECK(writer.writes[0].find(R"("delta":{"content":""})") != std::string::npos);
        CHECK(writer.writes[1] == done_frame());
    }

    SECTION("background failure still reports prompt usage") {
        auto relay = make_relay();
        auto usage = run_sync(relay.relay_stream(
            reply(200, "garbage", counters), "gemini-pro", 5, writer));
        REQUIRE(usage.has_value());
        CHECK(usage->prompt_tokens == 5);
        CHECK(usage->completion_tokens == 0);
        REQUIRE(writer.writes.size() == 1);
    }

    SECTION("stream model and finish reason come from config") {
        RelayConfig config;
        config.stream_model = "gemini-pro";
        config.finish_reason = "length";
        auto relay = make_relay(config);
        auto usage = run_sync(relay.relay_stream(
            reply(200, testing::kHelloResponse, counters), "gemini-pro", 0, writer));
        REQUIRE(usage.has_value());
        REQUIRE(writer.writes.size() == 2);
        auto chunk = json::parse(writer.writes[0].substr(6));
        CHECK(chunk["model"] == "gemini-pro");
        CHECK(chunk["choices"][0]["finish_reason"] == "length");
    }

    SECTION("head failure") {
        writer.fail_head = true;
        auto relay = make_relay();
        auto usage = run_sync(relay.relay_stream(
            reply(200, testing::kHelloResponse, counters), "gemini-pro", 0, writer));
        REQUIRE_FALSE(usage.has_value());
        CHECK(usage.error().code == "write_response_body_failed");
    }

    CHECK(counters->closes == 1);
}

TEST_CASE("ChatRelay builds its tokenizer from config", "[relay][chat]") {
    Config config;
    config.tokenizer.chars_per_token["gemini"] = 1.0;
    ChatRelay relay(config);
    RecordingWriter writer;

    auto usage = relay.relay_response(make_buffered_reply(200, testing::kHelloResponse),
                                      "gemini-pro", 1, writer);
    REQUIRE(usage.has_value());
    CHECK(usage->completion_tokens == 5);
    CHECK(usage->total_tokens == 6);
}
