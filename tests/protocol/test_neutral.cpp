#include <catch2/catch_test_macros.hpp>

#include <string>

#include <nlohmann/json.hpp>

#include "chatrelay/protocol/neutral.hpp"

using namespace chatrelay;
using namespace chatrelay::protocol;
using json = nlohmann::json;

TEST_CASE("decode_request parses a chat completion request", "[protocol][neutral]") {
    auto req = neutral::decode_request(R"({
        "model": "gemini-pro",
        "messages": [
            {"role": "system", "content": "be brief"},
            {"role": "user", "content": "hi", "name": "ada"}
        ],
        "temperature": 0.5,
        "top_p": 0.8,
        "max_tokens": 16,
        "stream": true
    })");

    REQUIRE(req.has_value());
    CHECK(req->model == "gemini-pro");
    REQUIRE(req->messages.size() == 2);
    CHECK(req->messages[0].role == "system");
    CHECK(req->messages[1].content_as_text() == "hi");
    REQUIRE(req->messages[1].name.has_value());
    CHECK(*req->messages[1].name == "ada");
    CHECK(req->temperature == 0.5);
    CHECK(req->top_p == 0.8);
    CHECK(req->max_tokens == 16);
    CHECK(req->stream);
}

TEST_CASE("decode_request defaults optional fields", "[protocol][neutral]") {
    auto req = neutral::decode_request(R"({"messages":[{"role":"user","content":"x"}],"temperature":null})");
    REQUIRE(req.has_value());
    CHECK(req->temperature == 0.0);
    CHECK(req->max_tokens == 0);
    CHECK_FALSE(req->stream);
}

TEST_CASE("decode_request rejects bad input", "[protocol][neutral]") {
    SECTION("malformed") {
        auto req = neutral::decode_request("{");
        REQUIRE_FALSE(req.has_value());
        CHECK(req.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("message without role") {
        auto req = neutral::decode_request(R"({"messages":[{"content":"x"}]})");
        REQUIRE_FALSE(req.has_value());
        CHECK(req.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("array body") {
        CHECK_FALSE(neutral::decode_request("[]").has_value());
    }
}

TEST_CASE("decode_request bounds max_tokens", "[protocol][neutral]") {
    auto decode_limit = [](const std::string& value) {
        return neutral::decode_request(
            R"({"messages":[{"role":"user","content":"x"}],"max_tokens":)" + value + "}");
    };

    SECTION("largest int") {
        auto req = decode_limit("2147483647");
        REQUIRE(req.has_value());
        CHECK(req->max_tokens == 2147483647);
    }

    SECTION("whole float") {
        auto req = decode_limit("16.0");
        REQUIRE(req.has_value());
        CHECK(req->max_tokens == 16);
    }

    SECTION("beyond int") {
        auto req = decode_limit("5000000000");
        REQUIRE_FALSE(req.has_value());
        CHECK(req.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("huge float") {
        auto req = decode_limit("1e12");
        REQUIRE_FALSE(req.has_value());
        CHECK(req.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("negative") {
        auto req = decode_limit("-1");
        REQUIRE_FALSE(req.has_value());
        CHECK(req.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("string") {
        auto req = decode_limit(R"("16")");
        REQUIRE_FALSE(req.has_value());
        CHECK(req.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("content_as_text flattens content", "[protocol][neutral]") {
    neutral::Message msg;

    SECTION("string") {
        msg.content = "plain";
        CHECK(msg.content_as_text() == "plain");
    }

    SECTION("typed parts") {
        msg.content = json::parse(R"([
            {"type": "text", "text": "look at "},
            {"type": "image_url", "image_url": {"url": "http://x/y.png"}},
            {"type": "text", "text": "this"}
        ])");
        CHECK(msg.content_as_text() == "look at this");
    }

    SECTION("null") {
        CHECK(msg.content_as_text() == "");
    }
}

TEST_CASE("encode_response uses snake_case wire names", "[protocol][neutral]") {
    neutral::ChatResponse resp;
    resp.id = "chatcmpl-1";
    resp.created = 1700000000;
    resp.model = "gemini-pro";
    resp.choices.push_back({.index = 0,
                            .message = {.role = "assistant", .content = "hello"},
                            .finish_reason = "stop"});
    resp.usage = {.prompt_tokens = 5, .completion_tokens = 2, .total_tokens = 7};

    auto encoded = neutral::encode_response(resp);
    REQUIRE(encoded.has_value());
    auto j = json::parse(*encoded);

    CHECK(j["object"] == "chat.completion");
    CHECK(j["choices"][0]["message"]["content"] == "hello");
    CHECK(j["choices"][0]["finish_reason"] == "stop");
    CHECK(j["usage"]["prompt_tokens"] == 5);
    CHECK(j["usage"]["completion_tokens"] == 2);
    CHECK(j["usage"]["total_tokens"] == 7);

    auto back = j.get<neutral::ChatResponse>();
    CHECK(back.choices[0].message.content == "hello");
    CHECK(back.usage.total_tokens == 7);
}

TEST_CASE("encode_chunk writes a chunk object", "[protocol][neutral]") {
    neutral::StreamChunk chunk;
    chunk.id = "chatcmpl-2";
    chunk.model = "gemini";

    neutral::StreamChoice choice;
    choice.delta.content = "hello";
    chunk.choices.push_back(choice);

    auto encoded = neutral::encode_chunk(chunk);
    REQUIRE(encoded.has_value());
    auto j = json::parse(*encoded);
    CHECK(j["object"] == "chat.completion.chunk");
    CHECK(j["choices"][0]["delta"]["content"] == "hello");
    CHECK(j["choices"][0]["finish_reason"].is_null());

    chunk.choices[0].finish_reason = "stop";
    auto with_reason = json::parse(*neutral::encode_chunk(chunk));
    CHECK(with_reason["choices"][0]["finish_reason"] == "stop");
}

TEST_CASE("encode_response fails on invalid UTF-8", "[protocol][neutral]") {
    neutral::ChatResponse resp;
    resp.choices.push_back({.index = 0,
                            .message = {.role = "assistant", .content = std::string("\xc3")},
                            .finish_reason = "stop"});
    auto encoded = neutral::encode_response(resp);
    REQUIRE_FALSE(encoded.has_value());
    CHECK(encoded.error().code() == ErrorCode::EncodeFailure);
}
