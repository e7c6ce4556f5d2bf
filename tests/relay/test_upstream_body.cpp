#include <catch2/catch_test_macros.hpp>

#include <memory>

#include "chatrelay/relay/upstream_body.hpp"

#include "support/relay_fakes.hpp"

using namespace chatrelay;
using namespace chatrelay::relay;
using chatrelay::testing::FakeBody;

TEST_CASE("ScopedBody closes the body exactly once", "[relay][body]") {
    auto counters = std::make_shared<FakeBody::Counters>();

    SECTION("explicit close twice") {
        ScopedBody body(std::make_unique<FakeBody>("x", counters));
        CHECK(body.close().has_value());
        CHECK(body.close().has_value());
        CHECK(body.closed());
        CHECK(counters->closes == 1);
    }

    SECTION("destructor closes an open body") {
        {
            ScopedBody body(std::make_unique<FakeBody>("x", counters));
            CHECK_FALSE(body.closed());
        }
        CHECK(counters->closes == 1);
    }

    SECTION("destructor after explicit close") {
        {
            ScopedBody body(std::make_unique<FakeBody>("x", counters));
            REQUIRE(body.close().has_value());
        }
        CHECK(counters->closes == 1);
    }

    SECTION("moving hands over ownership") {
        {
            ScopedBody first(std::make_unique<FakeBody>("x", counters));
            ScopedBody second(std::move(first));
            CHECK_FALSE(first.valid());
            CHECK(second.valid());
            CHECK(first.close().has_value());
        }
        CHECK(counters->closes == 1);
    }

    SECTION("move assignment closes the replaced body") {
        auto other = std::make_shared<FakeBody::Counters>();
        {
            ScopedBody target(std::make_unique<FakeBody>("old", counters));
            target = ScopedBody(std::make_unique<FakeBody>("new", other));
            CHECK(counters->closes == 1);
            CHECK(other->closes == 0);
        }
        CHECK(other->closes == 1);
    }
}

TEST_CASE("ScopedBody close failure is reported once and never repeated", "[relay][body]") {
    auto counters = std::make_shared<FakeBody::Counters>();
    auto fake = std::make_unique<FakeBody>("x", counters);
    fake->fail_close = true;

    {
        ScopedBody body(std::move(fake));
        auto first = body.close();
        REQUIRE_FALSE(first.has_value());
        CHECK(first.error().code() == ErrorCode::BodyCloseFailure);
        CHECK(body.close().has_value());
    }
    CHECK(counters->closes == 1);
}

TEST_CASE("ScopedBody read rules", "[relay][body]") {
    SECTION("empty handle") {
        ScopedBody body;
        auto read = body.read_all();
        REQUIRE_FALSE(read.has_value());
        CHECK(read.error().code() == ErrorCode::TransportReadFailure);
        CHECK(body.close().has_value());
    }

    SECTION("read after close") {
        ScopedBody body(std::make_unique<FakeBody>("x"));
        REQUIRE(body.close().has_value());
        CHECK_FALSE(body.read_all().has_value());
    }

    SECTION("read forwards") {
        ScopedBody body(std::make_unique<FakeBody>("payload"));
        auto read = body.read_all();
        REQUIRE(read.has_value());
        CHECK(*read == "payload");
    }
}

TEST_CASE("BufferedBody", "[relay][body]") {
    SECTION("reads once") {
        BufferedBody body("abc");
        auto first = body.read_all(CancellationToken{});
        REQUIRE(first.has_value());
        CHECK(*first == "abc");
        auto second = body.read_all(CancellationToken{});
        REQUIRE(second.has_value());
        CHECK(second->empty());
    }

    SECTION("observes cancellation") {
        BufferedBody body("abc");
        CancellationSource source;
        source.cancel();
        auto read = body.read_all(source.token());
        REQUIRE_FALSE(read.has_value());
        CHECK(read.error().code() == ErrorCode::Cancelled);
    }

    SECTION("make_buffered_reply") {
        auto reply = make_buffered_reply(503, "{}");
        CHECK(reply.status == 503);
        REQUIRE(reply.body.valid());
        auto read = reply.body.read_all();
        REQUIRE(read.has_value());
        CHECK(*read == "{}");
    }
}
