#include <catch2/catch_test_macros.hpp>

#include "chatrelay/core/utils.hpp"

TEST_CASE("generate_uuid produces valid format", "[utils]") {
    auto uuid = chatrelay::utils::generate_uuid();

    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[18] == '-');
    CHECK(uuid[23] == '-');
    CHECK(uuid != chatrelay::utils::generate_uuid());
}

TEST_CASE("completion_id carries the chatcmpl prefix", "[utils]") {
    auto id = chatrelay::utils::completion_id();
    CHECK(id.starts_with("chatcmpl-"));
    CHECK(id.size() == 9 + 36);
    CHECK(id != chatrelay::utils::completion_id());
}

TEST_CASE("unix_timestamp is in seconds", "[utils]") {
    auto seconds = chatrelay::utils::unix_timestamp();
    CHECK(seconds > 1'600'000'000);
    CHECK(seconds < 100'000'000'000);
}

TEST_CASE("to_lower folds ASCII only", "[utils]") {
    CHECK(chatrelay::utils::to_lower("Gemini-PRO") == "gemini-pro");
    CHECK(chatrelay::utils::to_lower("") == "");
}
