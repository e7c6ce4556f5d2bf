#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <memory>
#include <stdexcept>

#include "chatrelay/relay/usage_estimator.hpp"

#include "support/relay_fakes.hpp"

using namespace chatrelay;
using namespace chatrelay::relay;

TEST_CASE("EstimatingTokenizer counts ASCII by ratio", "[relay][usage]") {
    EstimatingTokenizer tokenizer{TokenizerConfig{}};

    CHECK(tokenizer.count_tokens("", "gemini-pro") == 0);
    CHECK(tokenizer.count_tokens("abc", "gemini-pro") == 1);
    CHECK(tokenizer.count_tokens("abcd", "gemini-pro") == 1);
    CHECK(tokenizer.count_tokens("abcde", "gemini-pro") == 2);
    CHECK(tokenizer.count_tokens("hello", "gemini-pro") == 2);
}

TEST_CASE("EstimatingTokenizer counts each non-ASCII code point", "[relay][usage]") {
    EstimatingTokenizer tokenizer{TokenizerConfig{}};

    // Three CJK code points, three bytes each.
    CHECK(tokenizer.count_tokens("\xe4\xbd\xa0\xe5\xa5\xbd\xe5\x90\x97", "gemini") == 3);
    // "ab" + one two-byte code point + "cd".
    CHECK(tokenizer.count_tokens("ab\xc3\xa9" "cd", "gemini") == 3);
}

TEST_CASE("EstimatingTokenizer picks the longest model prefix", "[relay][usage]") {
    TokenizerConfig config;
    config.default_chars_per_token = 4.0;
    config.chars_per_token["gemini"] = 2.0;
    config.chars_per_token["gemini-pro"] = 8.0;
    EstimatingTokenizer tokenizer{config};

    CHECK(tokenizer.chars_per_token("gemini-pro-vision") == 8.0);
    CHECK(tokenizer.chars_per_token("GEMINI-1.0") == 2.0);
    CHECK(tokenizer.chars_per_token("palm") == 4.0);
    CHECK(tokenizer.count_tokens("12345678", "gemini-pro") == 1);
    CHECK(tokenizer.count_tokens("12345678", "gemini-ultra") == 4);
}

TEST_CASE("UsageEstimator sums prompt and completion", "[relay][usage]") {
    UsageEstimator usage(std::make_shared<testing::ByteTokenizer>());

    auto u = usage.make_usage(5, "hello", "gemini-pro");
    CHECK(u.prompt_tokens == 5);
    CHECK(u.completion_tokens == 5);
    CHECK(u.total_tokens == u.prompt_tokens + u.completion_tokens);

    auto empty = usage.make_usage(3, "", "gemini-pro");
    CHECK(empty.completion_tokens == 0);
    CHECK(empty.total_tokens == 3);
}

TEST_CASE("UsageEstimator keeps totals in range", "[relay][usage]") {
    UsageEstimator usage(std::make_shared<testing::ByteTokenizer>());
    constexpr int max_int = std::numeric_limits<int>::max();

    SECTION("total saturates") {
        auto u = usage.make_usage(max_int, "hello", "gemini-pro");
        CHECK(u.prompt_tokens == max_int);
        CHECK(u.completion_tokens == 5);
        CHECK(u.total_tokens == max_int);
    }

    SECTION("negative prompt count is treated as zero") {
        auto u = usage.make_usage(-7, "hello", "gemini-pro");
        CHECK(u.prompt_tokens == 0);
        CHECK(u.total_tokens == 5);
    }
}

TEST_CASE("UsageEstimator requires a tokenizer", "[relay][usage]") {
    CHECK_THROWS_AS(UsageEstimator(nullptr), std::invalid_argument);
}
