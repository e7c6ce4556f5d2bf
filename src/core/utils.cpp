#include "chatrelay/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>

#include <uuid.h>

namespace chatrelay::utils {

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto unix_timestamp() -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto completion_id() -> std::string {
    return "chatcmpl-" + generate_uuid();
}

} // namespace chatrelay::utils
