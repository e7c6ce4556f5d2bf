#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace chatrelay::utils {

auto generate_uuid() -> std::string;
auto unix_timestamp() -> int64_t;
auto to_lower(std::string_view s) -> std::string;

/// Returns "chatcmpl-<uuid>", the id shape of neutral completion responses.
auto completion_id() -> std::string;

} // namespace chatrelay::utils
