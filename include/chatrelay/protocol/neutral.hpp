#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatrelay/core/error.hpp"

namespace chatrelay::protocol::neutral {

using json = nlohmann::json;

inline constexpr std::string_view kCompletionObject = "chat.completion";
inline constexpr std::string_view kChunkObject = "chat.completion.chunk";
inline constexpr std::string_view kAssistantRole = "assistant";

/// A caller message. `content` is kept as received: either a string or a
/// list of typed parts ({"type": "text", "text": ...}, image parts, ...).
struct Message {
    std::string role;
    json content;
    std::optional<std::string> name;

    /// Flattens the content to plain text. A string is returned as is; a
    /// list yields the concatenated text of its "text" parts; anything else
    /// yields an empty string.
    [[nodiscard]] auto content_as_text() const -> std::string;
};

struct ChatRequest {
    std::string model;
    std::vector<Message> messages;
    double temperature = 0.0;
    double top_p = 0.0;
    int max_tokens = 0;
    bool stream = false;
};

struct Usage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;
};

struct ResponseMessage {
    std::string role;
    std::string content;
};

struct Choice {
    int index = 0;
    ResponseMessage message;
    std::string finish_reason;
};

struct ChatResponse {
    std::string id;
    std::string object{kCompletionObject};
    int64_t created = 0;
    std::string model;
    std::vector<Choice> choices;
    Usage usage;
};

struct Delta {
    std::string content;
};

struct StreamChoice {
    int index = 0;
    Delta delta;
    std::optional<std::string> finish_reason;
};

struct StreamChunk {
    std::string id;
    std::string object{kChunkObject};
    int64_t created = 0;
    std::string model;
    std::vector<StreamChoice> choices;
};

void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);
void to_json(json& j, const ChatRequest& r);
void from_json(const json& j, ChatRequest& r);
void to_json(json& j, const Usage& u);
void from_json(const json& j, Usage& u);
void to_json(json& j, const ResponseMessage& m);
void from_json(const json& j, ResponseMessage& m);
void to_json(json& j, const Choice& c);
void from_json(const json& j, Choice& c);
void to_json(json& j, const ChatResponse& r);
void from_json(const json& j, ChatResponse& r);
void to_json(json& j, const Delta& d);
void to_json(json& j, const StreamChoice& c);
void to_json(json& j, const StreamChunk& c);

/// Parse a caller request body.
auto decode_request(std::string_view body) -> Result<ChatRequest>;

/// Serialize to compact JSON. Fails with EncodeFailure when a string field
/// holds invalid UTF-8.
auto encode_response(const ChatResponse& response) -> Result<std::string>;
auto encode_chunk(const StreamChunk& chunk) -> Result<std::string>;

} // namespace chatrelay::protocol::neutral
