#include "chatrelay/protocol/neutral.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace chatrelay::protocol::neutral {

namespace {

template <typename T>
auto encode(const T& value, std::string_view what) -> Result<std::string> {
    try {
        return json(value).dump();
    } catch (const json::type_error& e) {
        return std::unexpected(make_error(
            ErrorCode::EncodeFailure,
            "Failed to encode " + std::string(what),
            e.what()));
    }
}

// Token limits must fit an int. Whole-valued floats such as 16.0 are accepted.
auto read_token_limit(const json& v) -> int {
    constexpr auto max_limit = std::numeric_limits<int>::max();
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n > static_cast<uint64_t>(max_limit)) {
            throw json::out_of_range::create(406, "max_tokens out of range", &v);
        }
        return static_cast<int>(n);
    }
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < 0 || n > max_limit) {
            throw json::out_of_range::create(406, "max_tokens out of range", &v);
        }
        return static_cast<int>(n);
    }
    if (v.is_number_float()) {
        auto d = v.get<double>();
        if (!std::isfinite(d) || d < 0.0 || d > static_cast<double>(max_limit)) {
            throw json::out_of_range::create(406, "max_tokens out of range", &v);
        }
        return static_cast<int>(d);
    }
    throw json::type_error::create(
        302, std::string("max_tokens must be a number, got ") + v.type_name(), &v);
}

} // anonymous namespace

auto Message::content_as_text() const -> std::string {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (content.is_array()) {
        std::string text;
        for (const auto& part : content) {
            if (!part.is_object()) continue;
            if (part.value("type", "") != "text") continue;
            if (auto it = part.find("text"); it != part.end() && it->is_string()) {
                text += it->get<std::string>();
            }
        }
        return text;
    }
    return "";
}

// -- Request --

void to_json(json& j, const Message& m) {
    j = json{
        {"role", m.role},
        {"content", m.content},
    };
    if (m.name) j["name"] = *m.name;
}

void from_json(const json& j, Message& m) {
    j.at("role").get_to(m.role);
    m.content = j.value("content", json());
    if (j.contains("name") && j.at("name").is_string()) {
        m.name = j.at("name").get<std::string>();
    }
}

void to_json(json& j, const ChatRequest& r) {
    j = json{
        {"model", r.model},
        {"messages", r.messages},
        {"temperature", r.temperature},
        {"top_p", r.top_p},
        {"max_tokens", r.max_tokens},
        {"stream", r.stream},
    };
}

void from_json(const json& j, ChatRequest& r) {
    if (j.contains("model")) j.at("model").get_to(r.model);
    if (j.contains("messages")) j.at("messages").get_to(r.messages);
    if (j.contains("temperature") && !j.at("temperature").is_null()) {
        j.at("temperature").get_to(r.temperature);
    }
    if (j.contains("top_p") && !j.at("top_p").is_null()) j.at("top_p").get_to(r.top_p);
    if (j.contains("max_tokens") && !j.at("max_tokens").is_null()) {
        r.max_tokens = read_token_limit(j.at("max_tokens"));
    }
    r.stream = j.value("stream", false);
}

// -- Response --

void to_json(json& j, const Usage& u) {
    j = json{
        {"prompt_tokens", u.prompt_tokens},
        {"completion_tokens", u.completion_tokens},
        {"total_tokens", u.total_tokens},
    };
}

void from_json(const json& j, Usage& u) {
    u.prompt_tokens = j.value("prompt_tokens", 0);
    u.completion_tokens = j.value("completion_tokens", 0);
    u.total_tokens = j.value("total_tokens", 0);
}

void to_json(json& j, const ResponseMessage& m) {
    j = json{
        {"role", m.role},
        {"content", m.content},
    };
}

void from_json(const json& j, ResponseMessage& m) {
    j.at("role").get_to(m.role);
    j.at("content").get_to(m.content);
}

void to_json(json& j, const Choice& c) {
    j = json{
        {"index", c.index},
        {"message", c.message},
        {"finish_reason", c.finish_reason},
    };
}

void from_json(const json& j, Choice& c) {
    j.at("index").get_to(c.index);
    j.at("message").get_to(c.message);
    c.finish_reason = j.value("finish_reason", "");
}

void to_json(json& j, const ChatResponse& r) {
    j = json{
        {"id", r.id},
        {"object", r.object},
        {"created", r.created},
        {"model", r.model},
        {"choices", r.choices},
        {"usage", r.usage},
    };
}

void from_json(const json& j, ChatResponse& r) {
    r.id = j.value("id", "");
    r.object = j.value("object", std::string(kCompletionObject));
    r.created = j.value("created", int64_t{0});
    r.model = j.value("model", "");
    if (j.contains("choices")) j.at("choices").get_to(r.choices);
    if (j.contains("usage")) j.at("usage").get_to(r.usage);
}

// -- Stream chunk --

void to_json(json& j, const Delta& d) {
    j = json{{"content", d.content}};
}

void to_json(json& j, const StreamChoice& c) {
    j = json{
        {"index", c.index},
        {"delta", c.delta},
    };
    if (c.finish_reason) {
        j["finish_reason"] = *c.finish_reason;
    } else {
        j["finish_reason"] = nullptr;
    }
}

void to_json(json& j, const StreamChunk& c) {
    j = json{
        {"id", c.id},
        {"object", c.object},
        {"created", c.created},
        {"model", c.model},
        {"choices", c.choices},
    };
}

// -- Codec entry points --

auto decode_request(std::string_view body) -> Result<ChatRequest> {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Chat request must be a JSON object"));
        }
        return j.get<ChatRequest>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Invalid chat request",
            e.what()));
    }
}

auto encode_response(const ChatResponse& response) -> Result<std::string> {
    return encode(response, "chat completion response");
}

auto encode_chunk(const StreamChunk& chunk) -> Result<std::string> {
    return encode(chunk, "chat completion chunk");
}

} // namespace chatrelay::protocol::neutral
