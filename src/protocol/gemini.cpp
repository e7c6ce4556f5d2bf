#include "chatrelay/protocol/gemini.hpp"

#include <string>
#include <string_view>

#include "chatrelay/core/logger.hpp"

namespace chatrelay::protocol::gemini {

namespace {

/// Null decodes as the empty value; any other non-object contradicts the
/// schema and is rejected the way nlohmann rejects a mistyped field.
auto object_or_null(const json& j, std::string_view what) -> bool {
    if (j.is_null()) {
        return false;
    }
    if (!j.is_object()) {
        throw json::type_error::create(
            302, std::string(what) + " must be an object, got " + j.type_name(), &j);
    }
    return true;
}

} // anonymous namespace

auto default_safety_settings() -> std::vector<SafetySetting> {
    return {
        {"HARM_CATEGORY_HARASSMENT", "BLOCK_ONLY_HIGH"},
        {"HARM_CATEGORY_HATE_SPEECH", "BLOCK_ONLY_HIGH"},
        {"HARM_CATEGORY_SEXUALLY_EXPLICIT", "BLOCK_ONLY_HIGH"},
        {"HARM_CATEGORY_DANGEROUS_CONTENT", "BLOCK_ONLY_HIGH"},
    };
}

// -- Request serialization --

void to_json(json& j, const RequestPart& p) {
    j = json{{"text", p.text}};
}

void to_json(json& j, const RequestContent& c) {
    j = json{
        {"role", c.role},
        {"parts", c.parts},
    };
}

void to_json(json& j, const SafetySetting& s) {
    j = json{
        {"category", s.category},
        {"threshold", s.threshold},
    };
}

void from_json(const json& j, SafetySetting& s) {
    j.at("category").get_to(s.category);
    j.at("threshold").get_to(s.threshold);
}

void to_json(json& j, const GenerationConfig& g) {
    j = json{
        {"temperature", g.temperature},
        {"topP", g.top_p},
        {"topK", g.top_k},
        {"maxOutputTokens", g.max_output_tokens},
    };
}

void to_json(json& j, const ChatRequest& r) {
    j = json{
        {"contents", r.contents},
        {"safety_settings", r.safety_settings},
        {"generation_config", r.generation_config},
    };
}

// -- Response serialization --

void to_json(json& j, const Part& p) {
    j = json{{"text", p.text}};
}

void from_json(const json& j, Part& p) {
    if (!object_or_null(j, "part")) return;
    if (j.contains("text")) j.at("text").get_to(p.text);
}

void to_json(json& j, const Content& c) {
    j = json{
        {"parts", c.parts},
        {"role", c.role},
    };
}

void from_json(const json& j, Content& c) {
    if (!object_or_null(j, "content")) return;
    if (j.contains("parts") && !j.at("parts").is_null()) j.at("parts").get_to(c.parts);
    if (j.contains("role")) j.at("role").get_to(c.role);
}

void to_json(json& j, const SafetyRating& r) {
    j = json{
        {"category", r.category},
        {"probability", r.probability},
    };
}

void from_json(const json& j, SafetyRating& r) {
    if (!object_or_null(j, "safety rating")) return;
    if (j.contains("category")) j.at("category").get_to(r.category);
    if (j.contains("probability")) j.at("probability").get_to(r.probability);
}

void to_json(json& j, const Candidate& c) {
    j = json{
        {"content", c.content},
        {"finishReason", c.finish_reason},
        {"index", c.index},
        {"safetyRatings", c.safety_ratings},
    };
}

void from_json(const json& j, Candidate& c) {
    if (!object_or_null(j, "candidate")) return;
    if (j.contains("content") && !j.at("content").is_null()) j.at("content").get_to(c.content);
    if (j.contains("finishReason")) j.at("finishReason").get_to(c.finish_reason);
    if (j.contains("index")) j.at("index").get_to(c.index);
    if (j.contains("safetyRatings") && !j.at("safetyRatings").is_null()) {
        j.at("safetyRatings").get_to(c.safety_ratings);
    }
}

void to_json(json& j, const PromptFeedback& f) {
    j = json{{"safetyRatings", f.safety_ratings}};
}

void from_json(const json& j, PromptFeedback& f) {
    if (!object_or_null(j, "prompt feedback")) return;
    if (j.contains("safetyRatings") && !j.at("safetyRatings").is_null()) {
        j.at("safetyRatings").get_to(f.safety_ratings);
    }
}

void to_json(json& j, const ChatResponse& r) {
    j = json{
        {"candidates", r.candidates},
        {"promptFeedback", r.prompt_feedback},
    };
}

void from_json(const json& j, ChatResponse& r) {
    if (!object_or_null(j, "response")) return;
    if (j.contains("candidates") && !j.at("candidates").is_null()) {
        j.at("candidates").get_to(r.candidates);
    }
    if (j.contains("promptFeedback") && !j.at("promptFeedback").is_null()) {
        j.at("promptFeedback").get_to(r.prompt_feedback);
    }
}

// -- Codec entry points --

auto decode_response(std::string_view body) -> Result<ChatResponse> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(
            ErrorCode::DecodeFailure,
            "Failed to parse Gemini response",
            e.what()));
    }

    // A literal null decodes to an empty response.
    if (j.is_null()) {
        return ChatResponse{};
    }
    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::DecodeFailure,
            "Failed to parse Gemini response",
            std::string("expected a JSON object, got ") + j.type_name()));
    }

    try {
        return j.get<ChatResponse>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::DecodeFailure,
            "Gemini response does not match the expected schema",
            e.what()));
    }
}

auto encode_request(const ChatRequest& request) -> Result<std::string> {
    try {
        return json(request).dump();
    } catch (const json::type_error& e) {
        LOG_DEBUG("Gemini request encode failed: {}", e.what());
        return std::unexpected(make_error(
            ErrorCode::EncodeFailure,
            "Failed to encode Gemini request",
            e.what()));
    }
}

} // namespace chatrelay::protocol::gemini
