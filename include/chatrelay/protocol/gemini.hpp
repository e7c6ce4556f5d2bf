#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatrelay/core/error.hpp"

namespace chatrelay::protocol::gemini {

using json = nlohmann::json;

// -- Request side (generateContent) --

/// The request schema carries a single part object per content entry,
/// not a list.
struct RequestPart {
    std::string text;
};

struct RequestContent {
    std::string role;
    RequestPart parts;
};

struct SafetySetting {
    std::string category;
    std::string threshold;

    auto operator==(const SafetySetting&) const -> bool = default;
};

struct GenerationConfig {
    double temperature = 0.0;
    double top_p = 0.0;
    int top_k = 0;
    int max_output_tokens = 0;
};

struct ChatRequest {
    std::vector<RequestContent> contents;
    std::vector<SafetySetting> safety_settings;
    GenerationConfig generation_config;
};

/// The four harm categories sent with every request, each at BLOCK_ONLY_HIGH.
auto default_safety_settings() -> std::vector<SafetySetting>;

// -- Response side --

struct Part {
    std::string text;
};

struct Content {
    std::vector<Part> parts;
    std::string role;
};

struct SafetyRating {
    std::string category;
    std::string probability;
};

struct Candidate {
    Content content;
    std::string finish_reason;
    int64_t index = 0;
    std::vector<SafetyRating> safety_ratings;
};

struct PromptFeedback {
    std::vector<SafetyRating> safety_ratings;
};

struct ChatResponse {
    std::vector<Candidate> candidates;
    PromptFeedback prompt_feedback;
};

void to_json(json& j, const RequestPart& p);
void to_json(json& j, const RequestContent& c);
void to_json(json& j, const SafetySetting& s);
void from_json(const json& j, SafetySetting& s);
void to_json(json& j, const GenerationConfig& g);
void to_json(json& j, const ChatRequest& r);

void to_json(json& j, const Part& p);
void from_json(const json& j, Part& p);
void to_json(json& j, const Content& c);
void from_json(const json& j, Content& c);
void to_json(json& j, const SafetyRating& r);
void from_json(const json& j, SafetyRating& r);
void to_json(json& j, const Candidate& c);
void from_json(const json& j, Candidate& c);
void to_json(json& j, const PromptFeedback& f);
void from_json(const json& j, PromptFeedback& f);
void to_json(json& j, const ChatResponse& r);
void from_json(const json& j, ChatResponse& r);

/// Decode a buffered generateContent body. Missing fields decode as empty;
/// malformed JSON or a shape that contradicts the schema is a DecodeFailure.
auto decode_response(std::string_view body) -> Result<ChatResponse>;

/// Serialize a request body as compact JSON.
auto encode_request(const ChatRequest& request) -> Result<std::string>;

} // namespace chatrelay::protocol::gemini
