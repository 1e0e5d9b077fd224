#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace geminiai {
namespace generation {

struct Part {
    std::optional<std::string> text;
    nlohmann::json inlineData;  // null when absent; passed through untouched
};

struct Content {
    std::vector<Part> parts;
    std::string role = "model";
};

struct SafetyRating {
    std::string category;
    std::string probability;
};

struct Candidate {
    Content content;
    std::string finishReason = "UNSPECIFIED";
    int index = 0;
    std::vector<SafetyRating> safetyRatings;
};

struct UsageMetadata {
    int promptTokenCount = 0;
    int candidatesTokenCount = 0;
    int totalTokenCount = 0;
};

/**
 * generateContent response with the service's camelCase keys mapped to fields.
 * Absent fields take the defaults above; fields of the wrong type make
 * fromJson throw ClientException(MalformedResponse).
 */
struct GenerateResponse {
    std::vector<Candidate> candidates;
    std::optional<UsageMetadata> usageMetadata;

    static GenerateResponse fromJson(const nlohmann::json& j);

    // Concatenated text parts of the first candidate, empty if there is none
    std::string text() const;
};

} // namespace generation
} // namespace geminiai
