#include "generation/GenerateResponse.hpp"
#include "core/Error.hpp"

namespace geminiai {
namespace generation {

namespace {
    // Treats a missing key and an explicit null the same way
    bool has(const nlohmann::json& j, const char* key) {
        return j.contains(key) && !j[key].is_null();
    }

    Part mapPart(const nlohmann::json& j) {
        Part part;
        if (has(j, "text")) {
            part.text = j["text"].get<std::string>();
        }
        if (has(j, "inlineData")) {
            part.inlineData = j["inlineData"];
        }
        return part;
    }

    Content mapContent(const nlohmann::json& j) {
        Content content;
        if (has(j, "parts")) {
            for (const auto& part : j["parts"]) {
                content.parts.push_back(mapPart(part));
            }
        }
        if (has(j, "role")) {
            content.role = j["role"].get<std::string>();
        }
        return content;
    }

    Candidate mapCandidate(const nlohmann::json& j) {
        Candidate candidate;
        // A candidate blocked by safety filters comes back without content
        if (has(j, "content")) {
            candidate.content = mapContent(j["content"]);
        }
        if (has(j, "finishReason")) {
            candidate.finishReason = j["finishReason"].get<std::string>();
        }
        if (has(j, "index")) {
            candidate.index = j["index"].get<int>();
        }
        if (has(j, "safetyRatings")) {
            for (const auto& rating : j["safetyRatings"]) {
                candidate.safetyRatings.push_back({rating.at("category").get<std::string>(),
                                                   rating.at("probability").get<std::string>()});
            }
        }
        return candidate;
    }

    UsageMetadata mapUsage(const nlohmann::json& j) {
        UsageMetadata usage;
        usage.promptTokenCount = j.value("promptTokenCount", 0);
        usage.candidatesTokenCount = j.value("candidatesTokenCount", 0);
        usage.totalTokenCount = j.value("totalTokenCount", 0);
        return usage;
    }
}

GenerateResponse GenerateResponse::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ClientException(ErrorKind::MalformedResponse, "Generation response must be a JSON object");
    }

    GenerateResponse response;
    try {
        if (has(j, "candidates")) {
            if (!j["candidates"].is_array()) {
                throw ClientException(ErrorKind::MalformedResponse, "'candidates' must be an array");
            }
            for (const auto& candidate : j["candidates"]) {
                response.candidates.push_back(mapCandidate(candidate));
            }
        }
        if (has(j, "usageMetadata")) {
            response.usageMetadata = mapUsage(j["usageMetadata"]);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ClientException(ErrorKind::MalformedResponse,
                              std::string("Unexpected generation response shape: ") + e.what());
    }
    return response;
}

std::string GenerateResponse::text() const {
    std::string result;
    if (candidates.empty()) {
        return result;
    }
    for (const auto& part : candidates.front().content.parts) {
        if (part.text) {
            result += *part.text;
        }
    }
    return result;
}

} // namespace generation
} // namespace geminiai
