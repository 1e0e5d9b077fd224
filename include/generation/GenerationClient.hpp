#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/Client.hpp"
#include "core/Result.hpp"
#include "files/FileDescriptor.hpp"
#include "generation/GenerateResponse.hpp"

namespace geminiai {
namespace generation {

class GenerationClient {
public:
    explicit GenerationClient(const Client& client,
                              const std::string& model = "gemini-1.5-flash-latest");

    // Prompt plus previously uploaded files, referenced by URI (files go first)
    Result<GenerateResponse> generateContent(const std::string& prompt,
                                             const std::vector<files::FileDescriptor>& files = {});

    // Set model name (default: gemini-1.5-flash-latest)
    void setModel(const std::string& model) { model_ = model; }
    const std::string& model() const { return model_; }

    // {"contents": [{"parts": [{"file_data": ...}, ..., {"text": prompt}]}]}
    static nlohmann::json buildRequestBody(const std::string& prompt,
                                           const std::vector<files::FileDescriptor>& files);

private:
    const Client& client_;
    std::string model_;
};

Result<GenerateResponse> generateContent(const Client& client, const std::string& model,
                                         const std::string& prompt,
                                         const std::vector<files::FileDescriptor>& files = {});

} // namespace generation
} // namespace geminiai
