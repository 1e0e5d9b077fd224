#include "generation/GenerationClient.hpp"
#include <iostream>

namespace geminiai {
namespace generation {

GenerationClient::GenerationClient(const Client& client, const std::string& model)
    : client_(client), model_(model) {}

nlohmann::json GenerationClient::buildRequestBody(const std::string& prompt,
                                                  const std::vector<files::FileDescriptor>& files) {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& file : files) {
        parts.push_back({
            {"file_data", {
                {"mime_type", file.mimeType},
                {"file_uri", file.uri}
            }}
        });
    }
    parts.push_back({{"text", prompt}});

    return {
        {"contents", nlohmann::json::array({
            {{"parts", parts}}
        })}
    };
}

Result<GenerateResponse> GenerationClient::generateContent(const std::string& prompt,
                                                           const std::vector<files::FileDescriptor>& files) {
    return catchErrors<GenerateResponse>("Generating content with " + model_, [&] {
        if (model_.empty()) {
            throw ClientException(ErrorKind::InvalidArgument, "Model name must not be empty");
        }
        if (prompt.empty()) {
            throw ClientException(ErrorKind::InvalidArgument, "Prompt must not be empty");
        }
        for (const auto& file : files) {
            if (file.uri.empty()) {
                throw ClientException(ErrorKind::InvalidArgument,
                                      "File " + file.name + " has no URI to reference");
            }
        }

        http::Request request;
        request.method = HttpRequest::POST;
        request.url = client_.apiUrl("models/" + model_ + ":generateContent");
        client_.authorize(request);
        request.setJson(buildRequestBody(prompt, files));

        client_.debug("Calling " + request.url + " with " + std::to_string(files.size()) + " file(s)");
        http::Response response = client_.send(request);

        if (response.status != 200) {
            std::cerr << ("HTTP " + std::to_string(response.status) + ": " + response.body + "\n") << std::flush;
            throw ClientException(Error::remote(response.status, response.body));
        }

        nlohmann::json body;
        try {
            body = response.json();
        } catch (const nlohmann::json::parse_error& e) {
            throw ClientException(ErrorKind::MalformedResponse,
                                  std::string("Generation response is not JSON: ") + e.what());
        }
        return GenerateResponse::fromJson(body);
    });
}

Result<GenerateResponse> generateContent(const Client& client, const std::string& model,
                                         const std::string& prompt,
                                         const std::vector<files::FileDescriptor>& files) {
    GenerationClient generator(client, model);
    return generator.generateContent(prompt, files);
}

} // namespace generation
} // namespace geminiai
