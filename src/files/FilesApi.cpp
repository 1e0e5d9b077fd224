#include "files/FilesApi.hpp"
#include "files/BatchUploader.hpp"
#include "files/UploadSession.hpp"
#include <iostream>

namespace geminiai {
namespace files {

namespace {
    std::string resourceName(const std::string& name) {
        if (name.empty()) {
            throw ClientException(ErrorKind::InvalidArgument, "File name must not be empty");
        }
        return name.find('/') == std::string::npos ? "files/" + name : name;
    }

    // Logs and raises the RemoteError for any non-200 response
    void expectOk(const http::Response& response) {
        if (response.status != 200) {
            std::cerr << ("HTTP " + std::to_string(response.status) + ": " + response.body + "\n") << std::flush;
            throw ClientException(Error::remote(response.status, response.body));
        }
    }

    nlohmann::json parseBody(const http::Response& response) {
        try {
            return response.json();
        } catch (const nlohmann::json::parse_error& e) {
            throw ClientException(ErrorKind::MalformedResponse,
                                  std::string("Response is not JSON: ") + e.what());
        }
    }
}

Result<FileDescriptor> uploadFile(const Client& client, const std::string& path,
                                  const UploadOptions& options) {
    return catchErrors<FileDescriptor>("Upload of " + path, [&] {
        UploadSession session(client, UploadRequest::resolve(path, options));
        return session.run();
    });
}

Result<std::vector<FileDescriptor>> uploadFiles(const Client& client,
                                                const std::vector<std::string>& paths,
                                                const UploadOptions& options) {
    BatchUploader uploader(client, options);
    return uploader.run(paths);
}

Result<FileList> listFiles(const Client& client, const ListOptions& options) {
    return catchErrors<FileList>("Listing files", [&] {
        if (options.pageSize && *options.pageSize <= 0) {
            throw ClientException(ErrorKind::InvalidArgument, "page_size must be positive");
        }

        http::Request request;
        request.method = HttpRequest::GET;
        request.url = client.apiUrl("files");
        client.authorize(request);
        if (options.pageSize) {
            request.addQuery("pageSize", std::to_string(*options.pageSize));
        }
        if (options.pageToken) {
            request.addQuery("pageToken", *options.pageToken);
        }

        http::Response response = client.send(request);
        expectOk(response);
        nlohmann::json body = parseBody(response);
        if (!body.is_object()) {
            throw ClientException(ErrorKind::MalformedResponse, "File listing must be a JSON object");
        }

        FileList list;
        if (body.contains("files")) {
            if (!body["files"].is_array()) {
                throw ClientException(ErrorKind::MalformedResponse, "'files' must be an array");
            }
            for (const auto& item : body["files"]) {
                list.files.push_back(FileDescriptor::fromJson(item));
            }
        }
        if (body.contains("nextPageToken") && body["nextPageToken"].is_string()) {
            list.nextPageToken = body["nextPageToken"].get<std::string>();
        }

        client.debug("Listed " + std::to_string(list.files.size()) + " files");
        return list;
    });
}

Result<FileDescriptor> getFile(const Client& client, const std::string& name) {
    return catchErrors<FileDescriptor>("Fetching " + name, [&] {
        http::Request request;
        request.method = HttpRequest::GET;
        request.url = client.apiUrl(resourceName(name));
        client.authorize(request);

        http::Response response = client.send(request);
        expectOk(response);
        return FileDescriptor::fromJson(parseBody(response));
    });
}

Result<void> deleteFile(const Client& client, const std::string& name) {
    return catchErrors<void>("Deleting " + name, [&] {
        http::Request request;
        request.method = HttpRequest::DELETE;
        request.url = client.apiUrl(resourceName(name));
        client.authorize(request);

        http::Response response = client.send(request);
        expectOk(response);
        client.debug("Deleted " + resourceName(name));
    });
}

} // namespace files
} // namespace geminiai
