#include "files/BatchUploader.hpp"
#include "files/UploadSession.hpp"
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

namespace geminiai {
namespace files {

BatchUploader::BatchUploader(const Client& client, UploadOptions options)
    : client_(client), options_(std::move(options)) {}

Result<std::vector<FileDescriptor>> BatchUploader::run(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return Result<std::vector<FileDescriptor>>::success({});
    }

    // Same options for every path: reject them once instead of N times
    try {
        options_.validate();
    } catch (const ClientException& e) {
        return Result<std::vector<FileDescriptor>>::failure(e.error());
    }

    auto state = std::make_shared<State>(paths.size());
    client_.debug("Uploading " + std::to_string(paths.size()) + " files concurrently");

    for (size_t i = 0; i < paths.size(); ++i) {
        try {
            std::thread(&BatchUploader::work, state, client_, options_, paths[i], i).detach();
        } catch (const std::system_error& e) {
            std::cerr << "Failed to start upload worker for " << paths[i] << ": " << e.what() << std::endl;
            fail(*state, Error{ErrorKind::InternalError,
                               "Could not start upload worker for " + paths[i] + ": " + e.what(), 0, ""});
            break;
        }
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->changed.wait(lock, [&state] {
        return state->firstError.has_value() || state->filled == state->slots.size();
    });

    if (state->firstError) {
        client_.debug("Batch upload stopped: " + state->firstError->describe());
        return Result<std::vector<FileDescriptor>>::failure(*state->firstError);
    }

    std::vector<FileDescriptor> files;
    files.reserve(state->slots.size());
    for (auto& slot : state->slots) {
        files.push_back(std::move(*slot));
    }
    return Result<std::vector<FileDescriptor>>::success(std::move(files));
}

void BatchUploader::work(std::shared_ptr<State> state, Client client, UploadOptions options,
                         std::string path, size_t index) {
    // Nothing may escape a detached thread
    try {
        UploadSession session(client, UploadRequest::resolve(path, options));
        complete(*state, index, session.run());
    } catch (const ClientException& e) {
        fail(*state, e.error());
    } catch (const std::exception& e) {
        fail(*state, Error{ErrorKind::InternalError,
                           "Upload of " + path + " terminated abnormally: " + e.what(), 0, ""});
    } catch (...) {
        fail(*state, Error{ErrorKind::InternalError,
                           "Upload of " + path + " terminated abnormally", 0, ""});
    }
}

void BatchUploader::complete(State& state, size_t index, FileDescriptor file) {
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.slots[index]) {
            state.slots[index] = std::move(file);
            ++state.filled;
        }
    }
    state.changed.notify_all();
}

void BatchUploader::fail(State& state, Error error) {
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.firstError) {
            state.firstError = std::move(error);
        }
    }
    state.changed.notify_all();
}

} // namespace files
} // namespace geminiai
