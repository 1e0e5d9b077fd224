#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/Client.hpp"
#include "core/Result.hpp"
#include "files/FileDescriptor.hpp"
#include "files/UploadOptions.hpp"

namespace geminiai {
namespace files {

/**
 * Uploads several files at once, one worker thread per path.
 *
 * The result keeps input order. The first failure (error or exception inside
 * a session) ends the wait and is returned alone; results of finished siblings
 * are dropped. Siblings still in flight are NOT cancelled: they run to
 * completion in the background, holding their own copy of the client.
 * There is no cap on simultaneous uploads; callers that need one should
 * split the batch.
 */
class BatchUploader {
public:
    BatchUploader(const Client& client, UploadOptions options);

    Result<std::vector<FileDescriptor>> run(const std::vector<std::string>& paths);

private:
    // Shared between the coordinator and the workers; outlives an early return
    struct State {
        explicit State(size_t count) : slots(count) {}

        std::mutex mutex;
        std::condition_variable changed;
        std::vector<std::optional<FileDescriptor>> slots;  // index == input position
        size_t filled = 0;
        std::optional<Error> firstError;
    };

    static void work(std::shared_ptr<State> state, Client client, UploadOptions options,
                     std::string path, size_t index);

    static void complete(State& state, size_t index, FileDescriptor file);
    static void fail(State& state, Error error);

    Client client_;
    UploadOptions options_;
};

} // namespace files
} // namespace geminiai
