#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "files/BatchUploader.hpp"
#include "files/FilesApi.hpp"
#include "support/FakeTransport.hpp"
#include "support/TempDir.hpp"

namespace geminiai {
namespace files {
namespace test {

using namespace std::chrono_literals;
using geminiai::testing::FakeTransport;
using geminiai::testing::FakeUploadBackend;
using geminiai::testing::TempDir;

class BatchUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<FakeUploadBackend>();
        auto backend = backend_;
        transport_ = std::make_shared<FakeTransport>(
            [backend](const http::Request& request) { return backend->handle(request); });

        ClientConfig config;
        config.apiKey = "test-key";
        client_ = std::make_unique<Client>(config, transport_);
    }

    void TearDown() override {
        backend_->release();  // a failed assertion may have left a transfer parked
        EXPECT_TRUE(waitForWorkers()) << "upload workers still running";
    }

    // Each worker holds a Client copy, and with it the transport, until it returns
    bool waitForWorkers(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (transport_.use_count() > 2) {  // fixture + client_
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

    std::shared_ptr<FakeUploadBackend> backend_;
    std::shared_ptr<FakeTransport> transport_;
    std::unique_ptr<Client> client_;
    TempDir dir_;
};

TEST_F(BatchUploaderTest, EmptyBatchSucceedsWithoutRequests) {
    auto result = uploadFiles(*client_, {});

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(BatchUploaderTest, KeepsInputOrderRegardlessOfCompletionOrder) {
    // First file finishes last, last file finishes first
    std::vector<std::string> paths = {
        dir_.write("first.pdf", std::string(10, 'a')),
        dir_.write("second.png", std::string(20, 'b')),
        dir_.write("third.txt", std::string(30, 'c')),
    };
    backend_->delay("first.pdf", 300ms);
    backend_->delay("second.png", 150ms);

    auto result = uploadFiles(*client_, paths);
    ASSERT_TRUE(result.ok()) << result.error().describe();

    const auto& files = result.value();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].displayName, "first.pdf");
    EXPECT_EQ(files[0].sizeBytes, 10u);
    EXPECT_EQ(files[0].mimeType, "application/pdf");
    EXPECT_EQ(files[1].displayName, "second.png");
    EXPECT_EQ(files[1].sizeBytes, 20u);
    EXPECT_EQ(files[2].displayName, "third.txt");
    EXPECT_EQ(files[2].sizeBytes, 30u);

    EXPECT_EQ(transport_->requests().size(), 6u);
}

TEST_F(BatchUploaderTest, UploadsRunConcurrently) {
    std::vector<std::string> paths;
    for (int i = 0; i < 4; ++i) {
        std::string name = "file" + std::to_string(i) + ".txt";
        paths.push_back(dir_.write(name, "data"));
        backend_->delay(name, 400ms);
    }

    auto started = std::chrono::steady_clock::now();
    auto result = uploadFiles(*client_, paths);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result.value().size(), 4u);
    // Sequential uploads would need at least 1600ms
    EXPECT_LT(elapsed, 1200ms);
}

TEST_F(BatchUploaderTest, SingleElementMatchesDirectUpload) {
    std::string path = dir_.write("solo.pdf", "12345678");

    auto batch = uploadFiles(*client_, {path});
    ASSERT_TRUE(batch.ok());
    ASSERT_EQ(batch.value().size(), 1u);

    auto direct = uploadFile(*client_, path);
    ASSERT_TRUE(direct.ok());
    EXPECT_EQ(batch.value()[0].to_json(), direct.value().to_json());
}

TEST_F(BatchUploaderTest, MissingFileFailsWholeBatch) {
    std::vector<std::string> paths = {
        dir_.write("a.pdf", "content"),
        dir_.path("missing.pdf"),
    };

    auto result = uploadFiles(*client_, paths);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::LocalIOError);
    EXPECT_NE(result.error().message.find("missing.pdf"), std::string::npos);
}

TEST_F(BatchUploaderTest, ReturnsFirstErrorWithoutWaitingForSiblings) {
    std::vector<std::string> paths = {
        dir_.write("slow.pdf", "still uploading"),
        dir_.path("gone.pdf"),
    };
    backend_->hold("slow.pdf");

    auto result = uploadFiles(*client_, paths);

    // slow.pdf is parked inside the backend, so only the failure can have ended the wait
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::LocalIOError);
    EXPECT_FALSE(backend_->waitForTransfers(1, 50ms));

    // The sibling was not cancelled and completes once released
    backend_->release();
    EXPECT_TRUE(backend_->waitForTransfers(1));
    EXPECT_TRUE(waitForWorkers());
    EXPECT_EQ(transport_->requests().size(), 2u);
}

TEST_F(BatchUploaderTest, RemoteFailureOfOneFileFailsBatch) {
    backend_->finalizeStatus = 503;
    std::vector<std::string> paths = {
        dir_.write("x.txt", "1"),
        dir_.write("y.txt", "2"),
    };

    auto result = uploadFiles(*client_, paths);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::RemoteError);
    EXPECT_EQ(result.error().status, 503);
}

TEST_F(BatchUploaderTest, CrashInsideSessionIsReported) {
    std::vector<std::string> paths = {
        dir_.write("ok.txt", "fine"),
        dir_.write("boom.txt", "explodes"),
    };
    backend_->crash("boom.txt");

    auto result = uploadFiles(*client_, paths);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InternalError);
    EXPECT_NE(result.error().message.find("boom.txt"), std::string::npos);
}

TEST_F(BatchUploaderTest, DroppedConnectionIsTransportError) {
    std::vector<std::string> paths = {
        dir_.write("kept.txt", "fine"),
        dir_.write("dropped.txt", "lost"),
    };
    backend_->disconnect("dropped.txt");

    auto result = uploadFiles(*client_, paths);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportError);
    EXPECT_NE(result.error().message.find("Connection reset"), std::string::npos);
}

TEST_F(BatchUploaderTest, InvalidOptionsRejectedBeforeLaunch) {
    UploadOptions options;
    options.displayName = "";

    auto result = uploadFiles(*client_, {dir_.write("a.txt", "1")}, options);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(BatchUploaderTest, SharedMimeTypeAppliesToEveryFile) {
    UploadOptions options;
    options.mimeType = "text/plain";

    BatchUploader uploader(*client_, options);
    auto result = uploader.run({dir_.write("one.dat", "1"), dir_.write("two.dat", "22")});

    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result.value()[0].mimeType, "text/plain");
    EXPECT_EQ(result.value()[1].mimeType, "text/plain");
    EXPECT_EQ(result.value()[1].sizeBytes, 2u);
}

} // namespace test
} // namespace files
} // namespace geminiai
