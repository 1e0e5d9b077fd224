#include <gtest/gtest.h>
#include "files/FilesApi.hpp"
#include "generation/GenerationClient.hpp"
#include "http/CurlTransport.hpp"
#include "support/FakeFileService.hpp"
#include "support/TempDir.hpp"

namespace geminiai {
namespace test {

using geminiai::testing::FakeFileService;
using geminiai::testing::TempDir;

// Drives libcurl against a loopback server speaking the Files protocol
class CurlTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_.start();

        ClientConfig config;
        config.apiKey = FakeFileService::kApiKey;
        config.baseUrl = service_.root() + "/v1beta";
        config.uploadBaseUrl = service_.root() + "/upload";
        config.timeoutSeconds = 10;
        client_ = std::make_unique<Client>(config);
    }

    void TearDown() override {
        service_.stop();
    }

    FakeFileService service_;
    std::unique_ptr<Client> client_;
    TempDir dir_;
};

TEST_F(CurlTransportTest, RoundTripsRawRequest) {
    http::CurlTransport transport(10);

    http::Request request;
    request.method = HttpRequest::GET;
    request.url = service_.root() + "/v1beta/files";
    request.addQuery("key", FakeFileService::kApiKey).addQuery("pageToken", "a b&c");

    http::Response response = transport.send(request);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("content-type"), std::vector<std::string>{"application/json"});
    EXPECT_TRUE(response.json().contains("files"));

    auto recorded = service_.requests();
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].query.at("pageToken"), "a b&c");
}

TEST_F(CurlTransportTest, UploadsThroughResumableProtocol) {
    std::string content = "The quick brown fox jumps over the lazy dog";
    std::string path = dir_.write("fox.txt", content);

    auto result = files::uploadFile(*client_, path);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result.value().displayName, "fox.txt");
    EXPECT_EQ(result.value().mimeType, "text/plain");
    EXPECT_EQ(result.value().sizeBytes, content.size());
    EXPECT_EQ(result.value().uri, service_.root() + "/v1beta/" + result.value().name);

    auto recorded = service_.requests();
    ASSERT_EQ(recorded.size(), 2u);
    EXPECT_EQ(recorded[0].path, "/upload/v1beta/files");
    EXPECT_EQ(recorded[0].query.at("key"), FakeFileService::kApiKey);
    EXPECT_EQ(recorded[1].path, "/upload/session/s1");
    EXPECT_EQ(recorded[1].query.count("key"), 0u);
    EXPECT_EQ(recorded[1].body, content);
    EXPECT_TRUE(recorded[1].header("Content-Type").empty());
}

TEST_F(CurlTransportTest, UploadsBinaryContentUnchanged) {
    std::string content;
    for (int i = 0; i < 70000; ++i) {
        content += static_cast<char>(i % 256);
    }
    std::string path = dir_.write("blob.bin", content);

    auto result = files::uploadFile(*client_, path);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result.value().sizeBytes, content.size());
    EXPECT_EQ(result.value().mimeType, "application/octet-stream");
    EXPECT_EQ(service_.requests().at(1).body, content);
}

TEST_F(CurlTransportTest, BatchUploadListGetDelete) {
    std::vector<std::string> paths = {
        dir_.write("one.pdf", "1"),
        dir_.write("two.png", "22"),
        dir_.write("three.ogg", "333"),
    };

    auto uploaded = files::uploadFiles(*client_, paths);
    ASSERT_TRUE(uploaded.ok()) << uploaded.error().describe();
    ASSERT_EQ(uploaded.value().size(), 3u);
    EXPECT_EQ(uploaded.value()[0].displayName, "one.pdf");
    EXPECT_EQ(uploaded.value()[1].displayName, "two.png");
    EXPECT_EQ(uploaded.value()[2].mimeType, "audio/ogg");
    EXPECT_EQ(uploaded.value()[2].sizeBytes, 3u);

    files::ListOptions options;
    options.pageSize = 2;
    auto page = files::listFiles(*client_, options);
    ASSERT_TRUE(page.ok()) << page.error().describe();
    EXPECT_EQ(page.value().files.size(), 2u);
    EXPECT_FALSE(page.value().nextPageToken.empty());

    const std::string name = uploaded.value()[1].name;
    auto fetched = files::getFile(*client_, name);
    ASSERT_TRUE(fetched.ok()) << fetched.error().describe();
    EXPECT_EQ(fetched.value().displayName, "two.png");

    ASSERT_TRUE(files::deleteFile(*client_, name).ok());
    auto gone = files::getFile(*client_, name);
    ASSERT_FALSE(gone.ok());
    EXPECT_EQ(gone.error().kind, ErrorKind::RemoteError);
    EXPECT_EQ(gone.error().status, 404);
}

TEST_F(CurlTransportTest, GeneratesFromUploadedFile) {
    auto uploaded = files::uploadFile(*client_, dir_.write("song.ogg", "OggS"));
    ASSERT_TRUE(uploaded.ok()) << uploaded.error().describe();

    auto response = generation::generateContent(*client_, "gemini-1.5-flash", "Describe this clip",
                                                {uploaded.value()});
    ASSERT_TRUE(response.ok()) << response.error().describe();
    EXPECT_EQ(response.value().text(), "gemini-1.5-flash saw 2 parts");
    EXPECT_EQ(response.value().candidates.at(0).finishReason, "STOP");
    ASSERT_TRUE(response.value().usageMetadata.has_value());
    EXPECT_EQ(response.value().usageMetadata->totalTokenCount, 12);
}

TEST_F(CurlTransportTest, DuplicateUploadUrlStopsBeforeTransfer) {
    service_.setUploadUrlHeaders(2);

    auto result = files::uploadFile(*client_, dir_.write("dup.txt", "x"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::ProtocolViolation);
    EXPECT_EQ(service_.requests().size(), 1u);
}

TEST_F(CurlTransportTest, WrongKeyIsRemoteError) {
    ClientConfig config = client_->config();
    config.apiKey = "wrong";
    Client client(config);

    auto result = files::uploadFile(client, dir_.write("a.txt", "x"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::RemoteError);
    EXPECT_EQ(result.error().status, 403);
    EXPECT_NE(result.error().body.find("API key not valid"), std::string::npos);
}

TEST_F(CurlTransportTest, ClosedPortIsTransportError) {
    ClientConfig config = client_->config();
    config.timeoutSeconds = 2;
    config.baseUrl = "http://127.0.0.1:1/v1beta";  // nothing listens on port 1
    Client client(config);

    auto result = files::listFiles(client);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::TransportError);
    EXPECT_NE(result.error().message.find("CURL error"), std::string::npos);
}

} // namespace test
} // namespace geminiai
