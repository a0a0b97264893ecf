#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include "client/chunk_store/chunk_store.hpp"
#include "client/transport/http_transport.hpp"
#include "client/upload_client/upload_client.hpp"
#include "common/errors/errors.hpp"
#include "server/upload_receiver/upload_receiver.hpp"
#include "test_util.hpp"

using transport::Headers;
using transport::HttpResponse;

namespace
{
    const std::string kKey = "end-to-end-key";

    // Forwards to curl, counting deliveries and refusing any chunk at or above cutoff.
    class InterruptingTransport : public transport::HttpTransport
    {
    public:
        HttpResponse post(const std::string &url, const Headers &headers,
                          const std::string &body, std::chrono::seconds timeout) override
        {
            int index = -1;
            for (const auto &[key, value] : headers)
            {
                if (key == "X-Chunk-Index")
                    index = std::stoi(value);
            }
            if (cutoff >= 0 && index >= cutoff)
            {
                throw errors::TransportError("connection reset");
            }
            delivered.push_back(index);
            return curl.post(url, headers, body, timeout);
        }

        HttpResponse get(const std::string &url, const Headers &headers, std::chrono::seconds timeout) override
        {
            return curl.get(url, headers, timeout);
        }

        int cutoff = -1;
        std::vector<int> delivered;

    private:
        transport::CurlTransport curl;
    };
}

class EndToEndTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        startReceiver(false);

        options.dbPath = clientDir.file("db");
        options.chunkSize = 1000;
        options.retry.maxRetries = 1;
        options.apiKey = kKey;

        wire = std::make_shared<InterruptingTransport>();
        store = std::make_shared<chunk_store::ChunkStore>(options.dbPath);
        client = std::make_unique<upload_client::UploadClient>(options, wire, store, [](retry::Seconds) {});

        source = clientDir.file("report.bin");
        content = test_util::patternBytes(2500);
        test_util::writeFile(source, content);
    }

    void startReceiver(bool legacy)
    {
        receiver.reset();
        upload_receiver::ReceiverOptions receiverOptions;
        receiverOptions.host = "127.0.0.1";
        receiverOptions.port = 0;
        receiverOptions.outputDir = serverDir.str();
        receiverOptions.apiKey = kKey;
        receiverOptions.legacyTextResponses = legacy;
        receiver = std::make_unique<upload_receiver::UploadReceiver>(receiverOptions);
        receiver->start();
        receiver->waitUntilReady();
        url = "http://127.0.0.1:" + std::to_string(receiver->port()) + "/upload";
    }

    test_util::TempDir serverDir{"e2e_server"};
    test_util::TempDir clientDir{"e2e_client"};
    std::unique_ptr<upload_receiver::UploadReceiver> receiver;
    upload_client::ClientOptions options;
    std::shared_ptr<InterruptingTransport> wire;
    std::shared_ptr<chunk_store::ChunkStore> store;
    std::unique_ptr<upload_client::UploadClient> client;
    std::string url;
    std::string source;
    std::string content;
};

TEST_F(EndToEndTest, InterruptedTransferResumes)
{
    wire->cutoff = 2;
    EXPECT_THROW(client->uploadFile(source, url), errors::TransferExhausted);
    EXPECT_EQ(wire->delivered, (std::vector<int>{0, 1}));

    EXPECT_EQ(client->getReceivedChunks(url, "report.bin"), (std::set<int>{0, 1}));
    EXPECT_EQ(std::filesystem::file_size(serverDir.file("report.bin")), 2000u);

    wire->cutoff = -1;
    wire->delivered.clear();
    auto mapping = client->uploadFile(source, url);

    EXPECT_EQ(wire->delivered, (std::vector<int>{2}));
    EXPECT_EQ(mapping.at(source), "report.bin");
    EXPECT_EQ(test_util::readFile(serverDir.file("report.bin")), content);
}

TEST_F(EndToEndTest, CompletedTransferIsNotResent)
{
    client->uploadFile(source, url);
    wire->delivered.clear();

    client->uploadFile(source, url);
    EXPECT_TRUE(wire->delivered.empty());
    EXPECT_EQ(test_util::readFile(serverDir.file("report.bin")), content);
}

TEST_F(EndToEndTest, StagedFilesUploadThroughReceiver)
{
    std::string second = clientDir.file("notes.txt");
    test_util::writeFile(second, "short note");
    client->addFile(source);
    client->addFile(second);

    auto report = client->uploadBufferedFiles(url);

    EXPECT_TRUE(report.failed.empty());
    EXPECT_EQ(report.uploaded.at(source), "report.bin");
    EXPECT_EQ(report.uploaded.at(second), "notes.txt");
    EXPECT_EQ(test_util::readFile(serverDir.file("report.bin")), content);
    EXPECT_EQ(test_util::readFile(serverDir.file("notes.txt")), "short note");
    EXPECT_EQ(store->count(), 0u);
}

TEST_F(EndToEndTest, WrongKeyIsRejectedOnce)
{
    auto wrongKey = options;
    wrongKey.apiKey = "not-the-key";
    wrongKey.retry.maxRetries = 3;
    upload_client::UploadClient intruder(wrongKey, wire, store, [](retry::Seconds) {});

    EXPECT_THROW(intruder.uploadFile(source, url), errors::AuthError);
    EXPECT_EQ(wire->delivered.size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(serverDir.file("report.bin")));
}

TEST_F(EndToEndTest, WrongKeyIsRejectedBeforeLargeBody)
{
    auto wrongKey = options;
    wrongKey.apiKey = "not-the-key";
    wrongKey.chunkSize = 2 * 1024 * 1024;
    wrongKey.retry.maxRetries = 3;
    upload_client::UploadClient intruder(wrongKey, wire, store, [](retry::Seconds) {});

    std::string large = clientDir.file("large.bin");
    test_util::writeFile(large, test_util::patternBytes(3 * 1024 * 1024));

    EXPECT_THROW(intruder.uploadFile(large, url), errors::AuthError);
    EXPECT_EQ(wire->delivered, (std::vector<int>{0}));
    EXPECT_FALSE(std::filesystem::exists(serverDir.file("large.bin")));
}

TEST_F(EndToEndTest, LargeChunkWithWrongKeyGetsUnauthorized)
{
    transport::CurlTransport curl;
    auto res = curl.post(url,
                         {{"Authorization", "Bearer not-the-key"}, {"X-File-Name", "big.bin"}, {"X-Chunk-Index", "0"}},
                         test_util::patternBytes(4 * 1024 * 1024), std::chrono::seconds(30));
    EXPECT_EQ(res.status, 401);
    EXPECT_FALSE(std::filesystem::exists(serverDir.file("big.bin")));
}

TEST_F(EndToEndTest, LegacyReceiverStillWorks)
{
    startReceiver(true);

    auto mapping = client->uploadFile(source, url);
    EXPECT_EQ(mapping.at(source), "report.bin");
    EXPECT_EQ(test_util::readFile(serverDir.file("report.bin")), content);
}
