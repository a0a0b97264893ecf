#ifndef UPLOAD_CLIENT_HPP
#define UPLOAD_CLIENT_HPP

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "client/chunk_store/chunk_store.hpp"
#include "client/retry/retry_controller.hpp"
#include "client/transport/http_transport.hpp"
#include "common/protocol/protocol.hpp"

namespace upload_client
{
    inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
    inline const std::string API_KEY_ENV = "CHUNKCP_API_KEY";

    struct ClientOptions
    {
        std::string dbPath;
        std::size_t chunkSize = DEFAULT_CHUNK_SIZE;
        retry::RetryPolicy retry;
        std::chrono::seconds statusTimeout{5};
        std::chrono::seconds requestTimeout{30};
        std::string apiKey;
    };

    // Reads the client section of a config file. The API key falls back to
    // the CHUNKCP_API_KEY environment variable.
    ClientOptions loadOptions(const nlohmann::json &config);

    // Configured value first, then the environment; empty when neither is set.
    std::string resolveApiKey(const std::string &configured);

    // Source path -> filename the receiver actually wrote to.
    using UploadMapping = std::map<std::string, std::string>;

    struct UploadReport
    {
        UploadMapping uploaded;
        std::map<std::string, std::string> failed; // source path -> error
    };

    class UploadClient
    {
    public:
        UploadClient(ClientOptions options,
                     std::shared_ptr<transport::HttpTransport> transport,
                     std::shared_ptr<chunk_store::ChunkStore> store,
                     retry::RetryController::Sleeper sleeper = nullptr);

        // Splits the file into the chunk store; returns the number of chunks.
        int addFile(const std::string &path);

        // Reads the file directly, resuming from whatever the receiver already holds.
        UploadMapping uploadFile(const std::string &path, const std::string &url);

        // Uploads every staged file; a failure on one file does not stop the rest,
        // except errors::AuthError which aborts the run.
        UploadReport uploadBufferedFiles(const std::string &url);

        // One delivery attempt, no retry.
        protocol::DeliverResponse uploadChunk(const std::string &url, const std::string &data,
                                              int index, const std::string &fileName);

        // Best effort: empty on any failure.
        std::set<int> getReceivedChunks(const std::string &url, const std::string &filename);

        std::vector<std::string> getBufferedFiles() const;
        void clearBuffer();

        const ClientOptions &options() const { return options_; }

    private:
        protocol::DeliverResponse deliverWithRetry(const std::string &url, const std::string &data,
                                                   int index, const std::string &fileName);
        std::string uploadStagedFile(const std::string &url, const std::string &fileName,
                                     const std::vector<chunk_store::BufferedChunk> &chunks);
        void requireApiKey() const;

        ClientOptions options_;
        std::shared_ptr<transport::HttpTransport> transport_;
        std::shared_ptr<chunk_store::ChunkStore> store_;
        retry::RetryController retry_;
    };
}

#endif // UPLOAD_CLIENT_HPP
