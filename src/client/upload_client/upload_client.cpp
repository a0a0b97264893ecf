#include "upload_client.hpp"
#include "common/errors/errors.hpp"
#include "common/load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace upload_client
{
    namespace
    {
        std::string baseName(const std::string &path)
        {
            return fs::path(path).filename().string();
        }

        bool isSuccess(long status)
        {
            return status >= 200 && status < 300;
        }
    }

    ClientOptions loadOptions(const nlohmann::json &config)
    {
        ClientOptions options;

        auto db_name = ConfigReader::get_config_string("db_name", config, "chunkcp");
        auto db_dir = ConfigReader::get_config_string("db_dir", config, "");
        options.dbPath = db_dir.empty() ? chunk_store::ChunkStore::defaultPath(db_name)
                                        : (fs::path(db_dir) / db_name).string();

        int chunk_size = ConfigReader::get_config_value("chunk_size", config, static_cast<int>(DEFAULT_CHUNK_SIZE));
        if (chunk_size <= 0)
        {
            throw std::invalid_argument("chunk_size must be positive");
        }
        options.chunkSize = static_cast<std::size_t>(chunk_size);

        options.retry.maxRetries = ConfigReader::get_config_value("max_retries", config, 3);
        options.retry.initialDelay = retry::Seconds(ConfigReader::get_config_double("initial_retry_delay", config, 1.0));
        options.retry.maxDelay = retry::Seconds(ConfigReader::get_config_double("max_retry_delay", config, 0.0));
        options.statusTimeout = std::chrono::seconds(ConfigReader::get_config_value("status_timeout_seconds", config, 5));
        options.requestTimeout = std::chrono::seconds(ConfigReader::get_config_value("request_timeout_seconds", config, 30));
        options.apiKey = resolveApiKey(ConfigReader::get_config_string("api_key", config, ""));
        return options;
    }

    std::string resolveApiKey(const std::string &configured)
    {
        if (!configured.empty())
        {
            return configured;
        }
        const char *env_key = std::getenv(API_KEY_ENV.c_str());
        if (env_key != nullptr)
        {
            MyLogger::debug("Using API key from " + API_KEY_ENV);
            return env_key;
        }
        return "";
    }

    UploadClient::UploadClient(ClientOptions options,
                               std::shared_ptr<transport::HttpTransport> transport,
                               std::shared_ptr<chunk_store::ChunkStore> store,
                               retry::RetryController::Sleeper sleeper)
        : options_(std::move(options)),
          transport_(std::move(transport)),
          store_(std::move(store)),
          retry_(options_.retry, std::move(sleeper))
    {
        if (options_.chunkSize == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        if (!transport_ || !store_)
        {
            throw std::invalid_argument("UploadClient needs a transport and a chunk store");
        }
    }

    void UploadClient::requireApiKey() const
    {
        if (options_.apiKey.empty())
        {
            MyLogger::error("No API key configured (set api_key or " + API_KEY_ENV + ")");
            throw errors::AuthError("No API key configured");
        }
    }

    int UploadClient::addFile(const std::string &path)
    {
        if (!fs::exists(path))
        {
            throw errors::NotFoundError("File not found: " + path);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            throw errors::StorageError("Failed to open file: " + path);
        }

        int chunk_count = 0;
        std::string buffer(options_.chunkSize, '\0');
        while (file.read(&buffer[0], static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
        {
            chunk_store::BufferedChunk chunk;
            chunk.fileName = path;
            chunk.index = chunk_count;
            chunk.id = chunk_store::makeChunkId(path, chunk_count);
            chunk.data.assign(buffer.data(), static_cast<std::size_t>(file.gcount()));
            store_->put(chunk);
            ++chunk_count;
        }

        MyLogger::info("File " + path + " added to buffer with " + std::to_string(chunk_count) + " chunks");
        return chunk_count;
    }

    protocol::DeliverResponse UploadClient::uploadChunk(const std::string &url, const std::string &data,
                                                        int index, const std::string &fileName)
    {
        transport::Headers headers = {
            {protocol::HEADER_CONTENT_TYPE, protocol::CONTENT_TYPE_OCTET},
            {protocol::HEADER_CHUNK_INDEX, std::to_string(index)},
            {protocol::HEADER_FILE_NAME, fileName},
            {protocol::HEADER_AUTHORIZATION, protocol::bearer(options_.apiKey)}};

        auto res = transport_->post(url, headers, data, options_.requestTimeout);

        if (res.status == 401)
        {
            MyLogger::error("Authentication failed uploading chunk " + std::to_string(index) + " of " + fileName);
            throw errors::AuthError("Authentication failed: Invalid API key");
        }
        if (!isSuccess(res.status))
        {
            std::string msg = "Failed to upload chunk " + std::to_string(index) + " for file '" + fileName +
                              "': HTTP " + std::to_string(res.status) + " " + res.body;
            MyLogger::warning(msg);
            throw errors::TransportError(msg, static_cast<int>(res.status));
        }

        auto response = protocol::parseDeliverResponse(res.contentType, res.body);
        auto actual = protocol::actualFilenameOf(response);
        if (actual && *actual != fileName && *actual != baseName(fileName))
        {
            MyLogger::info("Server used filename: " + *actual + " (client sent: " + fileName + ")");
        }
        return response;
    }

    protocol::DeliverResponse UploadClient::deliverWithRetry(const std::string &url, const std::string &data,
                                                             int index, const std::string &fileName)
    {
        return retry_.attempt([&]
                              { return uploadChunk(url, data, index, fileName); },
                              "chunk " + std::to_string(index) + " of " + fileName);
    }

    std::set<int> UploadClient::getReceivedChunks(const std::string &url, const std::string &filename)
    {
        try
        {
            transport::Headers headers = {
                {protocol::HEADER_AUTHORIZATION, protocol::bearer(options_.apiKey)}};
            auto res = transport_->get(protocol::statusUrl(url, filename), headers, options_.statusTimeout);
            if (!isSuccess(res.status))
            {
                MyLogger::warning("Could not check upload status (proceeding with full upload): HTTP " +
                                  std::to_string(res.status));
                return {};
            }
            return protocol::parseStatusResponse(res.body).receivedChunks;
        }
        catch (const std::exception &e)
        {
            MyLogger::warning("Could not check upload status (proceeding with full upload): " + std::string(e.what()));
            return {};
        }
    }

    UploadMapping UploadClient::uploadFile(const std::string &path, const std::string &url)
    {
        if (!fs::exists(path) || !fs::is_regular_file(path))
        {
            throw errors::NotFoundError("File not found: " + path);
        }
        requireApiKey();

        const std::uint64_t file_size = fs::file_size(path);
        const std::uint64_t chunk_size = options_.chunkSize;
        const std::uint64_t total_chunks = (file_size + chunk_size - 1) / chunk_size;

        std::string server_filename = baseName(path);
        auto received = getReceivedChunks(url, server_filename);
        if (!received.empty())
        {
            MyLogger::info("Resume detected: " + std::to_string(received.size()) + " chunks already received");
        }

        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            throw errors::StorageError("Failed to open file: " + path);
        }

        std::string buffer;
        for (std::uint64_t i = 0; i < total_chunks; ++i)
        {
            const int index = static_cast<int>(i);
            if (received.count(index))
            {
                MyLogger::info("Skipping chunk " + std::to_string(index) + " (already received)");
                store_->remove(chunk_store::makeChunkId(path, index));
                continue;
            }

            const std::uint64_t offset = i * chunk_size;
            const std::uint64_t length = std::min(chunk_size, file_size - offset);
            buffer.assign(length, '\0');
            file.seekg(static_cast<std::streamoff>(offset));
            file.read(&buffer[0], static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(file.gcount()) != length)
            {
                throw errors::StorageError("Short read on " + path + " at chunk " + std::to_string(index));
            }

            MyLogger::info("Uploading chunk " + std::to_string(index) + "/" + std::to_string(total_chunks) +
                           " for " + path);
            auto response = deliverWithRetry(url, buffer, index, path);
            if (auto actual = protocol::actualFilenameOf(response))
            {
                server_filename = *actual;
            }
            store_->remove(chunk_store::makeChunkId(path, index));
        }

        MyLogger::info("Upload complete for " + path + " -> " + server_filename);
        return {{path, server_filename}};
    }

    std::string UploadClient::uploadStagedFile(const std::string &url, const std::string &fileName,
                                               const std::vector<chunk_store::BufferedChunk> &chunks)
    {
        std::string server_filename = baseName(fileName);

        auto received = getReceivedChunks(url, server_filename);
        if (!received.empty())
        {
            MyLogger::info("Resume detected: " + std::to_string(received.size()) + " chunks already received");
        }

        for (const auto &chunk : chunks)
        {
            if (received.count(chunk.index))
            {
                MyLogger::info("Skipping chunk " + std::to_string(chunk.index) + " (already received)");
                store_->remove(chunk.id);
                continue;
            }

            MyLogger::info("Uploading chunk " + std::to_string(chunk.index) + " for " + fileName);
            auto response = deliverWithRetry(url, chunk.data, chunk.index, fileName);
            if (auto actual = protocol::actualFilenameOf(response))
            {
                server_filename = *actual;
            }
            store_->remove(chunk.id);
        }

        if (server_filename != baseName(fileName))
        {
            MyLogger::info("Upload complete for " + fileName + " -> Server saved as: " + server_filename);
        }
        else
        {
            MyLogger::info("Upload complete for " + fileName);
        }
        return server_filename;
    }

    UploadReport UploadClient::uploadBufferedFiles(const std::string &url)
    {
        requireApiKey();

        UploadReport report;
        auto records = store_->listAll();
        MyLogger::info("Found " + std::to_string(records.size()) + " buffered chunks");
        if (records.empty())
        {
            MyLogger::info("No buffered files to upload");
            return report;
        }

        // listAll is ordered by file then index, so each group is already sorted
        std::map<std::string, std::vector<chunk_store::BufferedChunk>> groups;
        for (auto &record : records)
        {
            groups[record.fileName].push_back(std::move(record));
        }
        MyLogger::info("Grouped into " + std::to_string(groups.size()) + " files");

        for (const auto &[file_name, chunks] : groups)
        {
            MyLogger::info("Uploading " + file_name + " with " + std::to_string(chunks.size()) + " chunks...");
            try
            {
                report.uploaded[file_name] = uploadStagedFile(url, file_name, chunks);
            }
            catch (const errors::AuthError &)
            {
                throw;
            }
            catch (const errors::TransferError &e)
            {
                MyLogger::error("Upload failed for " + file_name + ": " + e.what());
                report.failed[file_name] = e.what();
            }
        }
        return report;
    }

    std::vector<std::string> UploadClient::getBufferedFiles() const
    {
        auto names = store_->listDistinctFileNames();
        return std::vector<std::string>(names.begin(), names.end());
    }

    void UploadClient::clearBuffer()
    {
        store_->clear();
    }
}
